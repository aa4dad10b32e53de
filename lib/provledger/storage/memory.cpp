/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include "memory.hpp"

namespace provledger::storage::memory {
    struct db_t::impl {
        void clear()
        {
            _db.clear();
        }

        void erase(const std::string_view key)
        {
            if (const auto it = _db.find(key); it != _db.end())
                _db.erase(it);
        }

        void foreach(const observer_t &obs) const
        {
            for (const auto &[k, v]: _db) {
                obs(k, v);
            }
        }

        value_t get(const std::string_view k) const
        {
            if (const auto it = _db.find(k); it != _db.end())
                return it->second;
            return {};
        }

        void set(const std::string_view key, const std::string_view val)
        {
            if (const auto it = _db.find(key); it != _db.end()) {
                it->second = val;
            } else {
                _db.emplace(key, val);
            }
        }

        [[nodiscard]] size_t size() const
        {
            return _db.size();
        }
    private:
        std::map<std::string, std::string, std::less<>> _db {};
    };

    db_t::db_t():
        _impl { std::make_unique<impl>() }
    {
    }

    db_t::~db_t() = default;

    void db_t::clear()
    {
        _impl->clear();
    }

    size_t db_t::size() const
    {
        return _impl->size();
    }

    void db_t::erase(const std::string_view key)
    {
        _impl->erase(key);
    }

    void db_t::foreach(const observer_t &obs) const
    {
        _impl->foreach(obs);
    }

    value_t db_t::get(const std::string_view key) const
    {
        return _impl->get(key);
    }

    void db_t::set(const std::string_view key, const std::string_view val)
    {
        _impl->set(key, val);
    }
}
