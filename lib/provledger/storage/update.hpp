#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <vector>
#include <provledger/common/error.hpp>
#include "common.hpp"

namespace provledger::storage::update {
    // Buffers writes on top of a base db until commit or reset.
    // N.B. this class is not thread safe!
    // N.B. this class assumes that the base_db is updated only by its commit method
    struct db_t final: storage::db_t {
        using update_map_t = std::map<std::string, value_t, std::less<>>;
        using undo_item_t = std::pair<std::string, value_t>;
        using undo_list_t = std::vector<undo_item_t>;

        struct undo_redo_t {
            undo_list_t undo;
            update_map_t redo;
        };

        db_t() = delete;

        explicit db_t(storage::db_ptr_t db):
            _base_db { std::move(db) }
        {
        }

        ~db_t() override = default;

        void clear() override
        {
            throw error("clear is not supported for update::db_t!");
        }

        void erase(const std::string_view key) override
        {
            _set(key, {});
        }

        void foreach(const observer_t &obs) const override
        {
            auto upd_it = _updates.begin();
            const auto upd_end = _updates.end();
            _base_db->foreach([&](const auto &k, const auto &v) {
                while (upd_it != upd_end && upd_it->first < k) {
                    if (upd_it->second)
                        obs(upd_it->first, *upd_it->second);
                    ++upd_it;
                }
                if (upd_it != upd_end && upd_it->first == k) {
                    if (upd_it->second)
                        obs(k, *upd_it->second);
                    ++upd_it;
                } else {
                    obs(k, v);
                }
            });
            while (upd_it != upd_end) {
                if (upd_it->second)
                    obs(upd_it->first, *upd_it->second);
                ++upd_it;
            }
        }

        value_t get(const std::string_view k) const override
        {
            if (const auto it = _updates.find(k); it != _updates.end())
                return it->second;
            return _base_db->get(k);
        }

        void set(const std::string_view key, const std::string_view val) override
        {
            _set(key, std::string { val });
        }

        [[nodiscard]] size_t size() const override
        {
            return _base_db->size() + _num_added - _num_removed;
        }

        // N.B. an exception in set or erase base_db method would leave the state partially applied
        undo_redo_t commit();
        void reset();

        [[nodiscard]] const update_map_t &updates() const noexcept
        {
            return _updates;
        }
    private:
        storage::db_ptr_t _base_db;
        update_map_t _updates {};
        size_t _num_added = 0;
        size_t _num_removed = 0;

        void _set(std::string_view key, value_t val);
    };
    using db_ptr_t = std::shared_ptr<db_t>;
}
