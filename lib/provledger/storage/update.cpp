/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <provledger/common/logger.hpp>
#include "update.hpp"

namespace provledger::storage::update {
    db_t::undo_redo_t db_t::commit()
    {
        undo_list_t undo {};
        undo.reserve(_updates.size());
        for (const auto &[k, v]: _updates) {
            auto prev_v = _base_db->get(k);
            if (prev_v != v) {
                if (v)
                    _base_db->set(k, *v);
                else
                    _base_db->erase(k);
                undo.emplace_back(k, std::move(prev_v));
            }
        }
        auto redo = std::move(_updates);
        reset();
        return { std::move(undo), std::move(redo) };
    }

    void db_t::reset()
    {
        _updates.clear();
        _num_added = 0;
        _num_removed = 0;
    }

    void db_t::_set(const std::string_view key, value_t val)
    {
        logger::trace("storage::update::db: key {} set to: {}", key, val);
        if (get(key) == val)
            return;
        const auto parent_val = _base_db->get(key);
        auto it = _updates.find(key);
        if (it != _updates.end()) {
            // revert the effect of the previous update on the size
            if (it->second && !parent_val)
                --_num_added;
            else if (!it->second && parent_val)
                --_num_removed;
        }
        if (parent_val == val) {
            if (it != _updates.end())
                _updates.erase(it);
            return;
        }
        if (val && !parent_val)
            ++_num_added;
        else if (!val && parent_val)
            ++_num_removed;
        if (it != _updates.end())
            it->second = std::move(val);
        else
            _updates.emplace(std::string { key }, std::move(val));
    }
}
