#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>
#include "snapshot.hpp"

namespace provledger::ledger {
    struct version_t {
        uint32_t version = 0;
        std::optional<prov::prov_model_t> value {};

        // the version changes only when the value does
        void write(std::optional<prov::prov_model_t> new_value)
        {
            if (new_value != value) {
                ++version;
                value = std::move(new_value);
            }
        }
    };

    // Per-batch cache of the fragments read and written by a sequence of operations.
    // N.B. this class is not thread safe!
    template<typename ADDR>
    struct operation_state_t {
        using state_map_t = std::map<ADDR, version_t>;
        using item_t = std::pair<ADDR, std::optional<prov::prov_model_t>>;

        void update_state(const std::vector<item_t> &items)
        {
            for (const auto &[addr, value]: items) {
                auto [it, created] = _state.try_emplace(addr, version_t { 0, value });
                it->second.write(value);
            }
        }

        void update_state(const std::vector<state_output_t<ADDR>> &outputs)
        {
            for (const auto &out: outputs) {
                auto [it, created] = _state.try_emplace(out.address, version_t { 0, out.data });
                it->second.write(out.data);
            }
        }

        [[nodiscard]] state_input_list_t input() const
        {
            state_input_list_t res {};
            for (const auto &[addr, ver]: _state) {
                if (ver.value)
                    res.emplace_back(*ver.value);
            }
            return res;
        }

        [[nodiscard]] std::vector<state_output_t<ADDR>> dirty() &&
        {
            std::vector<state_output_t<ADDR>> res {};
            for (auto &&[addr, ver]: _state) {
                if (ver.version > 0 && ver.value)
                    res.emplace_back(addr, std::move(*ver.value));
            }
            _state.clear();
            return res;
        }

        [[nodiscard]] const state_map_t &state() const noexcept
        {
            return _state;
        }

        [[nodiscard]] size_t size() const noexcept
        {
            return _state.size();
        }
    private:
        state_map_t _state {};
    };
}
