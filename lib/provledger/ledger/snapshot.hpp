#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <span>
#include <vector>
#include <provledger/prov/model.hpp>
#include "address.hpp"

namespace provledger::ledger {
    // A fragment read from storage for one address
    struct state_input_t {
        prov::prov_model_t data {};

        bool operator==(const state_input_t &o) const = default;
    };
    using state_input_list_t = std::vector<state_input_t>;

    template<typename ADDR>
    struct state_output_t {
        ADDR address {};
        prov::prov_model_t data {};

        bool operator==(const state_output_t &o) const = default;
    };
    using snapshot_t = std::vector<state_output_t<address_t>>;

    // Splits a model into one minimal fragment per resource ordered by address
    extern snapshot_t to_snapshot(const prov::prov_model_t &model);
    extern prov::prov_model_t merge(std::span<const state_output_t<address_t>> fragments);
    extern prov::prov_model_t merge(std::span<const state_input_t> inputs);
}
