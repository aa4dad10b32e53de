#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <span>
#include <provledger/prov/model.hpp>
#include "snapshot.hpp"

namespace provledger::ledger {
    struct process_result_t {
        snapshot_t outputs {};
        prov::prov_model_t model {};
    };

    // Combines the inputs into the model, applies the operation and decomposes the result.
    // Throws prov::contradiction_t, in which case the caller must discard the model.
    extern process_result_t process(const prov::chronicle_operation_t &op, prov::prov_model_t model, std::span<const state_input_t> inputs);
}
