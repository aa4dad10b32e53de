/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <provledger/common/logger.hpp>
#include "process.hpp"

namespace provledger::ledger {
    process_result_t process(const prov::chronicle_operation_t &op, prov::prov_model_t model, const std::span<const state_input_t> inputs)
    {
        for (const auto &in: inputs)
            model.combine(in.data);
        model.apply(op);
        auto outputs = to_snapshot(model);
        logger::trace("process {}: {} inputs {} outputs", op, inputs.size(), outputs.size());
        return { std::move(outputs), std::move(model) };
    }
}
