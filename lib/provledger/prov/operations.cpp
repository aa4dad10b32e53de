/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "operations.hpp"

namespace provledger::prov {
    std::string_view operation_name(const chronicle_operation_t &op)
    {
        return std::visit([](const auto &o) -> std::string_view {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, create_namespace_t>) {
                return "create_namespace"sv;
            } else if constexpr (std::is_same_v<T, agent_exists_t>) {
                return "agent_exists"sv;
            } else if constexpr (std::is_same_v<T, activity_exists_t>) {
                return "activity_exists"sv;
            } else if constexpr (std::is_same_v<T, entity_exists_t>) {
                return "entity_exists"sv;
            } else if constexpr (std::is_same_v<T, register_key_t>) {
                return "register_key"sv;
            } else if constexpr (std::is_same_v<T, acts_on_behalf_of_t>) {
                return "acts_on_behalf_of"sv;
            } else if constexpr (std::is_same_v<T, start_activity_t>) {
                return "start_activity"sv;
            } else if constexpr (std::is_same_v<T, end_activity_t>) {
                return "end_activity"sv;
            } else if constexpr (std::is_same_v<T, activity_uses_t>) {
                return "activity_uses"sv;
            } else if constexpr (std::is_same_v<T, was_generated_by_t>) {
                return "was_generated_by"sv;
            } else if constexpr (std::is_same_v<T, was_informed_by_t>) {
                return "was_informed_by"sv;
            } else if constexpr (std::is_same_v<T, was_associated_with_t>) {
                return "was_associated_with"sv;
            } else if constexpr (std::is_same_v<T, was_attributed_to_t>) {
                return "was_attributed_to"sv;
            } else if constexpr (std::is_same_v<T, entity_derive_t>) {
                return "entity_derive"sv;
            } else if constexpr (std::is_same_v<T, set_agent_attributes_t>) {
                return "set_agent_attributes"sv;
            } else if constexpr (std::is_same_v<T, set_activity_attributes_t>) {
                return "set_activity_attributes"sv;
            } else if constexpr (std::is_same_v<T, set_entity_attributes_t>) {
                return "set_entity_attributes"sv;
            } else {
                static_assert(unsupported_operation_v<T>, "an unsupported operation type");
            }
        }, op);
    }

    const namespace_id_t &operation_namespace(const chronicle_operation_t &op)
    {
        return std::visit([](const auto &o) -> const namespace_id_t & {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, create_namespace_t>) {
                return o.id;
            } else {
                return o.namespace_id;
            }
        }, op);
    }
}
