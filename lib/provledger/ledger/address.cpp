/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include "address.hpp"

namespace provledger::ledger {
    using namespace prov;

    std::string address_t::to_string() const
    {
        if (namespace_id)
            return fmt::format("{}:{}", *namespace_id, resource);
        return resource.iri();
    }

    address_list_t dependencies(const chronicle_operation_t &op)
    {
        address_list_t deps {};
        const auto add = [&](address_t addr) {
            if (std::find(deps.begin(), deps.end(), addr) == deps.end())
                deps.emplace_back(std::move(addr));
        };
        std::visit([&](const auto &o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, create_namespace_t>) {
                add(address_t::for_namespace(o.id));
            } else {
                const auto &ns = o.namespace_id;
                add(address_t::for_namespace(ns));
                if constexpr (std::is_same_v<T, agent_exists_t>
                        || std::is_same_v<T, activity_exists_t>
                        || std::is_same_v<T, entity_exists_t>
                        || std::is_same_v<T, start_activity_t>
                        || std::is_same_v<T, end_activity_t>
                        || std::is_same_v<T, set_agent_attributes_t>
                        || std::is_same_v<T, set_activity_attributes_t>
                        || std::is_same_v<T, set_entity_attributes_t>) {
                    add(address_t::in_namespace(ns, o.id));
                } else if constexpr (std::is_same_v<T, register_key_t>) {
                    add(address_t::in_namespace(ns, o.id));
                    add(address_t::in_namespace(ns, o.identity_id()));
                } else if constexpr (std::is_same_v<T, acts_on_behalf_of_t>) {
                    if (const auto act = normalize_activity(o.activity_id); act)
                        add(address_t::in_namespace(ns, *act));
                    add(address_t::in_namespace(ns, o.delegate_id));
                    add(address_t::in_namespace(ns, o.responsible_id));
                } else if constexpr (std::is_same_v<T, activity_uses_t> || std::is_same_v<T, was_generated_by_t>) {
                    add(address_t::in_namespace(ns, o.activity));
                    add(address_t::in_namespace(ns, o.id));
                } else if constexpr (std::is_same_v<T, was_informed_by_t>) {
                    add(address_t::in_namespace(ns, o.activity));
                    add(address_t::in_namespace(ns, o.informing_activity));
                } else if constexpr (std::is_same_v<T, was_associated_with_t>) {
                    add(address_t::in_namespace(ns, o.activity_id));
                    add(address_t::in_namespace(ns, o.agent_id));
                } else if constexpr (std::is_same_v<T, was_attributed_to_t>) {
                    add(address_t::in_namespace(ns, o.entity_id));
                    add(address_t::in_namespace(ns, o.agent_id));
                } else if constexpr (std::is_same_v<T, entity_derive_t>) {
                    if (o.activity_id)
                        add(address_t::in_namespace(ns, *o.activity_id));
                    add(address_t::in_namespace(ns, o.used_id));
                    add(address_t::in_namespace(ns, o.id));
                } else {
                    static_assert(unsupported_operation_v<T>, "an unsupported operation type");
                }
            }
        }, op);
        return deps;
    }
}
