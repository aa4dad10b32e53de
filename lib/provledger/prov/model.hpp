#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <set>
#include <span>
#include "contradiction.hpp"
#include "operations.hpp"
#include "records.hpp"

namespace provledger::prov {
    template<typename T>
    struct namespaced_t {
        namespace_id_t namespace_id {};
        T id {};

        void serialize(auto &archive)
        {
            archive.process("namespace_id"sv, namespace_id);
            archive.process("id"sv, id);
        }

        bool operator==(const namespaced_t &o) const = default;
        std::strong_ordering operator<=>(const namespaced_t &o) const = default;
    };
    using namespaced_agent_t = namespaced_t<agent_id_t>;
    using namespaced_activity_t = namespaced_t<activity_id_t>;
    using namespaced_entity_t = namespaced_t<entity_id_t>;
    using namespaced_identity_t = namespaced_t<identity_id_t>;

    // The materialized provenance graph.
    // Records are keyed by namespace and resource id, relations are held in ordered sets.
    struct prov_model_t {
        std::map<namespace_id_t, namespace_t> namespaces {};

        std::map<namespaced_agent_t, agent_t> agents {};
        // delegations keyed by the delegate
        std::map<namespaced_agent_t, std::set<delegation_t>> acted_on_behalf_of {};
        // delegations keyed by the responsible agent
        std::map<namespaced_agent_t, std::set<delegation_t>> delegation {};
        std::map<namespaced_agent_t, identity_id_t> has_identity {};
        std::map<namespaced_agent_t, std::set<identity_id_t>> had_identity {};
        std::map<namespaced_identity_t, identity_t> identities {};

        std::map<namespaced_entity_t, entity_t> entities {};
        std::map<namespaced_entity_t, std::set<derivation_t>> derivation {};
        std::map<namespaced_entity_t, std::set<generation_t>> generation {};
        std::map<namespaced_entity_t, std::set<attribution_t>> attribution {};

        std::map<namespaced_activity_t, activity_t> activities {};
        std::map<namespaced_activity_t, std::set<activity_id_t>> was_informed_by {};
        std::map<namespaced_activity_t, std::set<generated_entity_t>> generated {};
        std::map<namespaced_activity_t, std::set<association_t>> association {};
        std::map<namespaced_activity_t, std::set<usage_t>> usage {};

        static prov_model_t from_operations(std::span<const chronicle_operation_t> ops);

        // Folds an operation into the model, throws contradiction_t when it conflicts with recorded facts.
        // Ensure-exists side effects of the operation are kept even when it throws.
        void apply(const chronicle_operation_t &op);

        // Record maps are overwritten by key, relation sets are unioned
        void combine(const prov_model_t &other);

        [[nodiscard]] bool empty() const;

        void namespace_context(const namespace_id_t &ns);
        agent_t &agent_context(const namespace_id_t &ns, const agent_id_t &id);
        activity_t &activity_context(const namespace_id_t &ns, const activity_id_t &id);
        entity_t &entity_context(const namespace_id_t &ns, const entity_id_t &id);

        void qualified_delegation(const namespace_id_t &ns, const agent_id_t &responsible_id, const agent_id_t &delegate_id,
            const std::optional<activity_id_t> &activity_id, const role_t &role);
        void qualified_association(const namespace_id_t &ns, const activity_id_t &activity_id, const agent_id_t &agent_id, const role_t &role);
        void qualified_attribution(const namespace_id_t &ns, const entity_id_t &entity_id, const agent_id_t &agent_id, const role_t &role);
        void was_generated_by(const namespace_id_t &ns, const entity_id_t &generated_id, const activity_id_t &activity_id);
        void generated_entity(const namespace_id_t &ns, const activity_id_t &activity_id, const entity_id_t &entity_id);
        void used(const namespace_id_t &ns, const activity_id_t &activity_id, const entity_id_t &entity_id);
        void informed_by(const namespace_id_t &ns, const activity_id_t &activity_id, const activity_id_t &informing_id);
        void was_derived_from(const namespace_id_t &ns, derivation_type_t typ, const entity_id_t &used_id,
            const entity_id_t &generated_id, const std::optional<activity_id_t> &activity_id);
        void new_identity(const namespace_id_t &ns, const agent_id_t &agent_id, const std::string &public_key);

        void serialize(auto &archive)
        {
            archive.process("namespaces"sv, namespaces);
            archive.process("agents"sv, agents);
            archive.process("acted_on_behalf_of"sv, acted_on_behalf_of);
            archive.process("delegation"sv, delegation);
            archive.process("has_identity"sv, has_identity);
            archive.process("had_identity"sv, had_identity);
            archive.process("identities"sv, identities);
            archive.process("entities"sv, entities);
            archive.process("derivation"sv, derivation);
            archive.process("generation"sv, generation);
            archive.process("attribution"sv, attribution);
            archive.process("activities"sv, activities);
            archive.process("was_informed_by"sv, was_informed_by);
            archive.process("generated"sv, generated);
            archive.process("association"sv, association);
            archive.process("usage"sv, usage);
        }

        bool operator==(const prov_model_t &o) const = default;
    };
}
