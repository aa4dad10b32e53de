/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <provledger/common/logger.hpp>
#include "model.hpp"

namespace provledger::prov {
    namespace {
        template<typename M>
        void combine_records(M &dst, const M &src)
        {
            for (const auto &[k, v]: src)
                dst.insert_or_assign(k, v);
        }

        template<typename M>
        void combine_sets(M &dst, const M &src)
        {
            for (const auto &[k, v]: src)
                dst[k].insert(v.begin(), v.end());
        }

        void validate_attribute_changes(const chronicle_iri_t &id, const namespace_id_t &ns,
            const attribute_map_t &current, const attributes_t &attempted)
        {
            std::vector<attribute_value_change_t> changes {};
            for (const auto &[name, attempted_val]: attempted.items) {
                if (const auto it = current.find(name); it != current.end() && it->second != attempted_val)
                    changes.emplace_back(name, it->second, attempted_val);
            }
            if (!changes.empty()) [[unlikely]]
                throw contradiction_t::attribute_value_change(id, ns, std::move(changes));
        }

        template<typename R>
        void set_attributes(R &rec, const attributes_t &attrs)
        {
            rec.domaintype_id = attrs.typ;
            rec.attributes = attrs.items;
        }
    }

    prov_model_t prov_model_t::from_operations(const std::span<const chronicle_operation_t> ops)
    {
        prov_model_t model {};
        for (const auto &op: ops)
            model.apply(op);
        return model;
    }

    bool prov_model_t::empty() const
    {
        return *this == prov_model_t {};
    }

    void prov_model_t::namespace_context(const namespace_id_t &ns)
    {
        namespaces.insert_or_assign(ns, namespace_t::from_id(ns));
    }

    agent_t &prov_model_t::agent_context(const namespace_id_t &ns, const agent_id_t &id)
    {
        auto [it, created] = agents.try_emplace(namespaced_agent_t { ns, id }, agent_t::exists(ns, id));
        return it->second;
    }

    activity_t &prov_model_t::activity_context(const namespace_id_t &ns, const activity_id_t &id)
    {
        auto [it, created] = activities.try_emplace(namespaced_activity_t { ns, id }, activity_t::exists(ns, id));
        return it->second;
    }

    entity_t &prov_model_t::entity_context(const namespace_id_t &ns, const entity_id_t &id)
    {
        auto [it, created] = entities.try_emplace(namespaced_entity_t { ns, id }, entity_t::exists(ns, id));
        return it->second;
    }

    void prov_model_t::qualified_delegation(const namespace_id_t &ns, const agent_id_t &responsible_id, const agent_id_t &delegate_id,
        const std::optional<activity_id_t> &activity_id, const role_t &role)
    {
        const auto act = normalize_activity(activity_id);
        const auto r = normalize_role(role);
        const delegation_t d {
            ns,
            delegation_id_t::from_component_ids(delegate_id, responsible_id, act, r),
            delegate_id,
            responsible_id,
            act,
            r
        };
        delegation[namespaced_agent_t { ns, responsible_id }].emplace(d);
        acted_on_behalf_of[namespaced_agent_t { ns, delegate_id }].emplace(d);
    }

    void prov_model_t::qualified_association(const namespace_id_t &ns, const activity_id_t &activity_id, const agent_id_t &agent_id, const role_t &role)
    {
        const auto r = normalize_role(role);
        association[namespaced_activity_t { ns, activity_id }].emplace(association_t {
            ns,
            association_id_t::from_component_ids(agent_id, activity_id, r),
            agent_id,
            activity_id,
            r
        });
    }

    void prov_model_t::qualified_attribution(const namespace_id_t &ns, const entity_id_t &entity_id, const agent_id_t &agent_id, const role_t &role)
    {
        const auto r = normalize_role(role);
        attribution[namespaced_entity_t { ns, entity_id }].emplace(attribution_t {
            ns,
            attribution_id_t::from_component_ids(agent_id, entity_id, r),
            agent_id,
            entity_id,
            r
        });
    }

    void prov_model_t::was_generated_by(const namespace_id_t &ns, const entity_id_t &generated_id, const activity_id_t &activity_id)
    {
        generation[namespaced_entity_t { ns, generated_id }].emplace(generation_t { activity_id, generated_id });
    }

    void prov_model_t::generated_entity(const namespace_id_t &ns, const activity_id_t &activity_id, const entity_id_t &entity_id)
    {
        generated[namespaced_activity_t { ns, activity_id }].emplace(generated_entity_t { entity_id, activity_id });
    }

    void prov_model_t::used(const namespace_id_t &ns, const activity_id_t &activity_id, const entity_id_t &entity_id)
    {
        usage[namespaced_activity_t { ns, activity_id }].emplace(usage_t { activity_id, entity_id });
    }

    void prov_model_t::informed_by(const namespace_id_t &ns, const activity_id_t &activity_id, const activity_id_t &informing_id)
    {
        was_informed_by[namespaced_activity_t { ns, activity_id }].emplace(informing_id);
    }

    void prov_model_t::was_derived_from(const namespace_id_t &ns, const derivation_type_t typ, const entity_id_t &used_id,
        const entity_id_t &generated_id, const std::optional<activity_id_t> &activity_id)
    {
        derivation[namespaced_entity_t { ns, generated_id }].emplace(derivation_t { generated_id, used_id, activity_id, typ });
    }

    void prov_model_t::new_identity(const namespace_id_t &ns, const agent_id_t &agent_id, const std::string &public_key)
    {
        const namespaced_agent_t agent_key { ns, agent_id };
        const auto id = identity_id_t::from_component_ids(agent_id, public_key);
        if (const auto it = has_identity.find(agent_key); it != has_identity.end()) {
            if (it->second == id)
                return;
            had_identity[agent_key].emplace(it->second);
            it->second = id;
        } else {
            has_identity.emplace(agent_key, id);
        }
        identities.insert_or_assign(namespaced_identity_t { ns, id }, identity_t { id, ns, public_key });
    }

    void prov_model_t::apply(const chronicle_operation_t &op)
    {
        logger::trace("prov_model::apply {}", op);
        std::visit([&](const auto &o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, create_namespace_t>) {
                namespace_context(o.id);
            } else if constexpr (std::is_same_v<T, agent_exists_t>) {
                namespace_context(o.namespace_id);
                agent_context(o.namespace_id, o.id);
            } else if constexpr (std::is_same_v<T, activity_exists_t>) {
                namespace_context(o.namespace_id);
                activity_context(o.namespace_id, o.id);
            } else if constexpr (std::is_same_v<T, entity_exists_t>) {
                namespace_context(o.namespace_id);
                entity_context(o.namespace_id, o.id);
            } else if constexpr (std::is_same_v<T, register_key_t>) {
                namespace_context(o.namespace_id);
                agent_context(o.namespace_id, o.id);
                new_identity(o.namespace_id, o.id, o.public_key);
            } else if constexpr (std::is_same_v<T, acts_on_behalf_of_t>) {
                namespace_context(o.namespace_id);
                agent_context(o.namespace_id, o.delegate_id);
                agent_context(o.namespace_id, o.responsible_id);
                if (const auto act = normalize_activity(o.activity_id); act)
                    activity_context(o.namespace_id, *act);
                qualified_delegation(o.namespace_id, o.responsible_id, o.delegate_id, o.activity_id, o.role);
            } else if constexpr (std::is_same_v<T, start_activity_t>) {
                namespace_context(o.namespace_id);
                auto &activity = activity_context(o.namespace_id, o.id);
                logger::trace("check start contradiction: time: {} started: {} ended: {}", o.time, activity.started, activity.ended);
                if (activity.started && *activity.started != o.time) [[unlikely]]
                    throw contradiction_t::start_date_alteration(o.id, o.namespace_id, *activity.started, o.time);
                if (activity.ended && *activity.ended < o.time) [[unlikely]]
                    throw contradiction_t::invalid_range(o.id, o.namespace_id, o.time, *activity.ended);
                activity.started = o.time;
            } else if constexpr (std::is_same_v<T, end_activity_t>) {
                namespace_context(o.namespace_id);
                auto &activity = activity_context(o.namespace_id, o.id);
                logger::trace("check end contradiction: time: {} started: {} ended: {}", o.time, activity.started, activity.ended);
                if (activity.ended && *activity.ended != o.time) [[unlikely]]
                    throw contradiction_t::end_date_alteration(o.id, o.namespace_id, *activity.ended, o.time);
                if (activity.started && *activity.started > o.time) [[unlikely]]
                    throw contradiction_t::invalid_range(o.id, o.namespace_id, *activity.started, o.time);
                activity.ended = o.time;
            } else if constexpr (std::is_same_v<T, activity_uses_t>) {
                namespace_context(o.namespace_id);
                activity_context(o.namespace_id, o.activity);
                entity_context(o.namespace_id, o.id);
                used(o.namespace_id, o.activity, o.id);
            } else if constexpr (std::is_same_v<T, was_generated_by_t>) {
                namespace_context(o.namespace_id);
                entity_context(o.namespace_id, o.id);
                activity_context(o.namespace_id, o.activity);
                was_generated_by(o.namespace_id, o.id, o.activity);
                generated_entity(o.namespace_id, o.activity, o.id);
            } else if constexpr (std::is_same_v<T, was_informed_by_t>) {
                namespace_context(o.namespace_id);
                activity_context(o.namespace_id, o.activity);
                activity_context(o.namespace_id, o.informing_activity);
                informed_by(o.namespace_id, o.activity, o.informing_activity);
            } else if constexpr (std::is_same_v<T, was_associated_with_t>) {
                namespace_context(o.namespace_id);
                agent_context(o.namespace_id, o.agent_id);
                activity_context(o.namespace_id, o.activity_id);
                qualified_association(o.namespace_id, o.activity_id, o.agent_id, o.role);
            } else if constexpr (std::is_same_v<T, was_attributed_to_t>) {
                namespace_context(o.namespace_id);
                agent_context(o.namespace_id, o.agent_id);
                entity_context(o.namespace_id, o.entity_id);
                qualified_attribution(o.namespace_id, o.entity_id, o.agent_id, o.role);
            } else if constexpr (std::is_same_v<T, entity_derive_t>) {
                namespace_context(o.namespace_id);
                entity_context(o.namespace_id, o.id);
                entity_context(o.namespace_id, o.used_id);
                if (o.activity_id)
                    activity_context(o.namespace_id, *o.activity_id);
                was_derived_from(o.namespace_id, o.typ, o.used_id, o.id, o.activity_id);
            } else if constexpr (std::is_same_v<T, set_agent_attributes_t>) {
                namespace_context(o.namespace_id);
                auto &agent = agent_context(o.namespace_id, o.id);
                validate_attribute_changes(o.id, o.namespace_id, agent.attributes, o.attributes);
                set_attributes(agent, o.attributes);
            } else if constexpr (std::is_same_v<T, set_activity_attributes_t>) {
                namespace_context(o.namespace_id);
                auto &activity = activity_context(o.namespace_id, o.id);
                validate_attribute_changes(o.id, o.namespace_id, activity.attributes, o.attributes);
                set_attributes(activity, o.attributes);
            } else if constexpr (std::is_same_v<T, set_entity_attributes_t>) {
                namespace_context(o.namespace_id);
                auto &entity = entity_context(o.namespace_id, o.id);
                validate_attribute_changes(o.id, o.namespace_id, entity.attributes, o.attributes);
                set_attributes(entity, o.attributes);
            } else {
                static_assert(unsupported_operation_v<T>, "an unsupported operation type");
            }
        }, op);
    }

    void prov_model_t::combine(const prov_model_t &other)
    {
        combine_records(namespaces, other.namespaces);
        combine_records(agents, other.agents);
        combine_sets(acted_on_behalf_of, other.acted_on_behalf_of);
        combine_sets(delegation, other.delegation);
        combine_records(has_identity, other.has_identity);
        combine_sets(had_identity, other.had_identity);
        combine_records(identities, other.identities);
        combine_records(entities, other.entities);
        combine_sets(derivation, other.derivation);
        combine_sets(generation, other.generation);
        combine_sets(attribution, other.attribution);
        combine_records(activities, other.activities);
        combine_sets(was_informed_by, other.was_informed_by);
        combine_sets(generated, other.generated);
        combine_sets(association, other.association);
        combine_sets(usage, other.usage);
    }
}
