/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include "snapshot.hpp"

namespace provledger::ledger {
    using namespace prov;

    namespace {
        using fragment_map_t = std::map<address_t, prov_model_t>;

        template<typename T>
        address_t address_of(const namespaced_t<T> &key)
        {
            return address_t::in_namespace(key.namespace_id, key.id);
        }

        template<typename M>
        void distribute(fragment_map_t &fragments, const M &src, M prov_model_t::*member)
        {
            for (const auto &[k, v]: src)
                (fragments[address_of(k)].*member).emplace(k, v);
        }
    }

    snapshot_t to_snapshot(const prov_model_t &model)
    {
        fragment_map_t fragments {};
        for (const auto &[id, ns]: model.namespaces)
            fragments[address_t::for_namespace(id)].namespaces.emplace(id, ns);

        distribute(fragments, model.agents, &prov_model_t::agents);
        distribute(fragments, model.acted_on_behalf_of, &prov_model_t::acted_on_behalf_of);
        distribute(fragments, model.delegation, &prov_model_t::delegation);
        distribute(fragments, model.has_identity, &prov_model_t::has_identity);
        distribute(fragments, model.had_identity, &prov_model_t::had_identity);
        distribute(fragments, model.identities, &prov_model_t::identities);

        distribute(fragments, model.entities, &prov_model_t::entities);
        distribute(fragments, model.derivation, &prov_model_t::derivation);
        distribute(fragments, model.generation, &prov_model_t::generation);
        distribute(fragments, model.attribution, &prov_model_t::attribution);

        distribute(fragments, model.activities, &prov_model_t::activities);
        distribute(fragments, model.was_informed_by, &prov_model_t::was_informed_by);
        distribute(fragments, model.generated, &prov_model_t::generated);
        distribute(fragments, model.association, &prov_model_t::association);
        distribute(fragments, model.usage, &prov_model_t::usage);

        snapshot_t res {};
        res.reserve(fragments.size());
        for (auto &&[addr, fragment]: fragments)
            res.emplace_back(addr, std::move(fragment));
        return res;
    }

    prov_model_t merge(const std::span<const state_output_t<address_t>> fragments)
    {
        prov_model_t model {};
        for (const auto &f: fragments)
            model.combine(f.data);
        return model;
    }

    prov_model_t merge(const std::span<const state_input_t> inputs)
    {
        prov_model_t model {};
        for (const auto &in: inputs)
            model.combine(in.data);
        return model;
    }
}
