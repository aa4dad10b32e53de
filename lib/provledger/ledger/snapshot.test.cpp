/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <boost/uuid/string_generator.hpp>
#include <provledger/codec/json.hpp>
#include <provledger/common/test.hpp>
#include "operation-state.hpp"
#include "process.hpp"
#include "snapshot.hpp"

namespace {
    using namespace provledger;
    using namespace provledger::ledger;
    using namespace provledger::prov;

    const auto ns = namespace_id_t::from_external_id("snap", boost::uuids::string_generator {}("1c3f5e7a-9b2d-4c6e-8f01-23456789abcd"));
    const auto ag = agent_id_t::from_external_id("ag");
    const auto ag2 = agent_id_t::from_external_id("ag2");
    const auto act = activity_id_t::from_external_id("act");
    const auto ent = entity_id_t::from_external_id("ent");
    const auto ent2 = entity_id_t::from_external_id("ent2");

    prov_model_t sample_model()
    {
        const auto t0 = timestamp_t::from_seconds(1'700'000'000);
        const std::vector<chronicle_operation_t> ops {
            create_namespace_t { ns },
            register_key_t { ns, ag, "k1" },
            register_key_t { ns, ag, "k2" },
            acts_on_behalf_of_t { ns, ag2, ag, act, "assistant" },
            start_activity_t { ns, act, t0 },
            end_activity_t { ns, act, t0 + std::chrono::seconds { 30 } },
            activity_uses_t { ns, ent, act },
            was_generated_by_t { ns, ent2, act },
            was_associated_with_t { ns, act, ag, "operator" },
            was_attributed_to_t { ns, ent2, ag2, {} },
            entity_derive_t { ns, ent2, ent, act, derivation_type_t::revision },
            set_entity_attributes_t { ns, ent2, { domaintype_id_t::from_external_id("report"),
                { { "pages", attribute_t { "int", boost::json::value(12) } } } } }
        };
        return prov_model_t::from_operations(ops);
    }
}

suite provledger_ledger_snapshot_suite = [] {
    "provledger::ledger::snapshot"_test = [] {
        const auto model = sample_model();

        "merge restores the model"_test = [&] {
            const auto snap = to_snapshot(model);
            expect(merge(snap) == model);
            expect(to_snapshot(prov_model_t {}).empty());
        };
        "fragments are minimal and ordered"_test = [&] {
            const auto snap = to_snapshot(model);
            // the namespace, two agents, one activity, two entities and two identities
            expect_equal(size_t { 8 }, snap.size());
            for (size_t i = 1; i < snap.size(); ++i)
                expect(snap[i - 1].address < snap[i].address);
            expect(snap.front().address == address_t::for_namespace(ns));
            for (const auto &frag: snap) {
                expect(!frag.data.empty());
                for (const auto &other: to_snapshot(frag.data))
                    expect(other.address == frag.address) << frag.address.to_string();
            }
        };
        "fragment contents"_test = [&] {
            const auto snap = to_snapshot(model);
            const auto agent_addr = address_t::in_namespace(ns, ag);
            const auto it = std::find_if(snap.begin(), snap.end(), [&](const auto &f) { return f.address == agent_addr; });
            expect(it != snap.end());
            if (it != snap.end()) {
                const auto &frag = it->data;
                expect_equal(size_t { 1 }, frag.agents.size());
                expect_equal(size_t { 1 }, frag.has_identity.size());
                expect_equal(size_t { 1 }, frag.had_identity.size());
                expect_equal(size_t { 1 }, frag.delegation.size());
                expect(frag.acted_on_behalf_of.empty());
                expect(frag.identities.empty());
                expect(frag.namespaces.empty());
            }
        };
        "stored form is stable"_test = [&] {
            const auto text = codec::json::save(model);
            const auto restored = codec::json::load<prov_model_t>(text);
            expect(restored == model);
            expect_equal(text, codec::json::save(restored));
            for (const auto &frag: to_snapshot(model))
                expect(codec::json::load<prov_model_t>(codec::json::save(frag.data)) == frag.data);
        };
    };

    "provledger::ledger::operation_state"_test = [] {
        "dirty outputs"_test = [] {
            const auto ns_addr = address_t::for_namespace(ns);
            const auto act_addr = address_t::in_namespace(ns, act);
            const auto ent_addr = address_t::in_namespace(ns, ent);
            prov_model_t ns_only {};
            ns_only.apply(create_namespace_t { ns });
            const auto ns_frag = to_snapshot(ns_only).at(0).data;

            operation_state_t<address_t> state {};
            const std::vector<operation_state_t<address_t>::item_t> loaded {
                { ns_addr, ns_frag },
                { act_addr, std::nullopt },
                { ent_addr, std::nullopt }
            };
            state.update_state(loaded);
            expect_equal(size_t { 3 }, state.size());
            expect_equal(size_t { 1 }, state.input().size());

            auto res = process(activity_uses_t { ns, ent, act }, prov_model_t {}, state.input());
            expect_equal(size_t { 3 }, res.outputs.size());
            state.update_state(res.outputs);
            expect_equal(uint32_t { 0 }, state.state().at(ns_addr).version);
            expect_equal(uint32_t { 1 }, state.state().at(act_addr).version);

            // a repeated operation changes nothing
            res = process(activity_uses_t { ns, ent, act }, res.model, state.input());
            state.update_state(res.outputs);
            expect_equal(uint32_t { 1 }, state.state().at(act_addr).version);
            expect_equal(uint32_t { 1 }, state.state().at(ent_addr).version);

            const auto dirty = std::move(state).dirty();
            expect_equal(size_t { 2 }, dirty.size());
            expect(dirty.at(0).address == act_addr || dirty.at(0).address == ent_addr);
            expect(merge(dirty).usage.contains(namespaced_activity_t { ns, act }));
        };
        "version counting"_test = [] {
            version_t v { 0, std::nullopt };
            v.write(std::nullopt);
            expect_equal(uint32_t { 0 }, v.version);
            prov_model_t m {};
            m.apply(create_namespace_t { ns });
            v.write(m);
            v.write(m);
            expect_equal(uint32_t { 1 }, v.version);
            v.write(std::nullopt);
            expect_equal(uint32_t { 2 }, v.version);
        };
        "contradicted operation"_test = [] {
            prov_model_t m {};
            m.apply(start_activity_t { ns, act, timestamp_t::from_seconds(10) });
            const state_input_list_t inputs { state_input_t { m } };
            expect(throws<contradiction_t>([&] {
                std::ignore = process(end_activity_t { ns, act, timestamp_t::from_seconds(5) }, prov_model_t {}, inputs);
            }));
        };
    };
};
