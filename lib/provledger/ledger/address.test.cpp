/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <set>
#include <boost/uuid/string_generator.hpp>
#include <provledger/common/test.hpp>
#include "address.hpp"

namespace {
    using namespace provledger;
    using namespace provledger::ledger;
    using namespace provledger::prov;
}

suite provledger_ledger_address_suite = [] {
    "provledger::ledger::address"_test = [] {
        const auto ns = namespace_id_t::from_external_id("deps", boost::uuids::string_generator {}("b9e7c0a2-4d1f-4f43-9a8e-3d2f1c0b9a87"));
        const auto ag = agent_id_t::from_external_id("ag");
        const auto ag2 = agent_id_t::from_external_id("ag2");
        const auto act = activity_id_t::from_external_id("act");
        const auto act2 = activity_id_t::from_external_id("act2");
        const auto ent = entity_id_t::from_external_id("ent");
        const auto ent2 = entity_id_t::from_external_id("ent2");
        const auto ns_addr = address_t::for_namespace(ns);
        const auto in_ns = [&](chronicle_iri_t id) {
            return address_t::in_namespace(ns, std::move(id));
        };

        "to_string"_test = [&] {
            expect_equal(ns.iri(), ns_addr.to_string());
            expect_equal(fmt::format("{}:chronicle:agent:ag", ns.iri()), in_ns(ag).to_string());
            expect_equal(in_ns(ag).to_string(), fmt::format("{}", in_ns(ag)));
        };
        "ordering"_test = [&] {
            expect(ns_addr < in_ns(ag));
            expect(in_ns(ag) == in_ns(ag));
            expect(in_ns(ag) != in_ns(agent_id_t::from_external_id("ag2")));
            expect(!(in_ns(ag) == address_t::in_namespace(namespace_id_t::from_external_id("other", ns.uuid), ag)));
        };
        "dependencies"_test = [&] {
            expect(dependencies(create_namespace_t { ns }) == address_list_t { ns_addr });
            expect(dependencies(agent_exists_t { ns, ag }) == address_list_t { ns_addr, in_ns(ag) });
            expect(dependencies(activity_exists_t { ns, act }) == address_list_t { ns_addr, in_ns(act) });
            expect(dependencies(entity_exists_t { ns, ent }) == address_list_t { ns_addr, in_ns(ent) });
            expect(dependencies(register_key_t { ns, ag, "pk" })
                == address_list_t { ns_addr, in_ns(ag), in_ns(identity_id_t::from_component_ids(ag, "pk")) });
            expect(dependencies(acts_on_behalf_of_t { ns, ag, ag2, act, "r" }) == address_list_t { ns_addr, in_ns(act), in_ns(ag), in_ns(ag2) });
            expect(dependencies(acts_on_behalf_of_t { ns, ag, ag2, {}, {} }) == address_list_t { ns_addr, in_ns(ag), in_ns(ag2) });
            expect(dependencies(acts_on_behalf_of_t { ns, ag, ag2, activity_id_t::from_external_id(""), "r" }) == address_list_t { ns_addr, in_ns(ag), in_ns(ag2) });
            expect(dependencies(start_activity_t { ns, act, timestamp_t::from_seconds(1) }) == address_list_t { ns_addr, in_ns(act) });
            expect(dependencies(end_activity_t { ns, act, timestamp_t::from_seconds(1) }) == address_list_t { ns_addr, in_ns(act) });
            expect(dependencies(activity_uses_t { ns, ent, act }) == address_list_t { ns_addr, in_ns(act), in_ns(ent) });
            expect(dependencies(was_generated_by_t { ns, ent, act }) == address_list_t { ns_addr, in_ns(act), in_ns(ent) });
            expect(dependencies(was_informed_by_t { ns, act, act2 }) == address_list_t { ns_addr, in_ns(act), in_ns(act2) });
            expect(dependencies(was_associated_with_t { ns, act, ag, {} }) == address_list_t { ns_addr, in_ns(act), in_ns(ag) });
            expect(dependencies(was_attributed_to_t { ns, ent, ag, {} }) == address_list_t { ns_addr, in_ns(ent), in_ns(ag) });
            expect(dependencies(entity_derive_t { ns, ent2, ent, act, derivation_type_t::revision })
                == address_list_t { ns_addr, in_ns(act), in_ns(ent), in_ns(ent2) });
            expect(dependencies(entity_derive_t { ns, ent2, ent, {}, derivation_type_t::none }) == address_list_t { ns_addr, in_ns(ent), in_ns(ent2) });
            expect(dependencies(set_agent_attributes_t { ns, ag, {} }) == address_list_t { ns_addr, in_ns(ag) });
            expect(dependencies(set_activity_attributes_t { ns, act, {} }) == address_list_t { ns_addr, in_ns(act) });
            expect(dependencies(set_entity_attributes_t { ns, ent, {} }) == address_list_t { ns_addr, in_ns(ent) });
        };
        "no duplicates"_test = [&] {
            const auto deps = dependencies(was_informed_by_t { ns, act, act });
            expect(deps == address_list_t { ns_addr, in_ns(act) });
            const auto derive_deps = dependencies(entity_derive_t { ns, ent, ent, {}, derivation_type_t::quotation });
            const std::set<address_t> unique { derive_deps.begin(), derive_deps.end() };
            expect_equal(unique.size(), derive_deps.size());
        };
    };
};
