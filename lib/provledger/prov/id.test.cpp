/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <boost/uuid/string_generator.hpp>
#include <provledger/common/test.hpp>
#include "id.hpp"

namespace {
    using namespace provledger;
    using namespace provledger::prov;

    const auto test_uuid = boost::uuids::string_generator {}("5a0ab5b8-eeb7-4812-9fe3-6dd69bd20cea");

    template<typename T>
    void expect_round_trip(const T &id)
    {
        const auto text = id.iri();
        const auto parsed = chronicle_iri_t::parse(text);
        expect(parsed == chronicle_iri_t { id }) << text;
        expect_equal(text, parsed.iri());
    }
}

suite provledger_prov_id_suite = [] {
    "provledger::prov::id"_test = [] {
        "percent encoding"_test = [] {
            expect_equal(std::string { "abc-._~XYZ019" }, percent_encode("abc-._~XYZ019"));
            expect_equal(std::string { "a%3Ab%25c%3Dd%20e" }, percent_encode("a:b%c=d e"));
            expect_equal(std::string { "%C3%A9" }, percent_encode("\xC3\xA9"));
            expect_equal(std::string { "a:b%c=d e" }, percent_decode("a%3Ab%25c%3Dd%20e"));
            expect_equal(std::string { "\xC3\xA9" }, percent_decode("%c3%a9"));
            expect(throws<error>([] { percent_decode("abc%4"); }));
            expect(throws<error>([] { percent_decode("abc%zz"); }));
        };
        "iri forms"_test = [] {
            const auto ns = namespace_id_t::from_external_id("testns", test_uuid);
            expect_equal(std::string { "chronicle:ns:testns:5a0ab5b8-eeb7-4812-9fe3-6dd69bd20cea" }, ns.iri());
            expect_equal(std::string { "chronicle:agent:test%20agent" }, agent_id_t::from_external_id("test agent").iri());
            expect_equal(std::string { "chronicle:activity:act" }, activity_id_t::from_external_id("act").iri());
            expect_equal(std::string { "chronicle:entity:ent" }, entity_id_t::from_external_id("ent").iri());
            expect_equal(std::string { "chronicle:domaintype:dt" }, domaintype_id_t::from_external_id("dt").iri());
            const auto agent = agent_id_t::from_external_id("testagent");
            const auto activity = activity_id_t::from_external_id("testactivity");
            const auto entity = entity_id_t::from_external_id("testentity");
            expect_equal(std::string { "chronicle:identity:testagent:key1" }, identity_id_t::from_component_ids(agent, "key1").iri());
            expect_equal(std::string { "chronicle:association:testagent:testactivity:role=" },
                association_id_t::from_component_ids(agent, activity, {}).iri());
            expect_equal(std::string { "chronicle:attribution:testagent:testentity:role=writer" },
                attribution_id_t::from_component_ids(agent, entity, "writer").iri());
            const auto responsible = agent_id_t::from_external_id("boss");
            expect_equal(std::string { "chronicle:delegation:testagent:boss:role=:activity=" },
                delegation_id_t::from_component_ids(agent, responsible, {}, {}).iri());
            expect_equal(std::string { "chronicle:delegation:testagent:boss:role=r:activity=testactivity" },
                delegation_id_t::from_component_ids(agent, responsible, activity, "r").iri());
        };
        "empty role is no role"_test = [] {
            const auto agent = agent_id_t::from_external_id("a");
            const auto activity = activity_id_t::from_external_id("b");
            expect(association_id_t::from_component_ids(agent, activity, "") == association_id_t::from_component_ids(agent, activity, {}));
        };
        "round trip"_test = [] {
            for (const std::string ext: { "plain", "with:colon", "100%", "a=b", "with space", "\xE2\x82\xAC uro", "" }) {
                expect_round_trip(namespace_id_t::from_external_id(ext, test_uuid));
                expect_round_trip(agent_id_t::from_external_id(ext));
                expect_round_trip(activity_id_t::from_external_id(ext));
                expect_round_trip(entity_id_t::from_external_id(ext));
                expect_round_trip(domaintype_id_t::from_external_id(ext));
                const auto agent = agent_id_t::from_external_id(ext + "-agent");
                expect_round_trip(identity_id_t::from_component_ids(agent, ext + "key"));
                expect_round_trip(association_id_t::from_component_ids(agent, activity_id_t::from_external_id(ext + "x"), ext + "r"));
                expect_round_trip(attribution_id_t::from_component_ids(agent, entity_id_t::from_external_id(ext + "x"), ext + "r"));
                expect_round_trip(delegation_id_t::from_component_ids(agent, agent_id_t::from_external_id(ext + "y"),
                    activity_id_t::from_external_id(ext + "z"), ext + "r"));
                expect_round_trip(delegation_id_t::from_component_ids(agent, agent_id_t::from_external_id(ext + "y"), {}, {}));
            }
        };
        "json"_test = [] {
            const auto agent = agent_id_t::from_external_id("a:b");
            const auto jv = agent.to_json();
            expect(jv.is_string());
            expect(agent_id_t::from_json(jv) == agent);
            expect(throws<err_parse_iri_t>([] { activity_id_t::from_json(boost::json::value("chronicle:agent:x")); }));
        };
        "malformed"_test = [] {
            expect(throws<err_parse_iri_t>([] { chronicle_iri_t::parse("urn:agent:x"); }));
            expect(throws<err_parse_iri_t>([] { chronicle_iri_t::parse("chronicle:robot:x"); }));
            expect(throws<err_parse_iri_t>([] { chronicle_iri_t::parse("chronicle:agent:x:y"); }));
            expect(throws<err_parse_iri_t>([] { chronicle_iri_t::parse("chronicle:ns:x:not-a-uuid"); }));
            expect(throws<err_parse_iri_t>([] { chronicle_iri_t::parse("chronicle:association:a:b:c"); }));
            expect(throws<err_parse_iri_t>([] { chronicle_iri_t::parse("chronicle:delegation:a:b:role=:act="); }));
            expect(throws<err_parse_iri_t>([] { chronicle_iri_t::parse("chronicle:entity:bad%2"); }));
        };
        "ordering"_test = [] {
            const auto a = agent_id_t::from_external_id("a");
            const auto b = agent_id_t::from_external_id("b");
            expect(a < b);
            const auto ns1 = namespace_id_t::from_external_id("ns", test_uuid);
            auto ns2 = ns1;
            ns2.uuid.data[15] ^= 0xFF;
            expect(ns1 != ns2);
            expect((ns1 < ns2) != (ns2 < ns1));
            expect((ns1 < ns2) == (ns1.uuid < ns2.uuid));
            const auto low = namespace_id_t::from_external_id("ns", boost::uuids::string_generator {}("00000000-0000-4000-8000-000000000001"));
            const auto high = namespace_id_t::from_external_id("ns", boost::uuids::string_generator {}("ff000000-0000-4000-8000-000000000000"));
            expect(low < high);
            expect(namespace_id_t::from_external_id("a", high.uuid) < namespace_id_t::from_external_id("b", low.uuid));
        };
        "format"_test = [] {
            const auto id = entity_id_t::from_external_id("e 1");
            expect_equal(std::string { "chronicle:entity:e%201" }, fmt::format("{}", id));
            expect_equal(std::string { "chronicle:entity:e%201" }, fmt::format("{}", chronicle_iri_t { id }));
        };
    };
};
