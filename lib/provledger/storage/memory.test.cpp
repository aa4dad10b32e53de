/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <fmt/ranges.h>
#include <provledger/common/test.hpp>
#include "memory.hpp"

namespace {
    using namespace provledger;
    using namespace provledger::storage;
    using namespace std::string_view_literals;

    using contents_t = std::map<std::string, std::string>;

    contents_t get_contents(const storage::db_t &db)
    {
        contents_t act {};
        db.foreach([&](const auto &k, const auto &v) {
            act.try_emplace(k, v);
        });
        return act;
    }
}

suite provledger_storage_memory_suite = [] {
    "provledger::storage::memory"_test = [] {
        "get, set, and erase"_test = [&] {
            memory::db_t db {};
            expect(db.empty());
            expect_equal(value_t {}, db.get("AB"sv));
            db.set("AB"sv, "CD"sv);
            expect_equal(value_t { "CD"sv }, db.get("AB"sv));
            db.set("AB"sv, "EF"sv);
            expect_equal(value_t { "EF"sv }, db.get("AB"sv));
            expect_equal(size_t { 1 }, db.size());
            db.erase("AB"sv);
            expect_equal(value_t {}, db.get("AB"sv));
            db.erase("AB"sv);
            expect(db.empty());
        };
        "foreach is ordered"_test = [&] {
            memory::db_t db {};
            const contents_t exp {
                { "chronicle:ns:a:1", "{}" },
                { "chronicle:ns:a:1:chronicle:agent:x", "[1]" },
                { "chronicle:ns:b:2", "[2]" }
            };
            for (auto it = exp.rbegin(); it != exp.rend(); ++it)
                db.set(it->first, it->second);
            std::vector<std::string> keys {};
            db.foreach([&](const auto &k, const auto &) {
                keys.emplace_back(k);
            });
            expect_equal(std::vector<std::string> { "chronicle:ns:a:1", "chronicle:ns:a:1:chronicle:agent:x", "chronicle:ns:b:2" }, keys);
            expect_equal(exp, get_contents(db));
        };
        "equality and clear"_test = [&] {
            memory::db_t db1 {};
            memory::db_t db2 {};
            db1.set("k"sv, "v"sv);
            expect(!(db1 == db2));
            db2.set("k"sv, "v"sv);
            expect(db1 == db2);
            db2.set("k"sv, "w"sv);
            expect(!(db1 == db2));
            db1.clear();
            expect(db1.empty());
        };
    };
};
