/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cerrno>
#include <cstring>
#include <system_error>
#include <stdexcept>
#include <fmt/ranges.h>
#include <provledger/common/test.hpp>
#include "error.hpp"

namespace {
    using namespace provledger;
}

suite provledger_common_error_suite = [] {
    "provledger::common::error"_test = [] {
        "message"_test = [] {
            const error e { "something is off" };
            expect(std::strcmp(e.what(), "something is off") == 0);
        };
        "cause"_test = [] {
            const error inner { "inner failure" };
            const error outer { "outer failure", inner };
            const std::string_view msg { outer.what() };
            expect(msg.starts_with("outer failure caused by "));
            expect(msg.ends_with(": inner failure"));
        };
        "cause chain"_test = [] {
            const error root { "root failure" };
            expect_equal(size_t { 1 }, root.causes().size());
            expect_equal(std::string { "root failure" }, root.root_cause());
            const error mid { "mid failure", root };
            const error top { "top failure", mid };
            expect_equal(std::vector<std::string> { "top failure", "mid failure", "root failure" }, top.causes());
            expect_equal(std::string { "root failure" }, top.root_cause());
            const error foreign { "decoding failed", std::invalid_argument { "bad digit" } };
            expect_equal(std::vector<std::string> { "decoding failed", "bad digit" }, foreign.causes());
        };
        "system errors"_test = [] {
            errno = ENOENT;
            const error_sys e { "cannot open the snapshot" };
            expect_equal(size_t { 2 }, e.causes().size());
            expect_equal(std::generic_category().message(ENOENT), e.root_cause());
            expect(std::string_view { e.what() }.starts_with("cannot open the snapshot caused by "));
        };
        "catch as std::exception"_test = [] {
            expect(throws<std::exception>([] { throw error { "boom" }; }));
        };
    };
};
