/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdlib>
#include <provledger/common/test.hpp>
#include "logger.hpp"

using namespace provledger;

suite provledger_common_logger_suite = [] {
    "provledger::common::logger"_test = [] {
        "api"_test = [] {
            // checks that the code compiles and does not fail
            logger::trace("OK - trace");
            logger::trace("OK - {}", "trace");
            logger::debug("OK - debug");
            logger::debug("OK - {}", "debug");
            logger::info("OK - info");
            logger::info("OK - {}", "info");
            logger::warn("OK - warn");
            logger::warn("OK - {}", "warn");
            logger::error("OK - error");
            logger::error("OK - {}", "error");
            expect(true);
        };
        "parse_level"_test = [] {
            expect(logger::parse_level("trace") == logger::level::trace);
            expect(logger::parse_level("debug") == logger::level::debug);
            expect(logger::parse_level("info") == logger::level::info);
            expect(logger::parse_level("warn") == logger::level::warn);
            expect(logger::parse_level("error") == logger::level::error);
            expect(throws<error>([] { std::ignore = logger::parse_level("verbose"); }));
            expect(throws<error>([] { std::ignore = logger::parse_level("INFO"); }));
            expect(throws<error>([] { std::ignore = logger::parse_level(""); }));
        };
        "config from the environment"_test = [] {
            ::setenv("PROVLEDGER_LOG", "/tmp/provledger-test/ledger.log", 1);
            ::setenv("PROVLEDGER_LOG_NO_CONSOLE", "1", 1);
            ::setenv("PROVLEDGER_LOG_LEVEL", "warn", 1);
            ::setenv("PROVLEDGER_DEBUG", "1", 1);
            const auto cfg = logger::config_t::from_env();
            expect_equal(std::string { "/tmp/provledger-test/ledger.log" }, cfg.path);
            expect(!cfg.console);
            expect(cfg.console_level == logger::level::warn);
            expect(cfg.tracing);
            ::setenv("PROVLEDGER_LOG_LEVEL", "loud", 1);
            expect(throws<error>([] { std::ignore = logger::config_t::from_env(); }));
            for (const char *name: { "PROVLEDGER_LOG", "PROVLEDGER_LOG_NO_CONSOLE", "PROVLEDGER_LOG_LEVEL", "PROVLEDGER_DEBUG" })
                ::unsetenv(name);
            const auto def = logger::config_t::from_env();
            expect_equal(std::string { "./log/provledger.log" }, def.path);
            expect(def.console);
            expect(def.console_level == logger::level::info);
            expect(!def.tracing);
        };
        "run_log_errors"_test = [] {
            const auto ex1 = logger::run_log_errors([] {});
            expect(!ex1);
            const auto ex2 = logger::run_log_errors([] { throw error("Something bad!"); });
            expect(static_cast<bool>(ex2));
            size_t cleanups = 0;
            logger::run_log_errors([] { throw error("Something bad!"); }, [&] { ++cleanups; });
            expect_equal(size_t { 1 }, cleanups);
        };
        "run_log_errors_rethrow"_test = [] {
            expect(nothrow([] { logger::run_log_errors_rethrow([] {}); }));
            expect(throws([] { logger::run_log_errors_rethrow([] { throw error("Something bad!"); }); }));
        };
    };
};
