/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <provledger/common/test.hpp>
#include "time.hpp"

namespace {
    using namespace provledger;
    using namespace provledger::prov;
}

suite provledger_prov_time_suite = [] {
    "provledger::prov::time"_test = [] {
        "rfc3339"_test = [] {
            expect_equal(std::string { "1970-01-01T00:00:00Z" }, timestamp_t {}.rfc3339());
            expect_equal(std::string { "1969-12-31T23:59:59Z" }, timestamp_t::from_seconds(-1).rfc3339());
            expect_equal(std::string { "1969-12-31T23:59:58.500000000Z" },
                (timestamp_t::from_seconds(-1) - std::chrono::milliseconds { 500 }).rfc3339());
            expect_equal(std::string { "2023-11-14T22:13:20.000000001Z" },
                (timestamp_t::from_seconds(1'700'000'000) + std::chrono::nanoseconds { 1 }).rfc3339());
        };
        "seconds range"_test = [] {
            const int64_t max_secs = std::numeric_limits<int64_t>::max() / 1'000'000'000;
            const int64_t min_secs = std::numeric_limits<int64_t>::min() / 1'000'000'000;
            expect(timestamp_t::from_seconds(max_secs).time.time_since_epoch() == std::chrono::seconds { max_secs });
            expect_equal(std::string { "2262-04-11T23:47:16Z" }, timestamp_t::from_seconds(max_secs).rfc3339());
            expect(timestamp_t::from_seconds(min_secs).time.time_since_epoch() == std::chrono::seconds { min_secs });
            expect(throws<error>([&] { timestamp_t::from_seconds(max_secs + 1); }));
            expect(throws<error>([&] { timestamp_t::from_seconds(min_secs - 1); }));
            expect(throws<error>([] { timestamp_t::from_seconds(std::numeric_limits<int64_t>::max()); }));
            expect(throws<error>([] { timestamp_t::from_seconds(std::numeric_limits<int64_t>::min()); }));
        };
    };
};
