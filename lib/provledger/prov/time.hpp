#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <chrono>
#include <compare>
#include <cstdint>
#include <string>
#include <boost/json.hpp>
#include <provledger/common/format.hpp>

namespace provledger::prov {
    // A UTC point in time with nanosecond precision
    struct timestamp_t {
        using duration_t = std::chrono::nanoseconds;
        using time_point_t = std::chrono::sys_time<duration_t>;

        time_point_t time {};

        // Throws when the value does not fit the nanosecond representation
        static timestamp_t from_seconds(int64_t secs);

        static timestamp_t from_json(const boost::json::value &jv)
        {
            return { time_point_t { duration_t { boost::json::value_to<int64_t>(jv) } } };
        }

        [[nodiscard]] boost::json::value to_json() const
        {
            return boost::json::value(static_cast<int64_t>(time.time_since_epoch().count()));
        }

        // RFC 3339 in UTC, fractional seconds only when non-zero
        [[nodiscard]] std::string rfc3339() const;

        timestamp_t operator+(const duration_t d) const
        {
            return { time + d };
        }

        timestamp_t operator-(const duration_t d) const
        {
            return { time - d };
        }

        bool operator==(const timestamp_t &o) const = default;
        std::strong_ordering operator<=>(const timestamp_t &o) const = default;
    };
}

namespace fmt {
    template<>
    struct formatter<provledger::prov::timestamp_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.rfc3339());
        }
    };
}
