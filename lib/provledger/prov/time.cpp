/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <ctime>
#include <limits>
#include <fmt/chrono.h>
#include <provledger/common/error.hpp>
#include "time.hpp"

namespace provledger::prov {
    timestamp_t timestamp_t::from_seconds(const int64_t secs)
    {
        static constexpr int64_t max_secs = std::numeric_limits<duration_t::rep>::max() / duration_t::period::den;
        static constexpr int64_t min_secs = std::numeric_limits<duration_t::rep>::min() / duration_t::period::den;
        if (secs > max_secs || secs < min_secs) [[unlikely]]
            throw error(fmt::format("a timestamp of {} seconds is outside of the supported range [{}, {}]", secs, min_secs, max_secs));
        return { time_point_t { std::chrono::seconds { secs } } };
    }

    std::string timestamp_t::rfc3339() const
    {
        const auto secs = std::chrono::floor<std::chrono::seconds>(time);
        const auto nanos = (time - secs).count();
        // fmt::gmtime throws fmt::format_error when the calendar time is not representable
        const std::time_t t = secs.time_since_epoch().count();
        auto res = fmt::format("{:%Y-%m-%dT%H:%M:%S}", fmt::gmtime(t));
        if (nanos != 0)
            res += fmt::format(".{:09}", nanos);
        res += 'Z';
        return res;
    }
}
