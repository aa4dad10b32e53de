#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <exception>
#include <functional>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include "format.hpp"

namespace provledger::logger {
    enum class level {
        trace,
        debug,
        info,
        warn,
        error
    };

    // Accepts the lowercase level names: trace, debug, info, warn and error
    extern level parse_level(std::string_view name);

    struct config_t {
        std::string path = "./log/provledger.log";
        bool console = true;
        level console_level = level::info;
        bool tracing = false;

        // PROVLEDGER_LOG, PROVLEDGER_LOG_NO_CONSOLE, PROVLEDGER_LOG_LEVEL and PROVLEDGER_DEBUG
        static config_t from_env();
    };

    // Read from the environment once, at the first use of the logger
    extern const config_t &config();
    extern void log(level lev, const std::string &msg);

    template<typename... Args>
    void log(const level lev, const std::string_view &fmt, Args&&... a)
    {
        log(lev, fmt::format(fmt::runtime(fmt), std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(const std::string_view &fmt, Args&&... a)
    {
        log(level::trace, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(const std::string_view &fmt, Args&&... a)
    {
        log(level::debug, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(const std::string_view &fmt, Args&&... a)
    {
        log(level::info, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(const std::string_view &fmt, Args&&... a)
    {
        log(level::warn, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(const std::string_view &fmt, Args&&... a)
    {
        log(level::error, fmt, std::forward<Args>(a)...);
    }

    using action = std::function<void()>;
    using optional_action = std::optional<action>;

    inline std::exception_ptr run_log_errors(const action &main, const optional_action &cleanup={},
            const std::source_location &loc=std::source_location::current())
    {
        std::exception_ptr cur_ex {};
        try {
            main();
            if (cleanup)
                (*cleanup)();
        } catch (const std::exception &ex) {
            cur_ex = std::current_exception();
            error("block at {}:{} failed with std::exception: {}", loc.file_name(), loc.line(), ex.what());
            if (cleanup)
                (*cleanup)();
        } catch (...) {
            cur_ex = std::current_exception();
            error("block at {}:{} failed with an unknown error", loc.file_name(), loc.line());
            if (cleanup)
                (*cleanup)();
        }
        return cur_ex;
    }

    inline void run_log_errors_rethrow(const action &main, const optional_action &cleanup={},
        const std::source_location &loc=std::source_location::current())
    {
        if (const auto cur_ex = run_log_errors(main, cleanup, loc))
            std::rethrow_exception(cur_ex);
    }
}

namespace fmt {
    template<>
    struct formatter<provledger::logger::level>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using provledger::logger::level;
            switch (v) {
                case level::trace: return fmt::format_to(ctx.out(), "trace");
                case level::debug: return fmt::format_to(ctx.out(), "debug");
                case level::info: return fmt::format_to(ctx.out(), "info");
                case level::warn: return fmt::format_to(ctx.out(), "warn");
                case level::error: return fmt::format_to(ctx.out(), "error");
                default: return fmt::format_to(ctx.out(), "level#{}", static_cast<int>(v));
            }
        }
    };
}
