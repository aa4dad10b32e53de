/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <array>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Warray-bounds"
#   pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif
#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic pop
#endif

#include "error.hpp"
#include "logger.hpp"

namespace provledger::logger {
    namespace {
        spdlog::level::level_enum to_spdlog(const level lev)
        {
            switch (lev) {
                case level::trace: return spdlog::level::trace;
                case level::debug: return spdlog::level::debug;
                case level::info: return spdlog::level::info;
                case level::warn: return spdlog::level::warn;
                case level::error: return spdlog::level::err;
                default:
                    throw provledger::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
            }
        }

        spdlog::logger create(const config_t &cfg)
        {
            std::cerr << fmt::format("INIT: log path: {}\n", cfg.path);
            {
                std::error_code ec {};
                if (const auto dir = std::filesystem::path { cfg.path }.parent_path(); !dir.empty())
                    std::filesystem::create_directories(dir, ec);
                std::ofstream os { cfg.path, std::ios_base::app };
                if (!os) {
                    std::cerr << fmt::format("INIT: Unable to write to the log file: {}; terminating.\n", cfg.path);
                    std::terminate();
                }
            }

            std::vector<spdlog::sink_ptr> sinks {};
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.path);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
            sinks.emplace_back(std::move(file_sink));
            if (cfg.console) {
                auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                console_sink->set_level(to_spdlog(cfg.console_level));
                console_sink->set_pattern("[%^%l%$] %v");
                sinks.emplace_back(std::move(console_sink));
            }
            spdlog::logger logger { "provledger", sinks.begin(), sinks.end() };
            logger.set_level(cfg.tracing ? spdlog::level::trace : spdlog::level::debug);
            logger.flush_on(spdlog::level::debug);
            logger.log(spdlog::level::debug, fmt::format("logger config: console: {} console level: {} tracing: {}",
                cfg.console, cfg.console_level, cfg.tracing));
            return logger;
        }

        spdlog::logger &get()
        {
            static spdlog::logger logger = create(config());
            return logger;
        }
    }

    level parse_level(const std::string_view name)
    {
        static constexpr std::array names { level::trace, level::debug, level::info, level::warn, level::error };
        for (const auto lev: names) {
            if (fmt::format("{}", lev) == name)
                return lev;
        }
        throw provledger::error(fmt::format("unsupported log level name: '{}'", name));
    }

    config_t config_t::from_env()
    {
        config_t cfg {};
        if (const char *env = std::getenv("PROVLEDGER_LOG"); env)
            cfg.path = env;
        cfg.console = std::getenv("PROVLEDGER_LOG_NO_CONSOLE") == nullptr;
        if (const char *env = std::getenv("PROVLEDGER_LOG_LEVEL"); env)
            cfg.console_level = parse_level(env);
        cfg.tracing = std::getenv("PROVLEDGER_DEBUG") != nullptr;
        return cfg;
    }

    const config_t &config()
    {
        static const config_t cfg = config_t::from_env();
        return cfg;
    }

    void log(const level lev, const std::string &msg)
    {
        get().log(to_spdlog(lev), msg);
    }
}
