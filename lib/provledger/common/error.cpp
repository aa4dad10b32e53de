/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cerrno>
#include <system_error>
#include <typeinfo>
#include "error.hpp"
#include "format.hpp"

namespace provledger {
    error::error(const std::string_view msg):
        _causes { std::string { msg } },
        _msg { msg }
    {
    }

    error::error(const std::string_view msg, const std::exception &cause):
        _causes { std::string { msg } },
        _msg { fmt::format("{} caused by {}: {}", msg, typeid(cause).name(), cause.what()) }
    {
        if (const auto *nested = dynamic_cast<const error *>(&cause); nested) {
            _causes.insert(_causes.end(), nested->_causes.begin(), nested->_causes.end());
        } else {
            _causes.emplace_back(cause.what());
        }
    }

    error_sys::error_sys(const std::string_view msg):
        error { msg, std::system_error { errno, std::generic_category() } }
    {
    }

        const char *error::what() const noexcept
    {
        return _msg.c_str();
    }
}
