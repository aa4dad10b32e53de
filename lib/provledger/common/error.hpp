#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace provledger {
    // The root of all ledger failures. An error raised while handling a lower-level one keeps
    // the messages of the whole chain: the outermost message first, the root cause last.
    struct error: std::exception {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &cause);
        const char *what() const noexcept override;

        [[nodiscard]] const std::vector<std::string> &causes() const noexcept
        {
            return _causes;
        }

        [[nodiscard]] const std::string &root_cause() const noexcept
        {
            return _causes.back();
        }
    private:
        std::vector<std::string> _causes {};
        std::string _msg;
    };

    // Captures errno as the root cause
    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}
