#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace provledger::storage {
    using value_t = std::optional<std::string>;
    using observer_t = std::function<void(const std::string &, const std::string &)>;

    struct db_t {
        virtual ~db_t() = default;
        virtual void clear() = 0;
        virtual void erase(std::string_view key) = 0;
        // visits the items in the ascending order of their keys
        virtual void foreach(const observer_t &) const = 0;
        [[nodiscard]] virtual value_t get(std::string_view key) const = 0;
        virtual void set(std::string_view key, std::string_view val) = 0;
        [[nodiscard]] virtual size_t size() const = 0;

        [[nodiscard]] bool empty() const
        {
            return size() == 0;
        }

        [[nodiscard]] bool operator==(const db_t &o) const
        {
            if (size() != o.size())
                return false;
            size_t num_mismatches = 0;
            foreach([&](const auto &k, const auto &v) {
                if (o.get(k) != v)
                    ++num_mismatches;
            });
            return num_mismatches == 0;
        }
    };
    using db_ptr_t = std::shared_ptr<db_t>;
}
