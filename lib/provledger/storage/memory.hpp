#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "common.hpp"

namespace provledger::storage::memory {
    // Concurrent reads are safe as long as there are no concurrent writes
    struct db_t: storage::db_t {
        explicit db_t();
        ~db_t() override;
        void clear() override;
        void erase(std::string_view key) override;
        void foreach(const observer_t &) const override;
        value_t get(std::string_view key) const override;
        void set(std::string_view key, std::string_view val) override;
        [[nodiscard]] size_t size() const override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
