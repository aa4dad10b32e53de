#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <span>
#include <string>
#include <vector>
#include <provledger/common/error.hpp>
#include <provledger/prov/model.hpp>
#include <provledger/storage/common.hpp>
#include "address.hpp"

namespace provledger::ledger {
    // A dirty output that the transaction did not declare as a dependency
    struct err_address_t final: error {
        explicit err_address_t(const address_t &addr);
    };

    struct processor_config_t {
        size_t workers = default_workers();

        // PROVLEDGER_WORKERS or the hardware concurrency when not set
        static size_t default_workers();
    };

    struct transaction_t {
        std::string id {};
        std::vector<prov::chronicle_operation_t> operations {};

        // the union of the dependencies of all operations in the first-mention order
        [[nodiscard]] address_list_t dependencies() const;
    };

    struct submission_result_t {
        std::string tx_id {};
        std::optional<prov::contradiction_t> contradiction {};
        // the union of the written fragments
        prov::prov_model_t delta {};
        address_list_t written {};

        [[nodiscard]] bool committed() const noexcept
        {
            return !contradiction.has_value();
        }
    };
    using submission_result_list_t = std::vector<submission_result_t>;

    // indices of transactions in a batch
    using wave_t = std::vector<size_t>;
    using wave_list_t = std::vector<wave_t>;

    // Transactions of a wave have pairwise disjoint dependencies and
    // each transaction is placed in a later wave than any earlier transaction it conflicts with
    extern wave_list_t schedule_waves(std::span<const transaction_t> txs);

    // Stores fragments under the string form of their address
    extern std::string storage_key(const address_t &addr);

    struct processor_t {
        explicit processor_t(storage::db_ptr_t db, processor_config_t config={});

        submission_result_t apply(const transaction_t &tx);
        submission_result_list_t apply_batch(std::span<const transaction_t> txs);

        [[nodiscard]] std::optional<prov::prov_model_t> load(const address_t &addr) const;
        // all stored fragments of a namespace combined
        [[nodiscard]] prov::prov_model_t namespace_model(const prov::namespace_id_t &ns) const;

        [[nodiscard]] const processor_config_t &config() const noexcept
        {
            return _config;
        }
    private:
        storage::db_ptr_t _db;
        processor_config_t _config;
    };
}
