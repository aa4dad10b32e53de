/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <future>
#include <map>
#include <set>
#include <thread>
#include <provledger/codec/json.hpp>
#include <provledger/common/logger.hpp>
#include <provledger/storage/update.hpp>
#include "operation-state.hpp"
#include "process.hpp"
#include "processor.hpp"

namespace provledger::ledger {
    using namespace prov;

    namespace {
        std::optional<prov_model_t> load_fragment(const storage::db_t &db, const address_t &addr)
        {
            if (const auto data = db.get(storage_key(addr)); data) {
                try {
                    return codec::json::load<prov_model_t>(*data);
                } catch (const std::exception &ex) {
                    throw error(fmt::format("the stored state of {} cannot be decoded", addr), ex);
                }
            }
            return {};
        }

        // Validates a transaction against the db and writes its dirty outputs into it.
        // Nothing is written when the transaction is contradicted.
        submission_result_t validate(storage::db_t &db, const transaction_t &tx)
        {
            const auto deps = tx.dependencies();
            operation_state_t<address_t> state {};
            {
                std::vector<operation_state_t<address_t>::item_t> loaded {};
                loaded.reserve(deps.size());
                for (const auto &addr: deps)
                    loaded.emplace_back(addr, load_fragment(db, addr));
                state.update_state(loaded);
            }

            submission_result_t res { .tx_id = tx.id };
            prov_model_t model {};
            for (const auto &op: tx.operations) {
                try {
                    auto [outputs, updated_model] = process(op, std::move(model), state.input());
                    state.update_state(outputs);
                    model = std::move(updated_model);
                } catch (const contradiction_t &ex) {
                    logger::info("transaction {} is rejected at {}: {}", tx.id, op, ex.what());
                    res.contradiction.emplace(ex);
                    return res;
                }
            }

            auto dirty = std::move(state).dirty();
            const std::set<address_t> dep_set { deps.begin(), deps.end() };
            for (const auto &out: dirty) {
                if (!dep_set.contains(out.address)) [[unlikely]]
                    throw err_address_t { out.address };
            }
            for (auto &&out: dirty) {
                db.set(storage_key(out.address), codec::json::save(out.data));
                res.delta.combine(out.data);
                res.written.emplace_back(std::move(out.address));
            }
            logger::debug("transaction {} with {} operations is accepted, {} addresses written", tx.id, tx.operations.size(), res.written.size());
            return res;
        }
    }

    err_address_t::err_address_t(const address_t &addr):
        error { fmt::format("an output address {} is not among the dependencies of its transaction", addr) }
    {
    }

    size_t processor_config_t::default_workers()
    {
        if (const char *env = std::getenv("PROVLEDGER_WORKERS"); env) {
            const std::string_view text { env };
            size_t workers = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), workers);
            if (ec != std::errc {} || ptr != text.data() + text.size() || workers == 0) [[unlikely]]
                throw error(fmt::format("PROVLEDGER_WORKERS must be a positive integer but got '{}'", text));
            return workers;
        }
        return std::max(size_t { 1 }, static_cast<size_t>(std::thread::hardware_concurrency()));
    }

    address_list_t transaction_t::dependencies() const
    {
        address_list_t deps {};
        std::set<address_t> known {};
        for (const auto &op: operations) {
            for (auto &&addr: ledger::dependencies(op)) {
                if (known.emplace(addr).second)
                    deps.emplace_back(std::move(addr));
            }
        }
        return deps;
    }

    wave_list_t schedule_waves(const std::span<const transaction_t> txs)
    {
        wave_list_t waves {};
        // the earliest wave a transaction touching the address may join
        std::map<address_t, size_t> next_wave {};
        for (size_t i = 0; i < txs.size(); ++i) {
            const auto deps = txs[i].dependencies();
            size_t wave = 0;
            for (const auto &addr: deps) {
                if (const auto it = next_wave.find(addr); it != next_wave.end())
                    wave = std::max(wave, it->second);
            }
            for (const auto &addr: deps)
                next_wave.insert_or_assign(addr, wave + 1);
            if (wave >= waves.size())
                waves.resize(wave + 1);
            waves[wave].emplace_back(i);
        }
        return waves;
    }

    std::string storage_key(const address_t &addr)
    {
        return addr.to_string();
    }

    processor_t::processor_t(storage::db_ptr_t db, processor_config_t config):
        _db { std::move(db) },
        _config { std::move(config) }
    {
        if (!_db) [[unlikely]]
            throw error("processor_t requires a storage db!");
        if (_config.workers == 0) [[unlikely]]
            throw error("processor_t requires at least one worker!");
        logger::debug("ledger processor created with {} workers", _config.workers);
    }

    submission_result_t processor_t::apply(const transaction_t &tx)
    {
        storage::update::db_t overlay { _db };
        auto res = validate(overlay, tx);
        if (res.committed())
            overlay.commit();
        return res;
    }

    submission_result_list_t processor_t::apply_batch(const std::span<const transaction_t> txs)
    {
        submission_result_list_t results(txs.size());
        const auto waves = schedule_waves(txs);
        logger::debug("apply_batch: {} transactions scheduled into {} waves", txs.size(), waves.size());
        for (const auto &wave: waves) {
            std::vector<std::unique_ptr<storage::update::db_t>> overlays {};
            overlays.reserve(wave.size());
            for (size_t start = 0; start < wave.size(); start += _config.workers) {
                const auto end = std::min(wave.size(), start + _config.workers);
                std::vector<std::future<submission_result_t>> futures {};
                futures.reserve(end - start);
                for (size_t i = start; i < end; ++i) {
                    auto &overlay = *overlays.emplace_back(std::make_unique<storage::update::db_t>(_db));
                    const auto &tx = txs[wave[i]];
                    futures.emplace_back(std::async(std::launch::async, [&overlay, &tx] {
                        return validate(overlay, tx);
                    }));
                }
                for (size_t i = start; i < end; ++i)
                    results[wave[i]] = futures[i - start].get();
            }
            // wave items are in the submission order
            for (size_t i = 0; i < wave.size(); ++i) {
                if (results[wave[i]].committed())
                    overlays[i]->commit();
            }
        }
        return results;
    }

    std::optional<prov_model_t> processor_t::load(const address_t &addr) const
    {
        return load_fragment(*_db, addr);
    }

    prov_model_t processor_t::namespace_model(const namespace_id_t &ns) const
    {
        prov_model_t model {};
        const auto ns_key = storage_key(address_t::for_namespace(ns));
        const auto prefix = ns_key + ":";
        _db->foreach([&](const auto &k, const auto &v) {
            if (k == ns_key || k.starts_with(prefix))
                model.combine(codec::json::load<prov_model_t>(v));
        });
        return model;
    }
}
