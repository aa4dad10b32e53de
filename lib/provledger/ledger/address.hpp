#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <string>
#include <vector>
#include <provledger/prov/id.hpp>
#include <provledger/prov/operations.hpp>

namespace provledger::ledger {
    // An independently storable slice of ledger state.
    // Namespace records themselves have no namespace component.
    struct address_t {
        std::optional<prov::namespace_id_t> namespace_id {};
        prov::chronicle_iri_t resource {};

        static address_t for_namespace(const prov::namespace_id_t &ns)
        {
            return { {}, prov::chronicle_iri_t { ns } };
        }

        static address_t in_namespace(const prov::namespace_id_t &ns, prov::chronicle_iri_t resource)
        {
            return { ns, std::move(resource) };
        }

        [[nodiscard]] std::string to_string() const;

        bool operator==(const address_t &o) const = default;
        std::strong_ordering operator<=>(const address_t &o) const = default;
    };
    using address_list_t = std::vector<address_t>;

    // Every address an operation reads or writes, in first-mention order without duplicates
    extern address_list_t dependencies(const prov::chronicle_operation_t &op);
}

namespace fmt {
    template<>
    struct formatter<provledger::ledger::address_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}
