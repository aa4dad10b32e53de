/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <fmt/ranges.h>
#include "contradiction.hpp"

namespace provledger::prov {
    static std::string describe(const chronicle_iri_t &id, const namespace_id_t &ns, const contradiction_details_t &details)
    {
        return fmt::format("Contradiction {{ {} }} on {} in {}", fmt::join(details, "; "), id, ns);
    }

    contradiction_t::contradiction_t(chronicle_iri_t id, namespace_id_t ns, contradiction_details_t details):
        error { describe(id, ns, details) },
        _id { std::move(id) },
        _namespace_id { std::move(ns) },
        _details { std::move(details) }
    {
    }

    contradiction_t contradiction_t::start_date_alteration(chronicle_iri_t id, namespace_id_t ns, const timestamp_t value, const timestamp_t attempted)
    {
        return contradiction_t { std::move(id), std::move(ns), { start_alteration_t { value, attempted } } };
    }

    contradiction_t contradiction_t::end_date_alteration(chronicle_iri_t id, namespace_id_t ns, const timestamp_t value, const timestamp_t attempted)
    {
        return contradiction_t { std::move(id), std::move(ns), { end_alteration_t { value, attempted } } };
    }

    contradiction_t contradiction_t::invalid_range(chronicle_iri_t id, namespace_id_t ns, const timestamp_t start, const timestamp_t end)
    {
        return contradiction_t { std::move(id), std::move(ns), { invalid_range_t { start, end } } };
    }

    contradiction_t contradiction_t::attribute_value_change(chronicle_iri_t id, namespace_id_t ns, std::vector<attribute_value_change_t> changes)
    {
        contradiction_details_t details {};
        details.reserve(changes.size());
        for (auto &&c: changes)
            details.emplace_back(std::move(c));
        return contradiction_t { std::move(id), std::move(ns), std::move(details) };
    }
}
