#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <variant>
#include <vector>
#include <provledger/common/error.hpp>
#include "attributes.hpp"
#include "id.hpp"
#include "time.hpp"

namespace provledger::prov {
    struct attribute_value_change_t {
        std::string name {};
        attribute_t value {};
        attribute_t attempted {};

        bool operator==(const attribute_value_change_t &o) const = default;
    };

    struct start_alteration_t {
        timestamp_t value {};
        timestamp_t attempted {};

        bool operator==(const start_alteration_t &o) const = default;
    };

    struct end_alteration_t {
        timestamp_t value {};
        timestamp_t attempted {};

        bool operator==(const end_alteration_t &o) const = default;
    };

    struct invalid_range_t {
        timestamp_t start {};
        timestamp_t end {};

        bool operator==(const invalid_range_t &o) const = default;
    };

    using contradiction_detail_t = std::variant<attribute_value_change_t, start_alteration_t, end_alteration_t, invalid_range_t>;
    using contradiction_details_t = std::vector<contradiction_detail_t>;

    // A new fact that conflicts with an already recorded one
    struct contradiction_t final: error {
        static contradiction_t start_date_alteration(chronicle_iri_t id, namespace_id_t ns, timestamp_t value, timestamp_t attempted);
        static contradiction_t end_date_alteration(chronicle_iri_t id, namespace_id_t ns, timestamp_t value, timestamp_t attempted);
        static contradiction_t invalid_range(chronicle_iri_t id, namespace_id_t ns, timestamp_t start, timestamp_t end);
        static contradiction_t attribute_value_change(chronicle_iri_t id, namespace_id_t ns, std::vector<attribute_value_change_t> changes);

        explicit contradiction_t(chronicle_iri_t id, namespace_id_t ns, contradiction_details_t details);

        [[nodiscard]] const chronicle_iri_t &id() const noexcept
        {
            return _id;
        }

        [[nodiscard]] const namespace_id_t &namespace_id() const noexcept
        {
            return _namespace_id;
        }

        [[nodiscard]] const contradiction_details_t &details() const noexcept
        {
            return _details;
        }

        bool operator==(const contradiction_t &o) const
        {
            return _id == o._id && _namespace_id == o._namespace_id && _details == o._details;
        }
    private:
        chronicle_iri_t _id;
        namespace_id_t _namespace_id;
        contradiction_details_t _details;
    };
}

namespace fmt {
    template<>
    struct formatter<provledger::prov::contradiction_detail_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using namespace provledger::prov;
            return std::visit([&](const auto &d) {
                using T = std::decay_t<decltype(d)>;
                if constexpr (std::is_same_v<T, attribute_value_change_t>) {
                    return fmt::format_to(ctx.out(), "attribute value change: {} {} {}", d.name, d.value, d.attempted);
                } else if constexpr (std::is_same_v<T, start_alteration_t>) {
                    return fmt::format_to(ctx.out(), "start date alteration: {} {}", d.value, d.attempted);
                } else if constexpr (std::is_same_v<T, end_alteration_t>) {
                    return fmt::format_to(ctx.out(), "end date alteration: {} {}", d.value, d.attempted);
                } else if constexpr (std::is_same_v<T, invalid_range_t>) {
                    return fmt::format_to(ctx.out(), "invalid range: {} {}", d.start, d.end);
                } else {
                    static_assert(sizeof(T) == 0, "unsupported contradiction detail");
                }
            }, v);
        }
    };

    template<>
    struct formatter<provledger::prov::contradiction_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.what());
        }
    };
}
