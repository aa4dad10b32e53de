#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <optional>
#include <string>
#include <boost/json.hpp>
#include "id.hpp"

namespace provledger::prov {
    // An opaque typed value compared only for exact equality
    struct attribute_t {
        std::string typ {};
        boost::json::value value {};

        void serialize(auto &archive)
        {
            archive.process("typ"sv, typ);
            archive.process("value"sv, value);
        }

        bool operator==(const attribute_t &o) const
        {
            return typ == o.typ && value == o.value;
        }
    };
    using attribute_map_t = std::map<std::string, attribute_t>;

    struct attributes_t {
        std::optional<domaintype_id_t> typ {};
        attribute_map_t items {};

        void serialize(auto &archive)
        {
            archive.process("typ"sv, typ);
            archive.process("items"sv, items);
        }

        bool operator==(const attributes_t &o) const = default;
    };
}

namespace fmt {
    template<>
    struct formatter<provledger::prov::attribute_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}: {}", v.typ, boost::json::serialize(v.value));
        }
    };
}
