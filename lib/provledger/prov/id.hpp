#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <boost/json.hpp>
#include <boost/uuid/uuid.hpp>
#include <provledger/codec/json.hpp>
#include <provledger/common/error.hpp>
#include <provledger/common/format.hpp>

namespace provledger::prov {
    using namespace std::string_view_literals;

    static constexpr std::string_view iri_prefix = "chronicle:"sv;

    struct err_parse_iri_t final: error {
        explicit err_parse_iri_t(std::string_view iri, std::string_view reason);
    };

    // Escapes every byte outside of [A-Za-z0-9-._~]
    extern std::string percent_encode(std::string_view text);
    extern std::string percent_decode(std::string_view text);

    using role_t = std::optional<std::string>;

    template<typename TAG>
    struct typed_id_t {
        static constexpr std::string_view kind = TAG::kind;

        std::string external_id {};

        static typed_id_t from_external_id(const std::string_view ext_id)
        {
            return { std::string { ext_id } };
        }

        static typed_id_t from_json(const boost::json::value &jv);

        [[nodiscard]] std::string iri() const
        {
            return fmt::format("{}{}:{}", iri_prefix, TAG::kind, percent_encode(external_id));
        }

        [[nodiscard]] boost::json::value to_json() const
        {
            return boost::json::value(iri());
        }

        bool operator==(const typed_id_t &o) const = default;
        std::strong_ordering operator<=>(const typed_id_t &o) const = default;
    };

    struct agent_tag_t {
        static constexpr std::string_view kind = "agent"sv;
    };
    using agent_id_t = typed_id_t<agent_tag_t>;

    struct activity_tag_t {
        static constexpr std::string_view kind = "activity"sv;
    };
    using activity_id_t = typed_id_t<activity_tag_t>;

    struct entity_tag_t {
        static constexpr std::string_view kind = "entity"sv;
    };
    using entity_id_t = typed_id_t<entity_tag_t>;

    struct domaintype_tag_t {
        static constexpr std::string_view kind = "domaintype"sv;
    };
    using domaintype_id_t = typed_id_t<domaintype_tag_t>;

    // An empty role or activity is the same fact as an absent one
    extern role_t normalize_role(const role_t &role);
    extern std::optional<activity_id_t> normalize_activity(const std::optional<activity_id_t> &activity);

    struct namespace_id_t {
        std::string external_id {};
        boost::uuids::uuid uuid {};

        static namespace_id_t from_external_id(std::string_view ext_id, const boost::uuids::uuid &uuid);
        static namespace_id_t from_json(const boost::json::value &jv);
        [[nodiscard]] std::string iri() const;

        [[nodiscard]] boost::json::value to_json() const
        {
            return boost::json::value(iri());
        }

        bool operator==(const namespace_id_t &o) const
        {
            return external_id == o.external_id && uuid == o.uuid;
        }

        std::strong_ordering operator<=>(const namespace_id_t &o) const
        {
            if (const auto cmp = external_id <=> o.external_id; cmp != 0)
                return cmp;
            if (uuid < o.uuid)
                return std::strong_ordering::less;
            if (o.uuid < uuid)
                return std::strong_ordering::greater;
            return std::strong_ordering::equal;
        }
    };

    struct identity_id_t {
        std::string agent_external_id {};
        std::string public_key {};

        static identity_id_t from_component_ids(const agent_id_t &agent, std::string_view public_key);
        static identity_id_t from_json(const boost::json::value &jv);
        [[nodiscard]] std::string iri() const;

        [[nodiscard]] boost::json::value to_json() const
        {
            return boost::json::value(iri());
        }

        bool operator==(const identity_id_t &o) const = default;
        std::strong_ordering operator<=>(const identity_id_t &o) const = default;
    };

    struct association_id_t {
        std::string agent_external_id {};
        std::string activity_external_id {};
        role_t role {};

        static association_id_t from_component_ids(const agent_id_t &agent, const activity_id_t &activity, const role_t &role);
        static association_id_t from_json(const boost::json::value &jv);
        [[nodiscard]] std::string iri() const;

        [[nodiscard]] boost::json::value to_json() const
        {
            return boost::json::value(iri());
        }

        bool operator==(const association_id_t &o) const = default;
        std::strong_ordering operator<=>(const association_id_t &o) const = default;
    };

    struct attribution_id_t {
        std::string agent_external_id {};
        std::string entity_external_id {};
        role_t role {};

        static attribution_id_t from_component_ids(const agent_id_t &agent, const entity_id_t &entity, const role_t &role);
        static attribution_id_t from_json(const boost::json::value &jv);
        [[nodiscard]] std::string iri() const;

        [[nodiscard]] boost::json::value to_json() const
        {
            return boost::json::value(iri());
        }

        bool operator==(const attribution_id_t &o) const = default;
        std::strong_ordering operator<=>(const attribution_id_t &o) const = default;
    };

    struct delegation_id_t {
        std::string delegate_external_id {};
        std::string responsible_external_id {};
        role_t role {};
        std::optional<std::string> activity_external_id {};

        static delegation_id_t from_component_ids(const agent_id_t &delegate, const agent_id_t &responsible,
            const std::optional<activity_id_t> &activity, const role_t &role);
        static delegation_id_t from_json(const boost::json::value &jv);
        [[nodiscard]] std::string iri() const;

        [[nodiscard]] boost::json::value to_json() const
        {
            return boost::json::value(iri());
        }

        bool operator==(const delegation_id_t &o) const = default;
        std::strong_ordering operator<=>(const delegation_id_t &o) const = default;
    };

    using chronicle_iri_base_t = std::variant<namespace_id_t, agent_id_t, activity_id_t, entity_id_t, domaintype_id_t,
        identity_id_t, association_id_t, attribution_id_t, delegation_id_t>;

    struct chronicle_iri_t: chronicle_iri_base_t {
        using base_type = chronicle_iri_base_t;
        using base_type::base_type;

        static chronicle_iri_t parse(std::string_view iri);
        static chronicle_iri_t from_json(const boost::json::value &jv);
        [[nodiscard]] std::string iri() const;
        [[nodiscard]] std::string_view kind() const;

        [[nodiscard]] boost::json::value to_json() const
        {
            return boost::json::value(iri());
        }

        template<typename T>
        [[nodiscard]] const T &as(const std::string_view iri_text={}) const
        {
            if (const auto *v = std::get_if<T>(static_cast<const base_type *>(this)); v) [[likely]]
                return *v;
            throw err_parse_iri_t(iri_text.empty() ? iri() : iri_text, fmt::format("expected an identifier of a different kind than {}", kind()));
        }

        bool operator==(const chronicle_iri_t &o) const
        {
            return static_cast<const base_type &>(*this) == static_cast<const base_type &>(o);
        }

        std::strong_ordering operator<=>(const chronicle_iri_t &o) const
        {
            return static_cast<const base_type &>(*this) <=> static_cast<const base_type &>(o);
        }
    };

    template<typename TAG>
    typed_id_t<TAG> typed_id_t<TAG>::from_json(const boost::json::value &jv)
    {
        const auto text = codec::json::as_text(jv);
        return chronicle_iri_t::parse(text).as<typed_id_t<TAG>>(text);
    }

    template<typename T>
    concept iri_c = requires(const T t)
    {
        { t.iri() } -> std::same_as<std::string>;
    };
}

namespace fmt {
    template<provledger::prov::iri_c T>
    struct formatter<T>: formatter<int> {
        template<typename FormatContext>
        auto format(const T &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.iri());
        }
    };
}
