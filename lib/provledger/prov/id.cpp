/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <vector>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "id.hpp"

namespace provledger::prov {
    namespace {
        bool unreserved(const char c)
        {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
                || c == '-' || c == '.' || c == '_' || c == '~';
        }

        int hex_digit(const char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            return -1;
        }

        std::vector<std::string_view> split(const std::string_view text, const char sep)
        {
            std::vector<std::string_view> parts {};
            size_t start = 0;
            for (;;) {
                const auto pos = text.find(sep, start);
                if (pos == std::string_view::npos) {
                    parts.emplace_back(text.substr(start));
                    break;
                }
                parts.emplace_back(text.substr(start, pos - start));
                start = pos + 1;
            }
            return parts;
        }

        std::string decode_component(const std::string_view iri, const std::string_view part)
        {
            try {
                return percent_decode(part);
            } catch (const error &ex) {
                throw err_parse_iri_t(iri, ex.what());
            }
        }

        std::string_view expect_prefixed(const std::string_view iri, const std::string_view part, const std::string_view prefix)
        {
            if (!part.starts_with(prefix)) [[unlikely]]
                throw err_parse_iri_t(iri, fmt::format("expected a component starting with '{}' but got '{}'", prefix, part));
            return part.substr(prefix.size());
        }

        role_t decode_role(const std::string_view iri, const std::string_view part)
        {
            const auto role = expect_prefixed(iri, part, "role="sv);
            if (role.empty())
                return {};
            return decode_component(iri, role);
        }

        std::string encode_optional(const std::optional<std::string> &val)
        {
            if (val)
                return percent_encode(*val);
            return {};
        }
    }

    err_parse_iri_t::err_parse_iri_t(const std::string_view iri, const std::string_view reason):
        error { fmt::format("invalid chronicle iri '{}': {}", iri, reason) }
    {
    }

    role_t normalize_role(const role_t &role)
    {
        if (role && role->empty())
            return {};
        return role;
    }

    std::optional<activity_id_t> normalize_activity(const std::optional<activity_id_t> &activity)
    {
        if (activity && activity->external_id.empty())
            return {};
        return activity;
    }

    std::string percent_encode(const std::string_view text)
    {
        static constexpr std::string_view hex_digits = "0123456789ABCDEF"sv;
        std::string res {};
        res.reserve(text.size());
        for (const char c: text) {
            if (unreserved(c)) {
                res += c;
            } else {
                const auto b = static_cast<uint8_t>(c);
                res += '%';
                res += hex_digits[b >> 4U];
                res += hex_digits[b & 0xFU];
            }
        }
        return res;
    }

    std::string percent_decode(const std::string_view text)
    {
        std::string res {};
        res.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] != '%') {
                res += text[i];
                continue;
            }
            if (i + 2 >= text.size()) [[unlikely]]
                throw error(fmt::format("a truncated percent escape at position {}", i));
            const auto hi = hex_digit(text[i + 1]);
            const auto lo = hex_digit(text[i + 2]);
            if (hi < 0 || lo < 0) [[unlikely]]
                throw error(fmt::format("an invalid percent escape at position {}", i));
            res += static_cast<char>((hi << 4) | lo);
            i += 2;
        }
        return res;
    }

    namespace_id_t namespace_id_t::from_external_id(const std::string_view ext_id, const boost::uuids::uuid &uuid)
    {
        return { std::string { ext_id }, uuid };
    }

    namespace_id_t namespace_id_t::from_json(const boost::json::value &jv)
    {
        const auto text = codec::json::as_text(jv);
        return chronicle_iri_t::parse(text).as<namespace_id_t>(text);
    }

    std::string namespace_id_t::iri() const
    {
        return fmt::format("{}ns:{}:{}", iri_prefix, percent_encode(external_id), boost::uuids::to_string(uuid));
    }

    identity_id_t identity_id_t::from_component_ids(const agent_id_t &agent, const std::string_view public_key)
    {
        return { agent.external_id, std::string { public_key } };
    }

    identity_id_t identity_id_t::from_json(const boost::json::value &jv)
    {
        const auto text = codec::json::as_text(jv);
        return chronicle_iri_t::parse(text).as<identity_id_t>(text);
    }

    std::string identity_id_t::iri() const
    {
        return fmt::format("{}identity:{}:{}", iri_prefix, percent_encode(agent_external_id), percent_encode(public_key));
    }

    association_id_t association_id_t::from_component_ids(const agent_id_t &agent, const activity_id_t &activity, const role_t &role)
    {
        return { agent.external_id, activity.external_id, normalize_role(role) };
    }

    association_id_t association_id_t::from_json(const boost::json::value &jv)
    {
        const auto text = codec::json::as_text(jv);
        return chronicle_iri_t::parse(text).as<association_id_t>(text);
    }

    std::string association_id_t::iri() const
    {
        return fmt::format("{}association:{}:{}:role={}", iri_prefix,
            percent_encode(agent_external_id), percent_encode(activity_external_id), encode_optional(role));
    }

    attribution_id_t attribution_id_t::from_component_ids(const agent_id_t &agent, const entity_id_t &entity, const role_t &role)
    {
        return { agent.external_id, entity.external_id, normalize_role(role) };
    }

    attribution_id_t attribution_id_t::from_json(const boost::json::value &jv)
    {
        const auto text = codec::json::as_text(jv);
        return chronicle_iri_t::parse(text).as<attribution_id_t>(text);
    }

    std::string attribution_id_t::iri() const
    {
        return fmt::format("{}attribution:{}:{}:role={}", iri_prefix,
            percent_encode(agent_external_id), percent_encode(entity_external_id), encode_optional(role));
    }

    delegation_id_t delegation_id_t::from_component_ids(const agent_id_t &delegate, const agent_id_t &responsible,
        const std::optional<activity_id_t> &activity, const role_t &role)
    {
        delegation_id_t id { delegate.external_id, responsible.external_id, normalize_role(role) };
        if (const auto act = normalize_activity(activity); act)
            id.activity_external_id = act->external_id;
        return id;
    }

    delegation_id_t delegation_id_t::from_json(const boost::json::value &jv)
    {
        const auto text = codec::json::as_text(jv);
        return chronicle_iri_t::parse(text).as<delegation_id_t>(text);
    }

    std::string delegation_id_t::iri() const
    {
        return fmt::format("{}delegation:{}:{}:role={}:activity={}", iri_prefix,
            percent_encode(delegate_external_id), percent_encode(responsible_external_id),
            encode_optional(role), encode_optional(activity_external_id));
    }

    chronicle_iri_t chronicle_iri_t::parse(const std::string_view iri)
    {
        if (!iri.starts_with(iri_prefix)) [[unlikely]]
            throw err_parse_iri_t(iri, fmt::format("missing the '{}' prefix", iri_prefix));
        const auto parts = split(iri.substr(iri_prefix.size()), ':');
        const auto kind = parts.at(0);
        const auto expect_parts = [&](const size_t num_parts) {
            if (parts.size() != num_parts) [[unlikely]]
                throw err_parse_iri_t(iri, fmt::format("a {} identifier must have {} components but has {}", kind, num_parts - 1, parts.size() - 1));
        };
        if (kind == "ns"sv) {
            expect_parts(3);
            boost::uuids::uuid uuid {};
            try {
                uuid = boost::uuids::string_generator {}(std::string { parts[2] });
            } catch (const std::exception &ex) {
                throw err_parse_iri_t(iri, fmt::format("an invalid uuid '{}': {}", parts[2], ex.what()));
            }
            return namespace_id_t { decode_component(iri, parts[1]), uuid };
        }
        if (kind == agent_tag_t::kind) {
            expect_parts(2);
            return agent_id_t { decode_component(iri, parts[1]) };
        }
        if (kind == activity_tag_t::kind) {
            expect_parts(2);
            return activity_id_t { decode_component(iri, parts[1]) };
        }
        if (kind == entity_tag_t::kind) {
            expect_parts(2);
            return entity_id_t { decode_component(iri, parts[1]) };
        }
        if (kind == domaintype_tag_t::kind) {
            expect_parts(2);
            return domaintype_id_t { decode_component(iri, parts[1]) };
        }
        if (kind == "identity"sv) {
            expect_parts(3);
            return identity_id_t { decode_component(iri, parts[1]), decode_component(iri, parts[2]) };
        }
        if (kind == "association"sv) {
            expect_parts(4);
            return association_id_t { decode_component(iri, parts[1]), decode_component(iri, parts[2]), decode_role(iri, parts[3]) };
        }
        if (kind == "attribution"sv) {
            expect_parts(4);
            return attribution_id_t { decode_component(iri, parts[1]), decode_component(iri, parts[2]), decode_role(iri, parts[3]) };
        }
        if (kind == "delegation"sv) {
            expect_parts(5);
            delegation_id_t id { decode_component(iri, parts[1]), decode_component(iri, parts[2]), decode_role(iri, parts[3]) };
            if (const auto activity = expect_prefixed(iri, parts[4], "activity="sv); !activity.empty())
                id.activity_external_id = decode_component(iri, activity);
            return id;
        }
        throw err_parse_iri_t(iri, fmt::format("an unsupported identifier kind '{}'", kind));
    }

    chronicle_iri_t chronicle_iri_t::from_json(const boost::json::value &jv)
    {
        return parse(codec::json::as_text(jv));
    }

    std::string chronicle_iri_t::iri() const
    {
        return std::visit([](const auto &id) {
            return id.iri();
        }, static_cast<const base_type &>(*this));
    }

    std::string_view chronicle_iri_t::kind() const
    {
        return std::visit([](const auto &id) -> std::string_view {
            using T = std::decay_t<decltype(id)>;
            if constexpr (std::is_same_v<T, namespace_id_t>) {
                return "ns"sv;
            } else if constexpr (std::is_same_v<T, identity_id_t>) {
                return "identity"sv;
            } else if constexpr (std::is_same_v<T, association_id_t>) {
                return "association"sv;
            } else if constexpr (std::is_same_v<T, attribution_id_t>) {
                return "attribution"sv;
            } else if constexpr (std::is_same_v<T, delegation_id_t>) {
                return "delegation"sv;
            } else {
                return T::kind;
            }
        }, static_cast<const base_type &>(*this));
    }
}
