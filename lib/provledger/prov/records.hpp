#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <boost/uuid/uuid.hpp>
#include "attributes.hpp"
#include "id.hpp"
#include "time.hpp"

namespace provledger::prov {
    struct namespace_t {
        namespace_id_t id {};
        boost::uuids::uuid uuid {};
        std::string external_id {};

        static namespace_t from_id(const namespace_id_t &id)
        {
            return { id, id.uuid, id.external_id };
        }

        void serialize(auto &archive)
        {
            archive.process("id"sv, id);
            archive.process("uuid"sv, uuid);
            archive.process("external_id"sv, external_id);
        }

        bool operator==(const namespace_t &o) const
        {
            return id == o.id && uuid == o.uuid && external_id == o.external_id;
        }
    };

    struct agent_t {
        agent_id_t id {};
        namespace_id_t namespace_id {};
        std::string external_id {};
        std::optional<domaintype_id_t> domaintype_id {};
        attribute_map_t attributes {};

        static agent_t exists(const namespace_id_t &ns, const agent_id_t &id)
        {
            return { id, ns, id.external_id, {}, {} };
        }

        void serialize(auto &archive)
        {
            archive.process("id"sv, id);
            archive.process("namespace_id"sv, namespace_id);
            archive.process("external_id"sv, external_id);
            archive.process("domaintype_id"sv, domaintype_id);
            archive.process("attributes"sv, attributes);
        }

        bool operator==(const agent_t &o) const = default;
    };

    struct activity_t {
        activity_id_t id {};
        namespace_id_t namespace_id {};
        std::string external_id {};
        std::optional<domaintype_id_t> domaintype_id {};
        attribute_map_t attributes {};
        std::optional<timestamp_t> started {};
        std::optional<timestamp_t> ended {};

        static activity_t exists(const namespace_id_t &ns, const activity_id_t &id)
        {
            return { id, ns, id.external_id, {}, {}, {}, {} };
        }

        void serialize(auto &archive)
        {
            archive.process("id"sv, id);
            archive.process("namespace_id"sv, namespace_id);
            archive.process("external_id"sv, external_id);
            archive.process("domaintype_id"sv, domaintype_id);
            archive.process("attributes"sv, attributes);
            archive.process("started"sv, started);
            archive.process("ended"sv, ended);
        }

        bool operator==(const activity_t &o) const = default;
    };

    struct entity_t {
        entity_id_t id {};
        namespace_id_t namespace_id {};
        std::string external_id {};
        std::optional<domaintype_id_t> domaintype_id {};
        attribute_map_t attributes {};

        static entity_t exists(const namespace_id_t &ns, const entity_id_t &id)
        {
            return { id, ns, id.external_id, {}, {} };
        }

        void serialize(auto &archive)
        {
            archive.process("id"sv, id);
            archive.process("namespace_id"sv, namespace_id);
            archive.process("external_id"sv, external_id);
            archive.process("domaintype_id"sv, domaintype_id);
            archive.process("attributes"sv, attributes);
        }

        bool operator==(const entity_t &o) const = default;
    };

    struct identity_t {
        identity_id_t id {};
        namespace_id_t namespace_id {};
        std::string public_key {};

        void serialize(auto &archive)
        {
            archive.process("id"sv, id);
            archive.process("namespace_id"sv, namespace_id);
            archive.process("public_key"sv, public_key);
        }

        bool operator==(const identity_t &o) const = default;
    };

    enum class derivation_type_t: uint8_t {
        none,
        revision,
        quotation,
        primary_source
    };

    constexpr derivation_type_t enum_max(derivation_type_t)
    {
        return derivation_type_t::primary_source;
    }

    struct derivation_t {
        entity_id_t generated_id {};
        entity_id_t used_id {};
        std::optional<activity_id_t> activity_id {};
        derivation_type_t typ = derivation_type_t::none;

        void serialize(auto &archive)
        {
            archive.process("generated_id"sv, generated_id);
            archive.process("used_id"sv, used_id);
            archive.process("activity_id"sv, activity_id);
            archive.process("typ"sv, typ);
        }

        bool operator==(const derivation_t &o) const = default;
        std::strong_ordering operator<=>(const derivation_t &o) const = default;
    };

    struct delegation_t {
        namespace_id_t namespace_id {};
        delegation_id_t id {};
        agent_id_t delegate_id {};
        agent_id_t responsible_id {};
        std::optional<activity_id_t> activity_id {};
        role_t role {};

        void serialize(auto &archive)
        {
            archive.process("namespace_id"sv, namespace_id);
            archive.process("id"sv, id);
            archive.process("delegate_id"sv, delegate_id);
            archive.process("responsible_id"sv, responsible_id);
            archive.process("activity_id"sv, activity_id);
            archive.process("role"sv, role);
        }

        bool operator==(const delegation_t &o) const = default;
        std::strong_ordering operator<=>(const delegation_t &o) const = default;
    };

    struct association_t {
        namespace_id_t namespace_id {};
        association_id_t id {};
        agent_id_t agent_id {};
        activity_id_t activity_id {};
        role_t role {};

        void serialize(auto &archive)
        {
            archive.process("namespace_id"sv, namespace_id);
            archive.process("id"sv, id);
            archive.process("agent_id"sv, agent_id);
            archive.process("activity_id"sv, activity_id);
            archive.process("role"sv, role);
        }

        bool operator==(const association_t &o) const = default;
        std::strong_ordering operator<=>(const association_t &o) const = default;
    };

    struct attribution_t {
        namespace_id_t namespace_id {};
        attribution_id_t id {};
        agent_id_t agent_id {};
        entity_id_t entity_id {};
        role_t role {};

        void serialize(auto &archive)
        {
            archive.process("namespace_id"sv, namespace_id);
            archive.process("id"sv, id);
            archive.process("agent_id"sv, agent_id);
            archive.process("entity_id"sv, entity_id);
            archive.process("role"sv, role);
        }

        bool operator==(const attribution_t &o) const = default;
        std::strong_ordering operator<=>(const attribution_t &o) const = default;
    };

    struct usage_t {
        activity_id_t activity_id {};
        entity_id_t entity_id {};

        void serialize(auto &archive)
        {
            archive.process("activity_id"sv, activity_id);
            archive.process("entity_id"sv, entity_id);
        }

        bool operator==(const usage_t &o) const = default;
        std::strong_ordering operator<=>(const usage_t &o) const = default;
    };

    // Entity side of a generation
    struct generation_t {
        activity_id_t activity_id {};
        entity_id_t generated_id {};

        void serialize(auto &archive)
        {
            archive.process("activity_id"sv, activity_id);
            archive.process("generated_id"sv, generated_id);
        }

        bool operator==(const generation_t &o) const = default;
        std::strong_ordering operator<=>(const generation_t &o) const = default;
    };

    // Activity side of a generation
    struct generated_entity_t {
        entity_id_t entity_id {};
        activity_id_t generated_id {};

        void serialize(auto &archive)
        {
            archive.process("entity_id"sv, entity_id);
            archive.process("generated_id"sv, generated_id);
        }

        bool operator==(const generated_entity_t &o) const = default;
        std::strong_ordering operator<=>(const generated_entity_t &o) const = default;
    };
}
