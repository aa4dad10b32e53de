#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string_view>
#include <variant>
#include "attributes.hpp"
#include "id.hpp"
#include "records.hpp"
#include "time.hpp"

namespace provledger::prov {
    struct create_namespace_t {
        namespace_id_t id {};

        bool operator==(const create_namespace_t &o) const = default;
    };

    struct agent_exists_t {
        namespace_id_t namespace_id {};
        agent_id_t id {};

        bool operator==(const agent_exists_t &o) const = default;
    };

    struct activity_exists_t {
        namespace_id_t namespace_id {};
        activity_id_t id {};

        bool operator==(const activity_exists_t &o) const = default;
    };

    struct entity_exists_t {
        namespace_id_t namespace_id {};
        entity_id_t id {};

        bool operator==(const entity_exists_t &o) const = default;
    };

    struct register_key_t {
        namespace_id_t namespace_id {};
        agent_id_t id {};
        std::string public_key {};

        [[nodiscard]] identity_id_t identity_id() const
        {
            return identity_id_t::from_component_ids(id, public_key);
        }

        bool operator==(const register_key_t &o) const = default;
    };

    struct acts_on_behalf_of_t {
        namespace_id_t namespace_id {};
        agent_id_t delegate_id {};
        agent_id_t responsible_id {};
        std::optional<activity_id_t> activity_id {};
        role_t role {};

        [[nodiscard]] delegation_id_t id() const
        {
            return delegation_id_t::from_component_ids(delegate_id, responsible_id, activity_id, role);
        }

        bool operator==(const acts_on_behalf_of_t &o) const = default;
    };

    struct start_activity_t {
        namespace_id_t namespace_id {};
        activity_id_t id {};
        timestamp_t time {};

        bool operator==(const start_activity_t &o) const = default;
    };

    struct end_activity_t {
        namespace_id_t namespace_id {};
        activity_id_t id {};
        timestamp_t time {};

        bool operator==(const end_activity_t &o) const = default;
    };

    struct activity_uses_t {
        namespace_id_t namespace_id {};
        entity_id_t id {};
        activity_id_t activity {};

        bool operator==(const activity_uses_t &o) const = default;
    };

    struct was_generated_by_t {
        namespace_id_t namespace_id {};
        entity_id_t id {};
        activity_id_t activity {};

        bool operator==(const was_generated_by_t &o) const = default;
    };

    struct was_informed_by_t {
        namespace_id_t namespace_id {};
        activity_id_t activity {};
        activity_id_t informing_activity {};

        bool operator==(const was_informed_by_t &o) const = default;
    };

    struct was_associated_with_t {
        namespace_id_t namespace_id {};
        activity_id_t activity_id {};
        agent_id_t agent_id {};
        role_t role {};

        [[nodiscard]] association_id_t id() const
        {
            return association_id_t::from_component_ids(agent_id, activity_id, role);
        }

        bool operator==(const was_associated_with_t &o) const = default;
    };

    struct was_attributed_to_t {
        namespace_id_t namespace_id {};
        entity_id_t entity_id {};
        agent_id_t agent_id {};
        role_t role {};

        [[nodiscard]] attribution_id_t id() const
        {
            return attribution_id_t::from_component_ids(agent_id, entity_id, role);
        }

        bool operator==(const was_attributed_to_t &o) const = default;
    };

    struct entity_derive_t {
        namespace_id_t namespace_id {};
        entity_id_t id {};
        entity_id_t used_id {};
        std::optional<activity_id_t> activity_id {};
        derivation_type_t typ = derivation_type_t::none;

        bool operator==(const entity_derive_t &o) const = default;
    };

    struct set_agent_attributes_t {
        namespace_id_t namespace_id {};
        agent_id_t id {};
        attributes_t attributes {};

        bool operator==(const set_agent_attributes_t &o) const = default;
    };

    struct set_activity_attributes_t {
        namespace_id_t namespace_id {};
        activity_id_t id {};
        attributes_t attributes {};

        bool operator==(const set_activity_attributes_t &o) const = default;
    };

    struct set_entity_attributes_t {
        namespace_id_t namespace_id {};
        entity_id_t id {};
        attributes_t attributes {};

        bool operator==(const set_entity_attributes_t &o) const = default;
    };

    using chronicle_operation_t = std::variant<
        create_namespace_t,
        agent_exists_t,
        activity_exists_t,
        entity_exists_t,
        register_key_t,
        acts_on_behalf_of_t,
        start_activity_t,
        end_activity_t,
        activity_uses_t,
        was_generated_by_t,
        was_informed_by_t,
        was_associated_with_t,
        was_attributed_to_t,
        entity_derive_t,
        set_agent_attributes_t,
        set_activity_attributes_t,
        set_entity_attributes_t
    >;

    template<typename T>
    constexpr bool unsupported_operation_v = false;

    extern std::string_view operation_name(const chronicle_operation_t &op);
    extern const namespace_id_t &operation_namespace(const chronicle_operation_t &op);
}

namespace fmt {
    template<>
    struct formatter<provledger::prov::chronicle_operation_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{} in {}", provledger::prov::operation_name(v), provledger::prov::operation_namespace(v));
        }
    };
}
