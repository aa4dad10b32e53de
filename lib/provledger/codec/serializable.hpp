#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <concepts>
#include <map>
#include <optional>
#include <set>
#include <string_view>
#include <type_traits>

namespace provledger::codec {
    struct archive_t {
    };

    template<typename T>
    concept serializable_c = requires(T t, archive_t a)
    {
        { t.serialize(a) } -> std::same_as<void>;
    };

    template<typename T>
    concept optional_c = requires(T t)
    {
        { t.has_value() } -> std::same_as<bool>;
        { t.reset() };
        { t.emplace() };
    };

    template<typename T>
    concept map_c = requires(T t)
    {
        typename T::key_type;
        typename T::mapped_type;
        { t.try_emplace(std::declval<typename T::key_type>(), std::declval<typename T::mapped_type>()) };
    };

    template<typename T>
    concept set_c = !map_c<T> && requires(T t)
    {
        typename T::key_type;
        { t.emplace(std::declval<typename T::key_type>()) };
    };
}
