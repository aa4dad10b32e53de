#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <ostream>
#include <string>
#include <typeinfo>
#include <boost/json.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/string_generator.hpp>
#include <provledger/common/error.hpp>
#include <provledger/common/format.hpp>
#include "serializable.hpp"

namespace provledger::codec::json {
    using namespace boost::json;

    template<typename T>
    concept from_json_c = requires(T t, boost::json::value jv)
    {
        { T::from_json(jv) };
    };

    template<typename T>
    concept to_json_c = requires(const T t)
    {
        { t.to_json() } -> std::convertible_to<boost::json::value>;
    };

    // Returns a copy with the keys of every nested object sorted
    extern value canonical(const value &jv);
    extern object canonical(const object &obj);
    extern std::string serialize_canon(const value &jv);
    extern value parse(std::string_view text);
    extern void save_pretty(std::ostream& os, value const &jv, std::string *indent = nullptr);
    extern std::string serialize_pretty(const value &jv);

    inline std::string_view as_text(const value &jv)
    {
        if (!jv.is_string()) [[unlikely]]
            throw error(fmt::format("expected a json string but got: {}", serialize(jv)));
        const auto &s = jv.get_string();
        return { s.data(), s.size() };
    }

    struct encoder: archive_t {
        template<typename T>
        static value encode(const T &val)
        {
            if constexpr (to_json_c<T>) {
                return val.to_json();
            } else if constexpr (serializable_c<T>) {
                encoder enc {};
                // the encoder does not modify the value, so const_cast is safe here
                const_cast<T &>(val).serialize(enc);
                return std::move(enc._obj);
            } else if constexpr (optional_c<T>) {
                if (val.has_value())
                    return encode(*val);
                return nullptr;
            } else if constexpr (map_c<T>) {
                array arr {};
                arr.reserve(val.size());
                for (const auto &[k, v]: val) {
                    object item {};
                    item.emplace("key", encode(k));
                    item.emplace("value", encode(v));
                    arr.emplace_back(std::move(item));
                }
                return arr;
            } else if constexpr (set_c<T>) {
                array arr {};
                arr.reserve(val.size());
                for (const auto &v: val)
                    arr.emplace_back(encode(v));
                return arr;
            } else if constexpr (std::is_same_v<T, value>) {
                return val;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return value(std::string_view { val });
            } else if constexpr (std::is_same_v<T, boost::uuids::uuid>) {
                return value(boost::uuids::to_string(val));
            } else if constexpr (std::is_enum_v<T>) {
                return value(static_cast<uint64_t>(val));
            } else if constexpr (std::is_same_v<T, uint8_t>
                    || std::is_same_v<T, uint16_t>
                    || std::is_same_v<T, uint32_t>
                    || std::is_same_v<T, uint64_t>
                    || std::is_same_v<T, int64_t>
                    || std::is_same_v<T, bool>) {
                return value(val);
            } else {
                throw error(fmt::format("json serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        void process(const std::string_view name, const auto &val)
        {
            _obj.insert_or_assign(name, encode(val));
        }
    private:
        object _obj {};
    };

    struct decoder: archive_t {
        decoder(const boost::json::value &jv): _jv { jv }
        {
        }

        template<typename T>
        static void decode(const boost::json::value &jv, T &val)
        {
            if constexpr (from_json_c<T>) {
                val = T::from_json(jv);
            } else if constexpr (serializable_c<T>) {
                decoder dec { jv };
                val.serialize(dec);
            } else if constexpr (optional_c<T>) {
                val.reset();
                if (!jv.is_null()) {
                    val.emplace();
                    decode(jv, *val);
                }
            } else if constexpr (map_c<T>) {
                val.clear();
                for (const auto &item: jv.as_array()) {
                    typename T::key_type k {};
                    decode(item.at("key"), k);
                    typename T::mapped_type v {};
                    decode(item.at("value"), v);
                    const auto [it, created] = val.try_emplace(std::move(k), std::move(v));
                    if (!created) [[unlikely]]
                        throw error(fmt::format("a map contains non-unique items: {}", typeid(T).name()));
                }
            } else if constexpr (set_c<T>) {
                val.clear();
                for (const auto &item: jv.as_array()) {
                    typename T::key_type v {};
                    decode(item, v);
                    const auto [it, created] = val.emplace(std::move(v));
                    if (!created) [[unlikely]]
                        throw error(fmt::format("a set contains non-unique items: {}", typeid(T).name()));
                }
            } else if constexpr (std::is_same_v<T, value>) {
                val = jv;
            } else if constexpr (std::is_same_v<T, std::string>) {
                val = as_text(jv);
            } else if constexpr (std::is_same_v<T, boost::uuids::uuid>) {
                try {
                    val = boost::uuids::string_generator {}(std::string { as_text(jv) });
                } catch (const std::exception &ex) {
                    throw error(fmt::format("an invalid uuid: {}", serialize(jv)), ex);
                }
            } else if constexpr (std::is_enum_v<T>) {
                // enum_max is looked up next to the enum type
                using U = std::underlying_type_t<T>;
                const auto raw = boost::json::value_to<U>(jv);
                if (raw > static_cast<U>(enum_max(T {}))) [[unlikely]]
                    throw error(fmt::format("an out-of-range value {} for enum {}", static_cast<uint64_t>(raw), typeid(T).name()));
                val = static_cast<T>(raw);
            } else if constexpr (std::is_same_v<T, uint8_t>
                    || std::is_same_v<T, uint16_t>
                    || std::is_same_v<T, uint32_t>
                    || std::is_same_v<T, uint64_t>
                    || std::is_same_v<T, int64_t>
                    || std::is_same_v<T, bool>) {
                val = boost::json::value_to<T>(jv);
            } else {
                throw error(fmt::format("json serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        void process(const std::string_view name, auto &val)
        {
            using T = std::decay_t<decltype(val)>;
            const auto &jo = _jv.as_object();
            if (const auto it = jo.find(name); it != jo.end()) {
                decode(it->value(), val);
            } else {
                if constexpr (optional_c<T>) {
                    val.reset();
                } else {
                    throw error(fmt::format("missing a required field {} of type {}: {}", name, typeid(T).name(), serialize_pretty(jo)));
                }
            }
        }
    private:
        const boost::json::value &_jv;
    };

    template<typename T>
    value encode(const T &val)
    {
        return encoder::encode(val);
    }

    template<typename T>
    T decode(const value &jv)
    {
        T res {};
        decoder::decode(jv, res);
        return res;
    }

    template<typename T>
    std::string save(const T &val)
    {
        return serialize_canon(encode(val));
    }

    template<typename T>
    T load(const std::string_view text)
    {
        return decode<T>(parse(text));
    }
}
