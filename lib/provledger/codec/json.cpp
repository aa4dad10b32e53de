/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <sstream>
#include "json.hpp"

namespace provledger::codec::json {
    object canonical(const object &obj)
    {
        std::vector<std::pair<std::string, value>> items {};
        items.reserve(obj.size());
        for (const auto &[k, v]: obj)
            items.emplace_back(k, canonical(v));
        std::sort(items.begin(), items.end(), [](const auto &l, const auto &r) { return l.first < r.first; } );
        object res {};
        for (auto &&[k, v]: items) {
            res.emplace(std::move(k), std::move(v));
        }
        return res;
    }

    value canonical(const value &jv)
    {
        switch (jv.kind()) {
            case kind::object:
                return canonical(jv.get_object());
            case kind::array: {
                array res {};
                res.reserve(jv.get_array().size());
                for (const auto &item: jv.get_array())
                    res.emplace_back(canonical(item));
                return res;
            }
            default:
                return jv;
        }
    }

    std::string serialize_canon(const value &jv)
    {
        return serialize(canonical(jv));
    }

    value parse(const std::string_view text)
    {
        try {
            return boost::json::parse(text);
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to parse a json document of {} bytes", text.size()), ex);
        }
    }

    void save_pretty(std::ostream& os, value const &jv, std::string *indent)
    {
        static constexpr size_t indent_step = 2;
        std::string indent_ {};
        if(!indent)
            indent = &indent_;
        switch (jv.kind()) {
            case kind::object: {
                const auto &obj = jv.get_object();
                if (obj.empty()) {
                    os << "{}";
                    break;
                }
                os << "{\n";
                indent->append(indent_step, ' ');
                for (auto it = obj.begin(), last = std::prev(obj.end()); it != obj.end(); ++it) {
                    os << *indent << json::serialize(it->key()) << ": ";
                    save_pretty(os, it->value(), indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "}";
                break;
            }
            case kind::array: {
                const auto &arr = jv.get_array();
                if (arr.empty()) {
                    os << "[]";
                    break;
                }
                os << "[\n";
                indent->append(indent_step, ' ');
                for (auto it = arr.begin(), last = std::prev(arr.end()); it != arr.end(); ++it) {
                    os << *indent;
                    save_pretty(os, *it, indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "]";
                break;
            }
            case kind::string:
                os << serialize(jv.get_string());
                break;
            case kind::uint64:
                os << jv.get_uint64();
                break;
            case kind::int64:
                os << jv.get_int64();
                break;
            case kind::double_:
                os << jv.get_double();
                break;
            case kind::bool_:
                if(jv.get_bool())
                    os << "true";
                else
                    os << "false";
                break;
            case kind::null:
                os << "null";
                break;
        }
    }

    std::string serialize_pretty(const value &jv)
    {
        std::ostringstream ss {};
        save_pretty(ss, jv);
        return ss.str();
    }
}
