/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef GRAPH_SENTINEL_JSON_HPP
#define GRAPH_SENTINEL_JSON_HPP

#include <limits>
#include <optional>
#include <ostream>
#include <sstream>
#include <boost/json.hpp>
#include <gs/file.hpp>

namespace graph_sentinel::json {
    using namespace boost::json;

    inline json::value parse(const std::string_view buf, json::storage_ptr sp={})
    {
        return boost::json::parse(buf, sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    // Integral values of a JSON document may be stored either as int64 or uint64
    inline std::optional<int64_t> as_integer(const json::value &v)
    {
        switch (v.kind()) {
            case json::kind::int64:
                return v.get_int64();
            case json::kind::uint64:
                if (v.get_uint64() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                    return {};
                return static_cast<int64_t>(v.get_uint64());
            default:
                return {};
        }
    }

    inline std::optional<double> as_number(const json::value &v)
    {
        switch (v.kind()) {
            case json::kind::int64:
                return static_cast<double>(v.get_int64());
            case json::kind::uint64:
                return static_cast<double>(v.get_uint64());
            case json::kind::double_:
                return v.get_double();
            default:
                return {};
        }
    }

    inline void save_pretty(std::ostream& os, json::value const &jv, std::string *indent = nullptr)
    {
        static constexpr size_t indent_step = 2;
        std::string indent_ {};
        if(!indent)
            indent = &indent_;
        switch (jv.kind()) {
            case json::kind::object: {
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
            case json::kind::array: {
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
            case json::kind::string:
                os << json::serialize(jv.get_string());
                break;
            case json::kind::uint64:
                os << jv.get_uint64();
                break;
            case json::kind::int64:
                os << jv.get_int64();
                break;
            case json::kind::double_:
                os << json::serialize(jv);
                break;
            case json::kind::bool_:
                if(jv.get_bool())
                    os << "true";
                else
                    os << "false";
                break;
            case json::kind::null:
                os << "null";
                break;
        }
    }

    inline std::string serialize_pretty(const json::value &jv)
    {
        std::ostringstream os {};
        save_pretty(os, jv);
        return os.str();
    }

    inline void save_pretty(const std::string &path, const json::value &jv)
    {
        file::write(path, serialize_pretty(jv));
    }
}

#endif // !GRAPH_SENTINEL_JSON_HPP
