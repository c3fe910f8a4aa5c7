/**
 * @file Convert.cpp
 * @brief JSON and TOML conversion
 */

#include "gura/Convert.hpp"
#include "gura/Files.hpp"
#include "gura/Parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace gura {

// ---- Value -> JSON ---------------------------------------------------------

nlohmann::ordered_json to_json(const Value& value) {
    using nlohmann::ordered_json;

    switch (value.type()) {
        case ValueType::Null:
            return nullptr;
        case ValueType::Bool:
            return value.as_bool();
        case ValueType::Integer:
            return value.as_integer();
        case ValueType::BigInteger: {
            const BigInt big = value.as_big_integer();
            if (big >= 0 && big <= static_cast<BigInt>(std::numeric_limits<std::uint64_t>::max())) {
                return static_cast<std::uint64_t>(big);
            }
            return to_string(big);
        }
        case ValueType::Float:
            return value.as_float();
        case ValueType::String:
            return value.as_string();
        case ValueType::Array: {
            ordered_json arr = ordered_json::array();
            for (const auto& elem : value.as_array()) {
                arr.push_back(to_json(elem));
            }
            return arr;
        }
        case ValueType::Object: {
            ordered_json obj = ordered_json::object();
            for (const auto& [key, member] : value.as_object()) {
                obj[key] = to_json(member);
            }
            return obj;
        }
    }
    return nullptr;
}

Value from_json(const nlohmann::ordered_json& json) {
    if (json.is_null()) {
        return Value(nullptr);
    }
    if (json.is_boolean()) {
        return Value(json.get<bool>());
    }
    if (json.is_number_unsigned()) {
        const auto u = json.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Value(static_cast<std::int64_t>(u));
        }
        return Value(static_cast<BigInt>(u));
    }
    if (json.is_number_integer()) {
        return Value(json.get<std::int64_t>());
    }
    if (json.is_number_float()) {
        return Value(json.get<double>());
    }
    if (json.is_string()) {
        return Value(json.get<std::string>());
    }
    if (json.is_array()) {
        Value arr = Value::array();
        for (const auto& elem : json) {
            arr.push_back(from_json(elem));
        }
        return arr;
    }
    if (json.is_object()) {
        Value obj = Value::object();
        for (auto it = json.begin(); it != json.end(); ++it) {
            obj.insert(it.key(), from_json(it.value()));
        }
        return obj;
    }
    // Binary and discarded values: keep their JSON text
    return Value(json.dump());
}

// ---- Value -> TOML ---------------------------------------------------------

namespace {

    toml::array make_array(const Value& a);
    toml::table make_table(const Value& o);

    /**
     * @brief True if the integer fits the 64-bit TOML integer range
     */
    bool fits_toml_integer(BigInt big) {
        return big >= std::numeric_limits<std::int64_t>::min() &&
               big <= std::numeric_limits<std::int64_t>::max();
    }

    template <typename Sink>
    void emit_node(const Value& v, Sink&& sink) {
        switch (v.type()) {
            case ValueType::Null:
                // No TOML null: preserve as empty string
                sink(std::string{""});
                break;
            case ValueType::Bool:
                sink(v.as_bool());
                break;
            case ValueType::Integer:
                sink(v.as_integer());
                break;
            case ValueType::BigInteger:
                if (fits_toml_integer(v.as_big_integer())) {
                    sink(static_cast<std::int64_t>(v.as_big_integer()));
                } else {
                    // Oversize for TOML int; fall back to double
                    sink(static_cast<double>(v.as_big_integer()));
                }
                break;
            case ValueType::Float:
                sink(v.as_float());
                break;
            case ValueType::String:
                sink(v.as_string());
                break;
            case ValueType::Array:
                sink(make_array(v));
                break;
            case ValueType::Object:
                sink(make_table(v));
                break;
        }
    }

    toml::array make_array(const Value& a) {
        toml::array out;
        for (const auto& elem : a.as_array()) {
            emit_node(elem, [&out](auto&& node) { out.push_back(std::forward<decltype(node)>(node)); });
        }
        return out;
    }

    toml::table make_table(const Value& o) {
        toml::table tbl;
        for (const auto& [key, member] : o.as_object()) {
            emit_node(member, [&tbl, &key](auto&& node) {
                tbl.insert(key, std::forward<decltype(node)>(node));
            });
        }
        return tbl;
    }

    std::string ext_of(const std::string& path) {
        auto pos = path.find_last_of('.');
        if (pos == std::string::npos) return "";
        std::string ext = path.substr(pos);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

} // namespace

toml::table to_toml(const Value& value) {
    // TOML requires a table at the root; if value isn't an object, wrap under "value".
    if (value.is_object()) return make_table(value);
    toml::table root;
    emit_node(value, [&root](auto&& node) { root.insert("value", std::forward<decltype(node)>(node)); });
    return root;
}

Value from_toml(const toml::node& node) {
    if (auto v = node.as_string()) {
        return Value(v->get());
    } else if (auto v = node.as_integer()) {
        return Value(v->get());
    } else if (auto v = node.as_floating_point()) {
        return Value(v->get());
    } else if (auto v = node.as_boolean()) {
        return Value(v->get());
    } else if (auto v = node.as_array()) {
        Value arr = Value::array();
        for (const auto& elem : *v) arr.push_back(from_toml(elem));
        return arr;
    } else if (auto v = node.as_table()) {
        Value obj = Value::object();
        for (const auto& [k, val] : *v) {
            obj.insert(std::string(k.str()), from_toml(val));
        }
        return obj;
    } else if (auto v = node.as_date()) {
        std::ostringstream oss; oss << *v; return Value(oss.str());
    } else if (auto v = node.as_time()) {
        std::ostringstream oss; oss << *v; return Value(oss.str());
    } else if (auto v = node.as_date_time()) {
        std::ostringstream oss; oss << *v; return Value(oss.str());
    }
    return Value(nullptr);
}

std::string to_json_string(const Value& value, int indent) {
    return to_json(value).dump(indent);
}

std::string to_toml_string(const Value& value) {
    std::ostringstream oss;
    oss << to_toml(value);
    return oss.str();
}

Value read_file_any(const std::string& path) {
    const std::string ext = ext_of(path);
    if (ext == ".json") {
        return from_json(nlohmann::ordered_json::parse(read_file(path)));
    }
    if (ext == ".toml") {
        if (!file_exists(path)) {
            throw ParseError(ErrorKind::FileNotFound, "The file " + path + " does not exist", 0, 1);
        }
        toml::table tbl = toml::parse_file(path);
        return from_toml(tbl);
    }
    return parse_file(path);
}

} // namespace gura
