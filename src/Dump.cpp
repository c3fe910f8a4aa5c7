/**
 * @file Dump.cpp
 * @brief Gura serializer
 */

#include "gura/Dump.hpp"
#include "gura/Indentation.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <vector>

namespace gura {

namespace {

const std::string kIndent(kIndentWidth, ' ');

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string trim(const std::string& text) {
    const char* blanks = " \t\r\n\f\v";
    const auto first = text.find_first_not_of(blanks);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(blanks);
    return text.substr(first, last - first + 1);
}

bool is_non_empty_object(const Value& value) {
    return value.is_object() && value.size() > 0;
}

std::string dump_content(const Value& value);

std::string dump_object(const Value& value) {
    if (value.size() == 0) {
        return "empty";
    }

    std::string result;
    for (const auto& [key, member] : value.as_object()) {
        result += key + ":";
        if (is_non_empty_object(member)) {
            result += "\n";
            for (const auto& line : split_lines(trim(dump_content(member)))) {
                result += kIndent + line + "\n";
            }
        } else {
            result += " " + dump_content(member) + "\n";
        }
    }
    return result;
}

std::string dump_array(const Value& value) {
    const auto& elements = value.as_array();
    bool multiline = false;
    for (const auto& element : elements) {
        multiline = multiline || is_non_empty_object(element);
    }

    std::string result = "[";
    if (!multiline) {
        for (std::size_t i = 0; i < elements.size(); ++i) {
            if (i > 0) {
                result += ", ";
            }
            result += dump_content(elements[i]);
        }
        return result + "]";
    }

    for (std::size_t i = 0; i < elements.size(); ++i) {
        result += "\n";
        const auto lines = split_lines(trim(dump_content(elements[i])));
        for (std::size_t j = 0; j < lines.size(); ++j) {
            if (j > 0) {
                result += "\n";
            }
            result += kIndent + lines[j];
        }
        if (i + 1 < elements.size()) {
            result += ",";
        }
    }
    return result + "\n]";
}

std::string dump_content(const Value& value) {
    switch (value.type()) {
        case ValueType::Null:
            return "null";
        case ValueType::Bool:
            return value.as_bool() ? "true" : "false";
        case ValueType::Integer:
            return std::to_string(value.as_integer());
        case ValueType::BigInteger:
            return to_string(value.as_big_integer());
        case ValueType::Float:
            return format_float(value.as_float());
        case ValueType::String:
            return quote_string(value.as_string());
        case ValueType::Array:
            return dump_array(value);
        case ValueType::Object:
            return dump_object(value);
    }
    return "";
}

} // anonymous namespace

std::string format_float(double number) {
    if (std::isnan(number)) {
        return "nan";
    }
    if (std::isinf(number)) {
        return number > 0 ? "inf" : "-inf";
    }

    std::string shortest = nlohmann::json(number).dump();
    const double parsed_back = std::strtod(shortest.c_str(), nullptr);
    if (std::memcmp(&parsed_back, &number, sizeof(double)) == 0) {
        return shortest;
    }

    std::ostringstream oss;
    oss << std::setprecision(17) << number;
    return oss.str();
}

std::string quote_string(const std::string& text) {
    std::string result = "\"";
    for (char c : text) {
        switch (c) {
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '$': result += "\\$"; break;
            default: result += c; break;
        }
    }
    return result + "\"";
}

std::string dump(const Value& value) {
    return trim(dump_content(value));
}

} // namespace gura
