/**
 * @file Parse.cpp
 * @brief Implementation of number literal classification
 */

#include "gura/Parse.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <limits>
#include <regex>
#include <stdexcept>

namespace gura {

namespace {
    /**
     * @brief Value of a digit in bases up to 16, -1 if not a digit
     */
    int digit_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    /**
     * @brief Parse unsigned digits of a prefixed literal into an int64
     */
    std::optional<std::int64_t> parse_radix(const std::string& digits, int base) {
        if (digits.empty()) {
            return std::nullopt;
        }

        constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        std::uint64_t value = 0;
        for (char c : digits) {
            const int digit = digit_value(c);
            if (digit < 0 || digit >= base) {
                return std::nullopt;
            }
            if (value > (kMax - static_cast<std::uint64_t>(digit)) / static_cast<std::uint64_t>(base)) {
                return std::nullopt;
            }
            value = value * static_cast<std::uint64_t>(base) + static_cast<std::uint64_t>(digit);
        }
        return static_cast<std::int64_t>(value);
    }

    /**
     * @brief Parse a signed decimal literal that overflows int64
     */
    std::optional<BigInt> parse_big_integer(const std::string& text) {
        const bool negative = text.front() == '-';
        const std::size_t start = (text.front() == '-' || text.front() == '+') ? 1 : 0;

        // Accumulate negatively so the minimum value stays representable
        constexpr BigInt kMin = static_cast<BigInt>(static_cast<unsigned __int128>(1) << 127);
        BigInt value = 0;
        for (std::size_t i = start; i < text.size(); ++i) {
            const int digit = text[i] - '0';
            if (value < (kMin + digit) / 10) {
                return std::nullopt;
            }
            value = value * 10 - digit;
        }

        if (negative) {
            return value;
        }
        if (value == kMin) {
            return std::nullopt;
        }
        return -value;
    }

    const std::regex& integer_pattern() {
        static const std::regex re("^[+-]?[0-9]+$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re("^[+-]?([0-9]+\\.?[0-9]*|\\.[0-9]+)([eE][+-]?[0-9]+)?$");
        return re;
    }
}

std::optional<Value> parse_number(const std::string& literal) {
    std::string text;
    std::copy_if(literal.begin(), literal.end(), std::back_inserter(text),
                 [](char c) { return c != '_'; });

    if (text.empty()) {
        return std::nullopt;
    }

    // Prefixed integers
    const std::string prefix = text.substr(0, 2);
    if (prefix == "0x" || prefix == "0o" || prefix == "0b") {
        const int base = prefix == "0x" ? 16 : (prefix == "0o" ? 8 : 2);
        auto value = parse_radix(text.substr(2), base);
        if (!value) {
            return std::nullopt;
        }
        return Value(*value);
    }

    // Infinities and NaN
    if (text == "inf" || text == "+inf") {
        return Value(std::numeric_limits<double>::infinity());
    }
    if (text == "-inf") {
        return Value(-std::numeric_limits<double>::infinity());
    }
    if (text == "nan" || text == "+nan" || text == "-nan") {
        return Value(std::numeric_limits<double>::quiet_NaN());
    }

    // Floats
    if (text.find_first_of("Ee.") != std::string::npos) {
        if (!std::regex_match(text, float_pattern())) {
            return std::nullopt;
        }
        // strtod saturates to +-inf on overflow instead of throwing
        return Value(std::strtod(text.c_str(), nullptr));
    }

    // Integers
    if (!std::regex_match(text, integer_pattern())) {
        return std::nullopt;
    }
    try {
        std::size_t pos = 0;
        long long value = std::stoll(text, &pos);
        if (pos == text.size()) {
            return Value(static_cast<std::int64_t>(value));
        }
        return std::nullopt;
    } catch (const std::out_of_range&) {
        auto big = parse_big_integer(text);
        if (!big) {
            return std::nullopt;
        }
        return Value(*big);
    }
}

} // namespace gura
