/**
 * @file test_convert.cpp
 * @brief Tests for JSON and TOML conversion
 *
 * Tests cover:
 * - Value to JSON (key order, big integers)
 * - JSON to value
 * - Value to TOML and back
 * - Loading files by extension
 */

#include <catch2/catch_all.hpp>
#include "gura/Convert.hpp"
#include "gura/Errors.hpp"
#include "gura/Parser.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace fs = std::filesystem;

using namespace gura;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

namespace {

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".ura")
        : path_(fs::temp_directory_path() /
                ("gura_test_" + std::to_string(std::random_device{}()) + extension)) {
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

BigInt ten_pow(int n) {
    BigInt value = 1;
    for (int i = 0; i < n; ++i) {
        value *= 10;
    }
    return value;
}

} // namespace

// ============================================================================
// JSON
// ============================================================================

TEST_CASE("to_json - keeps structure and key order", "[convert][json]") {
    Value doc = parse(
        "name: \"Gura\"\n"
        "port: 8080\n"
        "ratio: 0.5\n"
        "on: true\n"
        "none: null\n"
        "tags: [\"a\", \"b\"]\n"
        "server:\n"
        "    host: \"h\"");

    CHECK(to_json(doc).dump() ==
          R"({"name":"Gura","port":8080,"ratio":0.5,"on":true,"none":null,"tags":["a","b"],"server":{"host":"h"}})");
    CHECK(to_json_string(doc, -1) == to_json(doc).dump());
}

TEST_CASE("to_json - big integers", "[convert][json]") {
    SECTION("Fits in 64 unsigned bits") {
        auto json = to_json(Value(static_cast<BigInt>(1) << 63));
        CHECK(json.is_number_unsigned());
        CHECK(json.get<std::uint64_t>() == 9223372036854775808ULL);
    }

    SECTION("Wider values become decimal text") {
        auto json = to_json(Value(ten_pow(20)));
        REQUIRE(json.is_string());
        CHECK(json.get<std::string>() == "100000000000000000000");
    }

    SECTION("Negative values become decimal text") {
        auto json = to_json(Value(-ten_pow(20)));
        CHECK(json.get<std::string>() == "-100000000000000000000");
    }
}

TEST_CASE("from_json - builds values", "[convert][json]") {
    SECTION("Nested document") {
        auto json = nlohmann::ordered_json::parse(R"({"a":1,"b":[true,null],"c":{"d":"x"},"e":1.5})");
        Value expected(Value::Object{
            {"a", 1},
            {"b", Value::Array{true, nullptr}},
            {"c", Value::Object{{"d", "x"}}},
            {"e", 1.5},
        });
        CHECK(from_json(json) == expected);
    }

    SECTION("Unsigned beyond int64 becomes a big integer") {
        Value v = from_json(nlohmann::ordered_json::parse("18446744073709551615"));
        REQUIRE(v.is_big_integer());
        CHECK(to_string(v.as_big_integer()) == "18446744073709551615");
    }

    SECTION("Round trip through JSON") {
        Value v = parse("a: [1, 2.5, \"s\"]\nb:\n    c: false\nd: empty");
        CHECK(from_json(to_json(v)) == v);
    }
}

// ============================================================================
// TOML
// ============================================================================

TEST_CASE("to_toml - tables and wrapping", "[convert][toml]") {
    SECTION("Objects become tables") {
        Value v = parse("port: 8080\nserver:\n    host: \"h\"\n    debug: true");
        toml::table tbl = to_toml(v);
        CHECK(tbl["port"].value<std::int64_t>() == 8080);
        CHECK(tbl["server"]["host"].value<std::string>() == "h");
        CHECK(tbl["server"]["debug"].value<bool>() == true);

        const std::string text = to_toml_string(v);
        CHECK(text.find("port = 8080") != std::string::npos);
        CHECK(text.find("[server]") != std::string::npos);
    }

    SECTION("Null becomes an empty string") {
        toml::table tbl = to_toml(parse("n: null"));
        CHECK(tbl["n"].value<std::string>() == "");
    }

    SECTION("Scalars are wrapped under value") {
        toml::table tbl = to_toml(Value(5));
        CHECK(tbl["value"].value<std::int64_t>() == 5);
    }

    SECTION("Oversized integers become floats") {
        toml::table tbl = to_toml(Value(Value::Object{{"big", ten_pow(20)}}));
        REQUIRE(tbl["big"].is_floating_point());
        CHECK(tbl["big"].value<double>() == Catch::Approx(1e20));
    }
}

TEST_CASE("from_toml - builds values", "[convert][toml]") {
    toml::table tbl = toml::parse(
        "a = 1\n"
        "b = 'x'\n"
        "d = 1979-05-27\n"
        "[t]\n"
        "c = [1, 2]\n");

    Value v = from_toml(tbl);
    CHECK(v.at("a").as_integer() == 1);
    CHECK(v.at("b").as_string() == "x");
    CHECK(v.at("d").as_string() == "1979-05-27");
    CHECK(v.at("t").at("c") == Value(Value::Array{1, 2}));
}

// ============================================================================
// Files
// ============================================================================

TEST_CASE("read_file_any - dispatches on extension", "[convert][files]") {
    SECTION("JSON") {
        TempFile file(R"({"key": "value", "n": 2})", ".json");
        CHECK(read_file_any(file.path()) == Value(Value::Object{{"key", "value"}, {"n", 2}}));
    }

    SECTION("TOML") {
        TempFile file("key = \"value\"\n[section]\nn = 2\n", ".toml");
        CHECK(read_file_any(file.path()) ==
              Value(Value::Object{{"key", "value"}, {"section", Value::Object{{"n", 2}}}}));
    }

    SECTION("Uppercase extension") {
        TempFile file(R"({"k": true})", ".JSON");
        CHECK(read_file_any(file.path()).at("k") == Value(true));
    }

    SECTION("Anything else is Gura") {
        TempFile file("key: \"value\"\nn: 2", ".ura");
        CHECK(read_file_any(file.path()) == Value(Value::Object{{"key", "value"}, {"n", 2}}));
    }

    SECTION("Missing files") {
        CHECK_THROWS_AS(read_file_any("/nonexistent/gura/missing.toml"), ParseError);
        CHECK_THROWS_AS(read_file_any("/nonexistent/gura/missing.json"), ParseError);
        CHECK_THROWS_AS(read_file_any("/nonexistent/gura/missing.ura"), ParseError);
    }
}
