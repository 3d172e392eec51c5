#include <catch2/catch_test_macros.hpp>
#include <string>

#include "processing/StructuralSanitizer.hpp"

using namespace provlens::processing;

namespace
{

StructuredValue nested_arrays(std::size_t depth)
{
    StructuredValue value = 1;
    for (std::size_t i = 0; i < depth; ++i)
    {
        StructuredValue wrapper = StructuredValue::array();
        wrapper.push_back(std::move(value));
        value = std::move(wrapper);
    }
    return value;
}

} // namespace

TEST_CASE("sanitize normalizes every string leaf", "[sanitizer]")
{
    const auto input = StructuredValue::parse(R"({
        "name": "\u001b[32mweb-01\u001b[0m",
        "tags": ["a\r\nb", "\u001b[1mc\u001b[0m"],
        "network": { "note": "line1\rline2" }
    })");

    auto result = sanitize(input);
    REQUIRE(result.has_value());
    REQUIRE((*result)["name"] == "web-01");
    REQUIRE((*result)["tags"][0] == "a\nb");
    REQUIRE((*result)["tags"][1] == "c");
    REQUIRE((*result)["network"]["note"] == "line1\nline2");
}

TEST_CASE("sanitize keeps list order and key order", "[sanitizer]")
{
    const auto input = StructuredValue::parse(R"({"zeta": 1, "alpha": [3, 2, 1], "mid": "m"})");

    auto result = sanitize(input);
    REQUIRE(result.has_value());
    REQUIRE(result->dump() == R"({"zeta":1,"alpha":[3,2,1],"mid":"m"})");
}

TEST_CASE("sanitize passes other scalars through", "[sanitizer]")
{
    const auto input = StructuredValue::parse(R"({"count": 3, "ratio": 0.5, "enabled": false, "owner": null})");

    auto result = sanitize(input);
    REQUIRE(result.has_value());
    REQUIRE(*result == input);

    REQUIRE(sanitize(StructuredValue(7)).value() == StructuredValue(7));
    REQUIRE(sanitize(StructuredValue()).value().is_null());
}

TEST_CASE("sanitize drops logs at every level only when asked", "[sanitizer]")
{
    const auto input = StructuredValue::parse(R"({
        "logs": "top",
        "outputs": { "logs": "nested", "ip": "10.0.0.4" },
        "runs": [ { "logs": "in list", "id": 1 } ]
    })");

    SECTION("Default options keep logs")
    {
        auto result = sanitize(input);
        REQUIRE(result.has_value());
        REQUIRE(result->contains("logs"));
        REQUIRE((*result)["outputs"].contains("logs"));
        REQUIRE((*result)["runs"][0].contains("logs"));
    }

    SECTION("omit_logs_key removes logs everywhere")
    {
        FormatOptions options;
        options.omit_logs_key = true;
        auto result = sanitize(input, options);
        REQUIRE(result.has_value());
        REQUIRE(result->dump() == R"({"outputs":{"ip":"10.0.0.4"},"runs":[{"id":1}]})");
    }
}

TEST_CASE("sanitize does not modify its input", "[sanitizer]")
{
    const auto input = StructuredValue::parse(R"({"logs": "\u001b[31mraw\u001b[0m", "msg": "a\r\nb"})");
    const StructuredValue copy = input;

    FormatOptions options;
    options.omit_logs_key = true;
    auto result = sanitize(input, options);

    REQUIRE(result.has_value());
    REQUIRE(input == copy);
    REQUIRE(input.contains("logs"));
}

TEST_CASE("sanitize refuses values nested deeper than max_depth", "[sanitizer]")
{
    SECTION("Default bound")
    {
        REQUIRE(sanitize(nested_arrays(FormatOptions::kDefaultMaxDepth)).has_value());
        REQUIRE_FALSE(sanitize(nested_arrays(FormatOptions::kDefaultMaxDepth + 1)).has_value());
    }

    SECTION("Custom bound")
    {
        FormatOptions options;
        options.max_depth = 3;
        REQUIRE(sanitize(nested_arrays(3), options).has_value());
        REQUIRE_FALSE(sanitize(nested_arrays(4), options).has_value());
    }
}
