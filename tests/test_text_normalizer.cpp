#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "processing/TextNormalizer.hpp"

using namespace provlens::processing;

TEST_CASE("normalize_log_text canonicalizes line endings", "[normalizer]")
{
    REQUIRE(normalize_log_text("a\r\nb\rc") == "a\nb\nc");
    REQUIRE(normalize_log_text("\r\r\n") == "\n\n");
    REQUIRE(normalize_log_text("line\n") == "line\n");
    REQUIRE(normalize_log_text("") == "");
}

TEST_CASE("normalize_log_text strips ANSI colour sequences", "[normalizer][ansi]")
{
    REQUIRE(normalize_log_text("\x1b[31mError\x1b[0m") == "Error");
    REQUIRE(normalize_log_text("\x1b[1;31mBold red\x1b[0m text") == "Bold red text");
    REQUIRE(normalize_log_text("\x1b[38;5;208mOrange") == "Orange");
}

TEST_CASE("normalize_log_text strips cursor and mode sequences", "[normalizer][ansi]")
{
    SECTION("Erase line and cursor column")
    {
        REQUIRE(normalize_log_text("\x1b[2K\x1b[1GRefreshing state...") == "Refreshing state...");
    }

    SECTION("Private mode toggles")
    {
        REQUIRE(normalize_log_text("\x1b[?25lhidden cursor\x1b[?25h") == "hidden cursor");
    }

    SECTION("Cursor up without parameters")
    {
        REQUIRE(normalize_log_text("one\x1b[Atwo") == "onetwo");
    }

    SECTION("Every occurrence is removed")
    {
        REQUIRE(normalize_log_text("\x1b[32m+\x1b[0m create\n\x1b[31m-\x1b[0m destroy") == "+ create\n- destroy");
    }
}

TEST_CASE("normalize_log_text recognizes the C1 CSI introducer", "[normalizer][ansi]")
{
    SECTION("UTF-8 encoded U+009B")
    {
        REQUIRE(normalize_log_text("\xc2\x9b" "31mRed\xc2\x9b" "0m") == "Red");
    }

    SECTION("Bare 0x9B byte")
    {
        REQUIRE(normalize_log_text("\x9b" "1mX") == "X");
        REQUIRE(normalize_log_text("ok \x9b" "0m") == "ok ");
    }

    SECTION("0x9B inside a multi-byte character is text")
    {
        // U+011B is encoded as C4 9B
        const std::string text = "sv\xc4\x9b" "m";
        REQUIRE(normalize_log_text(text) == text);
    }
}

TEST_CASE("normalize_log_text leaves other text untouched", "[normalizer]")
{
    REQUIRE(normalize_log_text("  padded  ") == "  padded  ");
    REQUIRE(normalize_log_text("MiXeD Case") == "MiXeD Case");
    REQUIRE(normalize_log_text("Plan: 1 to add, 0 to change") == "Plan: 1 to add, 0 to change");
    REQUIRE(normalize_log_text("日本語のログ") == "日本語のログ");
}

TEST_CASE("normalize_log_text is idempotent", "[normalizer]")
{
    const std::vector<std::string> samples = {
        "",
        "plain",
        "a\r\nb\rc",
        "\x1b[31mError\x1b[0m",
        "\x1b\x1b[31m[31mspliced",
        "\r\x1b[0m\n",
        "\xc2\x9b" "31mRed",
        "sv\xc4\x9b" "m",
        "\x1b[12345mX",
    };

    for (const auto& sample : samples)
    {
        const std::string once = normalize_log_text(sample);
        REQUIRE(normalize_log_text(once) == once);
    }
}

TEST_CASE("normalize_log_text returns empty text for non-text values", "[normalizer]")
{
    REQUIRE(normalize_log_text(StructuredValue()) == "");
    REQUIRE(normalize_log_text(StructuredValue(42)) == "");
    REQUIRE(normalize_log_text(StructuredValue(true)) == "");
    REQUIRE(normalize_log_text(StructuredValue::array({ "a" })) == "");
    REQUIRE(normalize_log_text(StructuredValue::object()) == "");
    REQUIRE(normalize_log_text(static_cast<const char*>(nullptr)) == "");
    REQUIRE(normalize_log_text(StructuredValue("\x1b[1mbold\x1b[0m\r\n")) == "bold\n");
}

TEST_CASE("trim_copy strips ASCII whitespace at both ends", "[normalizer]")
{
    REQUIRE(trim_copy("  Unauthorized access  \n") == "Unauthorized access");
    REQUIRE(trim_copy("\t\v\f\r\n") == "");
    REQUIRE(trim_copy("inner  space") == "inner  space");
    REQUIRE(trim_copy("") == "");
}

TEST_CASE("trim_copy strips Unicode whitespace at both ends", "[normalizer]")
{
    REQUIRE(trim_copy("\xC2\xA0") == "");
    REQUIRE(trim_copy("\xC2\xA0" "boom" "\xC2\xA0") == "boom");
    REQUIRE(trim_copy("\xEF\xBB\xBF" "{}") == "{}");
    REQUIRE(trim_copy(" \xE3\x80\x80\xE2\x80\x8A" "x" "\xE2\x80\xA9\xE1\x9A\x80\t") == "x");
    REQUIRE(trim_copy("\xE2\x81\x9F" "a" "\xE2\x80\xAF") == "a");

    SECTION("Inner Unicode spaces are content")
    {
        REQUIRE(trim_copy("a" "\xC2\xA0" "b") == "a" "\xC2\xA0" "b");
    }

    SECTION("Other non-ASCII characters are kept")
    {
        // U+00E9, U+2010 and U+3001 share lead bytes with the spaces
        REQUIRE(trim_copy("\xC3\xA9") == "\xC3\xA9");
        REQUIRE(trim_copy("\xE2\x80\x90") == "\xE2\x80\x90");
        REQUIRE(trim_copy("\xE3\x80\x81") == "\xE3\x80\x81");
    }
}

TEST_CASE("split_log_lines yields normalized display lines", "[normalizer]")
{
    SECTION("Mixed line endings")
    {
        auto lines = split_log_lines("init\r\nplan\rapply\n");
        const std::vector<std::string> expected{ "init", "plan", "apply" };
        REQUIRE(lines == expected);
    }

    SECTION("Blank lines are kept")
    {
        auto lines = split_log_lines("a\n\nb");
        const std::vector<std::string> expected{ "a", "", "b" };
        REQUIRE(lines == expected);
    }

    SECTION("Escape sequences are removed")
    {
        auto lines = split_log_lines("\x1b[32mok\x1b[0m\n\x1b[31mfail\x1b[0m");
        const std::vector<std::string> expected{ "ok", "fail" };
        REQUIRE(lines == expected);
    }

    SECTION("Empty input has no lines")
    {
        REQUIRE(split_log_lines("").empty());
    }
}
