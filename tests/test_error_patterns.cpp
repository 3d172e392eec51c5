#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "processing/ErrorPatterns.hpp"

using namespace provlens::processing;

TEST_CASE("ErrorPatternTable - Default order", "[patterns]")
{
    const auto& table = ErrorPatternTable::defaults();
    const std::vector<std::string> expected = {
        "invalid_parameter_combination",
        "vpc_id_not_specified",
        "error_colon",
        "api_error",
        "failed",
        "exception",
        "forbidden",
        "unauthorized",
        "not_found",
    };

    REQUIRE(table.definitions().size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i)
    {
        REQUIRE(table.definitions()[i].name == expected[i]);
        REQUIRE(table.definitions()[i].rank == i);
    }

    REQUIRE(table.find("failed") != nullptr);
    REQUIRE(table.find("failed")->rank == 4);
    REQUIRE(table.find("timeout") == nullptr);
}

TEST_CASE("ErrorPatternTable - Line ranking", "[patterns]")
{
    const auto& table = ErrorPatternTable::defaults();

    SECTION("Case insensitive")
    {
        REQUIRE(table.matchRank("InvalidParameterCombination: Instance type not supported") == 0u);
        REQUIRE(table.matchRank("VPCIdNotSpecified: No default VPC for this user") == 1u);
        REQUIRE(table.matchRank("Error: timeout") == 2u);
        REQUIRE(table.matchRank("an API error occurred") == 3u);
        REQUIRE(table.matchRank("Apply FAILED") == 4u);
        REQUIRE(table.matchRank("java.lang.Exception thrown") == 5u);
        REQUIRE(table.matchRank("403 Forbidden") == 6u);
        REQUIRE(table.matchRank("Unauthorized") == 7u);
        REQUIRE(table.matchRank("module not found") == 8u);
    }

    SECTION("Highest priority wins when several match")
    {
        REQUIRE(table.matchRank("Error: request failed, forbidden") == 2u);
    }

    SECTION("Word boundaries")
    {
        REQUIRE_FALSE(table.matchRank("notfailed yet").has_value());
        REQUIRE_FALSE(table.matchRank("terror:x").has_value());
        REQUIRE_FALSE(table.matchRank("everything is fine").has_value());
    }
}

TEST_CASE("find_likely_error_line - Pattern priority and recency", "[patterns]")
{
    SECTION("Higher ranked pattern beats a more recent lower ranked one")
    {
        REQUIRE(find_likely_error_line("line1\nFailed to connect\nerror: timeout\nFailed again") == "error: timeout");
    }

    SECTION("Most recent line of the winning pattern")
    {
        REQUIRE(find_likely_error_line("Failed one\nok\nFailed two\ndone") == "Failed two");
    }

    SECTION("Provider validation codes rank first")
    {
        const std::string logs = "Error: creating EC2 Instance\n"
                                 "  api error VPCIdNotSpecified: No default VPC\n"
                                 "Error: exit status 1";
        REQUIRE(find_likely_error_line(logs) == "api error VPCIdNotSpecified: No default VPC");
    }

    SECTION("Lines are trimmed and escape sequences removed")
    {
        REQUIRE(find_likely_error_line("\x1b[31m  Error: boom  \x1b[0m\r\ndone") == "Error: boom");
    }
}

TEST_CASE("find_likely_error_line - Fallbacks", "[patterns]")
{
    SECTION("Last non-empty line when nothing matches")
    {
        REQUIRE(find_likely_error_line("step 1\nstep 2\n\n   \n") == "step 2");
    }

    SECTION("No lines at all")
    {
        REQUIRE(find_likely_error_line("").empty());
        REQUIRE(find_likely_error_line("\n \r\n\t").empty());
    }
}
