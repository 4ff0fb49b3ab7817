#include <catch2/catch_test_macros.hpp>

#include "EnviLexer.hpp"
#include "Errors.hpp"

#include <sstream>
#include <string_view>
#include <vector>


TEST_CASE("Basic usage", "[EnviLexer]")
{
    constexpr static std::string_view input = R"V0G0N( ENVI
    samples = 220
    ; comment = ignored
    {continued, list}

    wavelength = {1,
    )V0G0N";

    const std::vector<Token> expected_output = {
            Token{TokenType::FIELD, "samples = 220", 2},
            Token{TokenType::COMMENT, "; comment = ignored", 3},
            Token{TokenType::TEXT, "{continued, list}", 4},
            Token{TokenType::TEXT, "", 5},
            Token{TokenType::FIELD, "wavelength = {1,", 6},
            Token{TokenType::TEXT, "", 7},
            Token{TokenType::END_FILE, "", 7},
    };

    std::stringstream stringstream{input.data()};
    EnviLexer lexer{stringstream};

    for (const auto &expected : expected_output)
    {
        const auto token = lexer.NextToken();
        REQUIRE(token.token_type == expected.token_type);
        REQUIRE(token.value == expected.value);
        REQUIRE(token.line_number == expected.line_number);
    }
    REQUIRE(lexer.Eof());
}

TEST_CASE("Missing ENVI marker", "[EnviLexer]")
{
    std::stringstream stringstream{"samples = 3\nlines = 4\n"};
    REQUIRE_THROWS_AS(EnviLexer{stringstream}, FormatError);

    std::stringstream empty{""};
    REQUIRE_THROWS_AS(EnviLexer{empty}, FormatError);
}

TEST_CASE("Marker may be followed by text", "[EnviLexer]")
{
    std::stringstream stringstream{"ENVI header v2\r\nbands = 3\r\n"};
    EnviLexer lexer{stringstream};

    const auto token = lexer.NextToken();
    REQUIRE(token.token_type == TokenType::FIELD);
    REQUIRE(token.value == "bands = 3");
    REQUIRE(lexer.NextToken().token_type == TokenType::END_FILE);
}

TEST_CASE("Trim whitespace", "[EnviLexer]")
{
    REQUIRE(Trim("  a b\t\r\n") == "a b");
    REQUIRE(Trim("\t \n").empty());
    REQUIRE(Trim("").empty());
}
