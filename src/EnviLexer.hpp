#ifndef HYSPEXCPP_ENVILEXER_HPP
#define HYSPEXCPP_ENVILEXER_HPP

#include <string>
#include <istream>
#include <string_view>


enum class TokenType
{
    FIELD,      // line containing '='
    COMMENT,    // line starting with ';'
    TEXT,       // any other line, including blank ones
    END_FILE
};


/**
 * One physical line of the header. \a value is the line with surrounding whitespace removed,
 * \a line_number counts from 1 with the 'ENVI' marker being line 1.
 */
struct Token
{
    TokenType token_type;
    std::string value;
    std::size_t line_number;
};

class EnviLexer
{
public:
    /// Consumes the first line, throws FormatError when it does not start with 'ENVI'.
    explicit EnviLexer(std::istream &iss);

    [[nodiscard]] Token NextToken();

    [[nodiscard]] bool Eof() const { return iss_.eof(); }

private:
    std::istream &iss_;
    std::size_t line_number_;
};

[[nodiscard]] std::string_view Trim(std::string_view text) noexcept;

[[nodiscard]] constexpr std::string_view to_string(TokenType token_type) noexcept
{
    switch (token_type)
    {
        case TokenType::FIELD:
            return "FIELD";
        case TokenType::COMMENT:
            return "COMMENT";
        case TokenType::TEXT:
            return "TEXT";
        case TokenType::END_FILE:
            return "END_FILE";
    }
    return "";
}

#endif //HYSPEXCPP_ENVILEXER_HPP
