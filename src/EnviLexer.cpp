#include "EnviLexer.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <string>


EnviLexer::EnviLexer(std::istream &iss): iss_{iss}, line_number_{1}
{
    std::string line{};
    std::getline(iss_, line);

    if (!Trim(line).starts_with("ENVI"))
    {
        throw FormatError("Missing 'ENVI' string at the beginning of the file");
    }
}

Token EnviLexer::NextToken()
{
    std::string line{};
    if (!std::getline(iss_, line))
    {
        return Token{TokenType::END_FILE, "", line_number_};
    }
    ++line_number_;

    std::string value{Trim(line)};

    TokenType token_type = TokenType::TEXT;
    if (value.starts_with(';'))
        token_type = TokenType::COMMENT;
    else if (value.find('=') != std::string::npos)
        token_type = TokenType::FIELD;

    return Token{token_type, std::move(value), line_number_};
}

std::string_view Trim(std::string_view text) noexcept
{
    static constexpr std::string_view whitespace = " \t\r\n\f\v";

    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
        return {};

    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}
