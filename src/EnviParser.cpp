#include "EnviParser.hpp"
#include "EnviLexer.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>


namespace envi
{

void Fields::Set(std::string field, Value value)
{
    auto iter = std::find_if(expressions_.begin(), expressions_.end(),
                             [&field](const Expression &expr) { return expr.field == field; });
    if (iter != expressions_.end())
    {
        iter->value = std::move(value);
        return;
    }
    expressions_.push_back(Expression{std::move(field), std::move(value)});
}

const Value* Fields::Find(std::string_view field) const noexcept
{
    auto iter = std::find_if(expressions_.begin(), expressions_.end(),
                             [field](const Expression &expr) { return expr.field == field; });
    return iter == expressions_.end() ? nullptr : &iter->value;
}

const Value* Fields::FindNoCase(std::string_view field) const noexcept
{
    auto equal_no_case = [field](const Expression &expr)
    {
        return std::ranges::equal(expr.field, field, [](char lhs, char rhs) {
            return std::tolower(static_cast<unsigned char>(lhs)) == std::tolower(static_cast<unsigned char>(rhs));
        });
    };
    auto iter = std::find_if(expressions_.begin(), expressions_.end(), equal_no_case);
    return iter == expressions_.end() ? nullptr : &iter->value;
}

bool Accept(Parser &parser, TokenType type)
{
    if (parser.Get().token_type == type)
    {
        parser.Next();
        return true;
    }
    return false;
}

bool Expect(const Parser &parser, TokenType type)
{
    return parser.Get().token_type == type;
}

std::string ToLower(std::string_view text)
{
    std::string lower{text};
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

auto ParseField(std::string_view text, const ParseOptions &options) -> std::string
{
    auto field = Trim(text);
    return options.preserve_case ? std::string{field} : ToLower(field);
}

auto ParseVector(Parser &parser, std::string first_line) -> std::string
{
    std::string text = std::move(first_line);
    const auto start_line = parser.Get().line_number;
    parser.Next();

    while (!text.ends_with('}'))
    {
        if (parser.End() || Expect(parser, TokenType::END_FILE))
        {
            LOG_ERROR("List value starting on line {} is not closed with '}}'", start_line);
            throw FormatError{"Unterminated list value starting on line " + std::to_string(start_line)};
        }
        if (Accept(parser, TokenType::COMMENT))
            continue;

        text += '\n';
        text += parser.Get().value;
        parser.Next();
    }
    return text;
}

auto SplitVector(std::string_view braced) -> std::vector<std::string>
{
    std::vector<std::string> values;

    const auto inner = braced.substr(1, braced.size() - 2);
    if (Trim(inner).empty())
        return values;

    std::size_t begin = 0;
    while (true)
    {
        const auto comma = inner.find(',', begin);
        values.emplace_back(Trim(inner.substr(begin, comma == std::string_view::npos ? inner.npos : comma - begin)));
        if (comma == std::string_view::npos)
            break;
        begin = comma + 1;
    }
    return values;
}

auto ParseExpression(Parser &parser, const ParseOptions &options) -> Expression
{
    const auto &token = parser.Get();
    const std::string_view line = token.value;
    const auto eq_pos = line.find('=');

    auto field = ParseField(line.substr(0, eq_pos), options);
    if (field.empty())
    {
        LOG_ERROR("Line {}, missing field name before '='", token.line_number);
        throw FormatError{"Missing field name on line " + std::to_string(token.line_number)};
    }

    std::string value{Trim(line.substr(eq_pos + 1))};
    if (!value.starts_with('{'))
    {
        parser.Next();
        return Expression{std::move(field), std::move(value)};
    }

    const auto braced = ParseVector(parser, std::move(value));
    if (ToLower(field) == "description")
    {
        const auto first = braced.find_first_not_of("{}");
        const auto last = braced.find_last_not_of("{}");
        std::string_view text = first == std::string::npos ? std::string_view{}
                                                           : std::string_view{braced}.substr(first, last - first + 1);
        return Expression{std::move(field), std::string{Trim(text)}};
    }
    return Expression{std::move(field), SplitVector(braced)};
}

auto Parse(Parser &parser, const ParseOptions &options) -> Fields
{
    Fields fields;

    while (!parser.End())
    {
        if (Accept(parser, TokenType::END_FILE))
        {
            break;
        }
        else if (Expect(parser, TokenType::FIELD))
        {
            auto expr = ParseExpression(parser, options);
            fields.Set(std::move(expr.field), std::move(expr.value));
        }
        else
        {
            const auto &token = parser.Get();
            LOG_TRACE("Skipping {} token on line {}", to_string(token.token_type), token.line_number);
            parser.Next();
        }
    }

    FlattenDescription(fields, options);
    return fields;
}

void FlattenDescription(Fields &fields, const ParseOptions &options)
{
    const auto *description = options.preserve_case ? fields.FindNoCase("description") : fields.Find("description");
    if (description == nullptr || !std::holds_alternative<std::string>(*description))
        return;

    std::vector<Expression> nested;
    std::istringstream iss{std::get<std::string>(*description)};
    std::string line;
    while (std::getline(iss, line))
    {
        const auto text = Trim(line);
        if (text.empty())
            continue;

        const auto eq_pos = text.find('=');
        if (eq_pos == std::string_view::npos)
        {
            LOG_ERROR("Description entry '{}' is not a key=value pair", text);
            throw FormatError{"Malformed description entry '" + std::string{text} + "'"};
        }
        nested.push_back(Expression{ParseField(text.substr(0, eq_pos), options),
                                    std::string{Trim(text.substr(eq_pos + 1))}});
    }

    for (auto &expr : nested)
    {
        fields.Set(std::move(expr.field), std::move(expr.value));
    }
}

Fields ParseText(std::istream &iss, const ParseOptions &options)
{
    EnviLexer lexer{iss};

    std::vector<Token> tokens;
    Token token;
    do
    {
        token = lexer.NextToken();
        tokens.push_back(token);
    } while (token.token_type != TokenType::END_FILE);

    Parser parser{std::move(tokens)};
    return Parse(parser, options);
}

std::string DumpEnvi(const Fields &fields)
{
    std::ostringstream oss;
    oss << "ENVI\n";

    for (const auto &[field, value] : fields)
    {
        oss << field << " = ";
        if (const auto *list = std::get_if<std::vector<std::string>>(&value))
        {
            oss << '{';
            for (std::size_t idx = 0; idx < list->size(); ++idx)
            {
                if (idx != 0)
                    oss << ", ";
                oss << (*list)[idx];
            }
            oss << '}';
        }
        else if (ToLower(field) == "description")
        {
            oss << '{' << std::get<std::string>(value) << '}';
        }
        else
        {
            oss << std::get<std::string>(value);
        }
        oss << '\n';
    }
    return oss.str();
}

}
