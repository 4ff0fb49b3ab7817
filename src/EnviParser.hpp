#ifndef HYSPEXCPP_ENVIPARSER_HPP
#define HYSPEXCPP_ENVIPARSER_HPP

#include "EnviLexer.hpp"

#include <optional>
#include <variant>
#include <vector>
#include <string>
#include <string_view>


namespace envi
{

using Value = std::variant<std::string, std::vector<std::string>>;

struct Expression
{
    std::string field;
    Value value;

    [[nodiscard]] bool operator==(const Expression &) const = default;
};

struct ParseOptions
{
    bool preserve_case = false;
};

/**
 * @brief Header fields in the order they first appeared. Setting an existing key replaces its value
 * without moving it.
 */
class Fields
{
public:
    void Set(std::string field, Value value);

    [[nodiscard]] const Value* Find(std::string_view field) const noexcept;

    /// Case-insensitive lookup, used by the typed header when keys were parsed with preserve_case.
    [[nodiscard]] const Value* FindNoCase(std::string_view field) const noexcept;

    [[nodiscard]] bool Contains(std::string_view field) const noexcept { return Find(field) != nullptr; }

    [[nodiscard]] std::size_t Size() const noexcept { return expressions_.size(); }

    [[nodiscard]] auto begin() const noexcept { return expressions_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return expressions_.cend(); }

    [[nodiscard]] bool operator==(const Fields &) const = default;

private:
    std::vector<Expression> expressions_;
};

class Parser;

[[nodiscard]] bool Accept(Parser &parser, TokenType type);
[[nodiscard]] bool Expect(const Parser &parser, TokenType type);

[[nodiscard]] auto ParseField(std::string_view text, const ParseOptions &options) -> std::string;

[[nodiscard]] auto ParseVector(Parser &parser, std::string first_line) -> std::string;

[[nodiscard]] auto SplitVector(std::string_view braced) -> std::vector<std::string>;

[[nodiscard]] auto ParseExpression(Parser &parser, const ParseOptions &options) -> Expression;

[[nodiscard]] auto Parse(Parser &parser, const ParseOptions &options = {}) -> Fields;

/// Merges 'key=value' lines of the 'description' field into \a fields.
void FlattenDescription(Fields &fields, const ParseOptions &options);

/// Tokenizes and parses a whole header, throws FormatError on malformed input.
[[nodiscard]] Fields ParseText(std::istream &iss, const ParseOptions &options = {});

/// Writes \a fields back to header text that ParseText reads into equal Fields.
[[nodiscard]] std::string DumpEnvi(const Fields &fields);

[[nodiscard]] std::string ToLower(std::string_view text);


class Parser
{
public:
    explicit Parser(std::vector<Token> tokens): tokens_{std::move(tokens)}, pos_{0} {}

    [[nodiscard]] const Token& Get() const noexcept { return tokens_[pos_]; }

    [[nodiscard]] bool End() const { return pos_ >= tokens_.size(); }

    void Next() { ++pos_; }

private:
    std::vector<Token> tokens_;
    std::size_t pos_;
};

}

#endif //HYSPEXCPP_ENVIPARSER_HPP
