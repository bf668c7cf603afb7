#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pysandbox::validator::python {

enum class TokenKind {
    kName,
    kNumber,
    kString,
    kOp,
    kNewline,
    kIndent,
    kDedent,
    kEndMarker
};

const char* ToString(TokenKind kind);

struct Token {
    TokenKind kind = TokenKind::kEndMarker;
    std::string text;
    int line = 1;
    int column = 0;
};

class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& message, int line)
        : std::runtime_error(message)
        , line_(line) {}

    int Line() const { return line_; }

private:
    int line_;
};

bool IsKeyword(const std::string& word);

// Turns source text into the token stream Python's own tokenizer would
// produce: NEWLINE only at logical line ends, INDENT/DEDENT from leading
// whitespace, implicit joining inside brackets.
class Lexer {
public:
    explicit Lexer(std::string_view source);

    std::vector<Token> Tokenize();

private:
    void HandleLineStart();
    void LexName();
    void LexNumber();
    void LexString(std::size_t prefix_length);
    void LexOperator();
    void Emit(TokenKind kind, std::string text, int line, int column);
    void NewLine();
    [[noreturn]] void Fail(const std::string& message, int line) const;

    char Current() const;
    char PeekChar(std::size_t ahead) const;
    bool AtEnd() const { return pos_ >= source_.size(); }
    int Column() const { return static_cast<int>(pos_ - line_start_); }

    std::string_view source_;
    std::size_t pos_ = 0;
    std::size_t line_start_ = 0;
    int line_ = 1;
    bool at_line_start_ = true;
    std::vector<int> indents_{0};
    // Same stack measured with tabs as one column.
    std::vector<int> alt_indents_{0};
    std::vector<std::pair<char, int>> brackets_;
    std::vector<Token> tokens_;
};

}  // namespace pysandbox::validator::python
