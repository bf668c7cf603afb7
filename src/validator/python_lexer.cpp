#include "validator/python_lexer.hpp"

#include <cctype>
#include <set>

namespace pysandbox::validator::python {
namespace {

const std::set<std::string> kKeywords = {
    "False", "None", "True", "and", "as", "assert", "async", "await",
    "break", "class", "continue", "def", "del", "elif", "else", "except",
    "finally", "for", "from", "global", "if", "import", "in", "is",
    "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
    "while", "with", "yield"
};

const std::set<std::string> kStringPrefixes = {
    "r", "u", "b", "br", "rb", "f", "fr", "rf"
};

const char* const kThreeCharOps[] = {">>=", "<<=", "**=", "//=", "..."};

const char* const kTwoCharOps[] = {
    "**", "//", "<<", ">>", "<=", ">=", "==", "!=", "->", ":=",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@="
};

const std::string kOneCharOps = "+-*/%@&|^~<>()[]{},:;.=";

bool IsIdentStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool IsIdentChar(unsigned char c) {
    return IsIdentStart(c) || std::isdigit(c);
}

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsHexDigit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

std::string Lower(std::string value) {
    for (auto& c : value) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return value;
}

char ClosingFor(char open) {
    switch (open) {
        case '(': return ')';
        case '[': return ']';
        default: return '}';
    }
}

}  // namespace

const char* ToString(TokenKind kind) {
    switch (kind) {
        case TokenKind::kName: return "NAME";
        case TokenKind::kNumber: return "NUMBER";
        case TokenKind::kString: return "STRING";
        case TokenKind::kOp: return "OP";
        case TokenKind::kNewline: return "NEWLINE";
        case TokenKind::kIndent: return "INDENT";
        case TokenKind::kDedent: return "DEDENT";
        case TokenKind::kEndMarker: return "ENDMARKER";
    }
    return "UNKNOWN";
}

bool IsKeyword(const std::string& word) {
    return kKeywords.count(word) > 0;
}

Lexer::Lexer(std::string_view source)
    : source_(source) {}

std::vector<Token> Lexer::Tokenize() {
    while (true) {
        if (at_line_start_) {
            HandleLineStart();
            if (at_line_start_) {
                continue;
            }
        }
        if (AtEnd()) {
            break;
        }

        const char c = Current();
        if (c == ' ' || c == '\t' || c == '\f') {
            ++pos_;
            continue;
        }
        if (c == '#') {
            while (!AtEnd() && Current() != '\n' && Current() != '\r') {
                ++pos_;
            }
            continue;
        }
        if (c == '\n' || c == '\r') {
            if (brackets_.empty()) {
                Emit(TokenKind::kNewline, "", line_, Column());
                at_line_start_ = true;
            }
            NewLine();
            continue;
        }
        if (c == '\\') {
            ++pos_;
            if (AtEnd()) {
                Fail("unexpected EOF while parsing", line_);
            }
            if (Current() == '\n' || Current() == '\r') {
                NewLine();
                continue;
            }
            Fail("unexpected character after line continuation character", line_);
        }
        if (IsIdentStart(static_cast<unsigned char>(c))) {
            LexName();
            continue;
        }
        if (IsDigit(c) || (c == '.' && IsDigit(PeekChar(1)))) {
            LexNumber();
            continue;
        }
        if (c == '\'' || c == '"') {
            LexString(0);
            continue;
        }
        LexOperator();
    }

    if (!brackets_.empty()) {
        const auto& open = brackets_.back();
        Fail(std::string("'") + open.first + "' was never closed", open.second);
    }

    if (!tokens_.empty()) {
        const auto last = tokens_.back().kind;
        if (last != TokenKind::kNewline && last != TokenKind::kDedent && last != TokenKind::kIndent) {
            Emit(TokenKind::kNewline, "", line_, Column());
        }
    }
    while (indents_.size() > 1) {
        indents_.pop_back();
        Emit(TokenKind::kDedent, "", line_, 0);
    }
    Emit(TokenKind::kEndMarker, "", line_, 0);
    return std::move(tokens_);
}

void Lexer::HandleLineStart() {
    int column = 0;
    int alt_column = 0;
    while (!AtEnd()) {
        const char c = Current();
        if (c == ' ') {
            ++column;
            ++alt_column;
        } else if (c == '\t') {
            column = (column / 8 + 1) * 8;
            ++alt_column;
        } else if (c == '\f') {
            column = 0;
            alt_column = 0;
        } else {
            break;
        }
        ++pos_;
    }
    if (AtEnd()) {
        at_line_start_ = false;
        return;
    }

    // Blank and comment-only lines never affect indentation.
    const char c = Current();
    if (c == '#') {
        while (!AtEnd() && Current() != '\n' && Current() != '\r') {
            ++pos_;
        }
        if (AtEnd()) {
            at_line_start_ = false;
        } else {
            NewLine();
        }
        return;
    }
    if (c == '\n' || c == '\r') {
        NewLine();
        return;
    }

    at_line_start_ = false;
    constexpr const char* kInconsistent = "inconsistent use of tabs and spaces in indentation";
    if (column > indents_.back()) {
        if (alt_column <= alt_indents_.back()) {
            Fail(kInconsistent, line_);
        }
        indents_.push_back(column);
        alt_indents_.push_back(alt_column);
        Emit(TokenKind::kIndent, "", line_, 0);
        return;
    }
    while (column < indents_.back()) {
        indents_.pop_back();
        alt_indents_.pop_back();
        Emit(TokenKind::kDedent, "", line_, 0);
    }
    if (column != indents_.back()) {
        Fail("unindent does not match any outer indentation level", line_);
    }
    if (alt_column != alt_indents_.back()) {
        Fail(kInconsistent, line_);
    }
}

void Lexer::LexName() {
    const auto start = pos_;
    const int column = Column();
    while (!AtEnd() && IsIdentChar(static_cast<unsigned char>(Current()))) {
        ++pos_;
    }
    std::string word(source_.substr(start, pos_ - start));
    if ((Current() == '\'' || Current() == '"') && kStringPrefixes.count(Lower(word)) > 0) {
        pos_ = start;
        LexString(word.size());
        return;
    }
    Emit(TokenKind::kName, std::move(word), line_, column);
}

void Lexer::LexNumber() {
    const auto start = pos_;
    const int column = Column();
    auto consume = [this](bool (*accept)(char)) {
        while (!AtEnd() && (accept(Current()) || Current() == '_')) {
            ++pos_;
        }
    };

    const char radix = PeekChar(1);
    if (Current() == '0' && (radix == 'x' || radix == 'X' || radix == 'o' || radix == 'O' ||
                             radix == 'b' || radix == 'B')) {
        pos_ += 2;
        consume(IsHexDigit);
    } else {
        consume(IsDigit);
        if (Current() == '.') {
            ++pos_;
            consume(IsDigit);
        }
        if (Current() == 'e' || Current() == 'E') {
            const char next = PeekChar(1);
            if (IsDigit(next)) {
                ++pos_;
                consume(IsDigit);
            } else if ((next == '+' || next == '-') && IsDigit(PeekChar(2))) {
                pos_ += 2;
                consume(IsDigit);
            }
        }
        if (Current() == 'j' || Current() == 'J') {
            ++pos_;
        }
    }
    Emit(TokenKind::kNumber, std::string(source_.substr(start, pos_ - start)), line_, column);
}

void Lexer::LexString(std::size_t prefix_length) {
    const auto start = pos_;
    const int start_line = line_;
    const int column = Column();
    const auto prefix = Lower(std::string(source_.substr(pos_, prefix_length)));
    const bool formatted = prefix.find('f') != std::string::npos;
    pos_ += prefix_length;

    const char quote = Current();
    const bool triple = PeekChar(1) == quote && PeekChar(2) == quote;
    pos_ += triple ? 3 : 1;

    auto unterminated = [&]() {
        const std::string kind = triple ? "unterminated triple-quoted string literal"
                                        : "unterminated string literal";
        Fail(kind + " (detected at line " + std::to_string(line_) + ")", start_line);
    };

    int brace_depth = 0;
    while (true) {
        if (AtEnd()) {
            unterminated();
        }
        const char c = Current();
        if (c == '\\') {
            ++pos_;
            if (AtEnd()) {
                continue;
            }
            if (Current() == '\n' || Current() == '\r') {
                NewLine();
            } else {
                ++pos_;
            }
            continue;
        }
        if (c == '\n' || c == '\r') {
            if (!triple) {
                unterminated();
            }
            NewLine();
            continue;
        }
        if (formatted) {
            // Replacement fields may hold string literals using the other quote.
            if (c == '{') {
                if (brace_depth == 0 && PeekChar(1) == '{') {
                    pos_ += 2;
                } else {
                    ++brace_depth;
                    ++pos_;
                }
                continue;
            }
            if (c == '}' && brace_depth > 0) {
                --brace_depth;
                ++pos_;
                continue;
            }
            if (brace_depth > 0 && c != quote && (c == '\'' || c == '"')) {
                ++pos_;
                while (!AtEnd() && Current() != c && Current() != '\n' && Current() != '\r') {
                    ++pos_;
                }
                if (!AtEnd() && Current() == c) {
                    ++pos_;
                }
                continue;
            }
        }
        if (c == quote) {
            if (!triple) {
                ++pos_;
                break;
            }
            if (PeekChar(1) == quote && PeekChar(2) == quote) {
                pos_ += 3;
                break;
            }
        }
        ++pos_;
    }
    Emit(TokenKind::kString, std::string(source_.substr(start, pos_ - start)), start_line, column);
}

void Lexer::LexOperator() {
    const int column = Column();
    const auto rest = source_.substr(pos_);
    for (const char* op : kThreeCharOps) {
        if (rest.substr(0, 3) == op) {
            Emit(TokenKind::kOp, op, line_, column);
            pos_ += 3;
            return;
        }
    }
    for (const char* op : kTwoCharOps) {
        if (rest.substr(0, 2) == op) {
            Emit(TokenKind::kOp, op, line_, column);
            pos_ += 2;
            return;
        }
    }

    const char c = Current();
    if (kOneCharOps.find(c) == std::string::npos) {
        Fail("invalid syntax", line_);
    }
    if (c == '(' || c == '[' || c == '{') {
        brackets_.emplace_back(c, line_);
    } else if (c == ')' || c == ']' || c == '}') {
        if (brackets_.empty()) {
            Fail(std::string("unmatched '") + c + "'", line_);
        }
        const char open = brackets_.back().first;
        if (c != ClosingFor(open)) {
            Fail(std::string("closing parenthesis '") + c +
                 "' does not match opening parenthesis '" + open + "'", line_);
        }
        brackets_.pop_back();
    }
    Emit(TokenKind::kOp, std::string(1, c), line_, column);
    ++pos_;
}

void Lexer::Emit(TokenKind kind, std::string text, int line, int column) {
    tokens_.push_back(Token{kind, std::move(text), line, column});
}

void Lexer::NewLine() {
    if (Current() == '\r' && PeekChar(1) == '\n') {
        pos_ += 2;
    } else {
        ++pos_;
    }
    ++line_;
    line_start_ = pos_;
}

void Lexer::Fail(const std::string& message, int line) const {
    throw SyntaxError(message, line);
}

char Lexer::Current() const {
    return PeekChar(0);
}

char Lexer::PeekChar(std::size_t ahead) const {
    const auto index = pos_ + ahead;
    return index < source_.size() ? source_[index] : '\0';
}

}  // namespace pysandbox::validator::python
