#include "validator/python_parser.hpp"

#include <cctype>
#include <utility>

namespace pysandbox::validator::python {
namespace {

const char* const kAugmentedOps[] = {
    "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**="
};

const char* const kComparisonOps[] = {"==", "!=", "<", "<=", ">", ">="};

// Binary operator precedence levels, loosest first.
const std::vector<std::vector<std::string>> kBinaryLevels = {
    {"|"},
    {"^"},
    {"&"},
    {"<<", ">>"},
    {"+", "-"},
    {"*", "/", "//", "%", "@"}
};

std::string Describe(const Node& node) {
    switch (node.kind) {
        case NodeKind::kCall: return "function call";
        case NodeKind::kConstant:
            if (node.value == "True" || node.value == "False" || node.value == "None") {
                return node.value;
            }
            return node.value == "..." ? "ellipsis" : "literal";
        case NodeKind::kJoinedStr: return "f-string expression";
        case NodeKind::kCompare: return "comparison";
        case NodeKind::kLambda: return "lambda";
        case NodeKind::kIfExp: return "conditional expression";
        case NodeKind::kNamedExpr: return "named expression";
        case NodeKind::kAwait: return "await expression";
        case NodeKind::kYield:
        case NodeKind::kYieldFrom: return "yield expression";
        case NodeKind::kDict: return "dict literal";
        case NodeKind::kSet: return "set display";
        case NodeKind::kListComp: return "list comprehension";
        case NodeKind::kSetComp: return "set comprehension";
        case NodeKind::kDictComp: return "dict comprehension";
        case NodeKind::kGeneratorExp: return "generator expression";
        default: return "expression";
    }
}

bool IsSimpleTarget(const Node& node) {
    return node.kind == NodeKind::kName || node.kind == NodeKind::kAttribute ||
           node.kind == NodeKind::kSubscript;
}

void Append(Node& parent, NodePtr child) {
    parent.children.push_back(std::move(child));
}

// Adjacent literal pieces of an f-string collapse into one Constant.
void AppendLiteral(Node& joined, int line) {
    if (!joined.children.empty() && joined.children.back()->kind == NodeKind::kConstant) {
        return;
    }
    Append(joined, MakeNode(NodeKind::kConstant, line, "str"));
}

void ShiftLines(Node& node, int delta) {
    node.line += delta;
    for (auto& child : node.children) {
        ShiftLines(*child, delta);
    }
}

// Lowercased prefix letters in front of the opening quote.
std::string StringPrefix(const std::string& text) {
    std::string prefix;
    for (const char c : text) {
        if (c == '\'' || c == '"') {
            break;
        }
        prefix += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return prefix;
}

std::string StringBody(const std::string& text, std::size_t prefix_length) {
    const char quote = text[prefix_length];
    const bool triple = text.size() >= prefix_length + 6 &&
                        text.compare(prefix_length, 3, std::string(3, quote)) == 0;
    const std::size_t quotes = triple ? 3 : 1;
    return text.substr(prefix_length + quotes, text.size() - prefix_length - 2 * quotes);
}

bool IsBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n\f") == std::string::npos;
}

}  // namespace

NodePtr Parse(std::string_view source) {
    Lexer lexer(source);
    Parser parser(lexer.Tokenize());
    return parser.ParseModule();
}

Parser::Parser(std::vector<Token> tokens)
    : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().kind != TokenKind::kEndMarker) {
        const int line = tokens_.empty() ? 1 : tokens_.back().line;
        tokens_.push_back(Token{TokenKind::kEndMarker, "", line, 0});
    }
}

NodePtr Parser::ParseModule() {
    auto module = MakeNode(NodeKind::kModule, 1);
    while (Peek().kind != TokenKind::kEndMarker) {
        if (Peek().kind == TokenKind::kNewline) {
            Advance();
            continue;
        }
        ParseStatement(module->children);
    }
    return module;
}

// ---------------------------------------------------------------------------
// Statements

void Parser::ParseStatement(std::vector<NodePtr>& out) {
    const Token& token = Peek();
    if (token.kind == TokenKind::kIndent) {
        Fail("unexpected indent", token.line);
    }
    if (token.kind == TokenKind::kDedent) {
        Fail("invalid syntax", token.line);
    }
    if (CheckOp("@")) {
        out.push_back(ParseDecorated());
        return;
    }
    if (token.kind == TokenKind::kName) {
        const int line = token.line;
        const std::string& word = token.text;
        if (word == "def") {
            out.push_back(ParseFunctionDef(false, line));
            return;
        }
        if (word == "class") {
            out.push_back(ParseClassDef());
            return;
        }
        if (word == "if") {
            out.push_back(ParseIf("if"));
            return;
        }
        if (word == "while") {
            out.push_back(ParseWhile());
            return;
        }
        if (word == "for") {
            out.push_back(ParseFor(false, line));
            return;
        }
        if (word == "try") {
            out.push_back(ParseTry());
            return;
        }
        if (word == "with") {
            out.push_back(ParseWith(false, line));
            return;
        }
        if (word == "async") {
            Advance();
            if (CheckKeyword("def")) {
                out.push_back(ParseFunctionDef(true, line));
            } else if (CheckKeyword("for")) {
                out.push_back(ParseFor(true, line));
            } else if (CheckKeyword("with")) {
                out.push_back(ParseWith(true, line));
            } else {
                Fail("invalid syntax");
            }
            return;
        }
        if (word == "match" && TryParseMatch(out)) {
            return;
        }
    }
    ParseSimpleStatements(out);
}

void Parser::ParseSimpleStatements(std::vector<NodePtr>& out) {
    while (true) {
        out.push_back(ParseSmallStatement());
        if (!AcceptOp(";")) {
            break;
        }
        if (Peek().kind == TokenKind::kNewline || Peek().kind == TokenKind::kEndMarker) {
            break;
        }
    }
    if (Peek().kind == TokenKind::kEndMarker) {
        return;
    }
    if (Peek().kind != TokenKind::kNewline) {
        Fail("invalid syntax");
    }
    Advance();
}

NodePtr Parser::ParseSmallStatement() {
    const Token& token = Peek();
    const int line = token.line;
    if (token.kind != TokenKind::kName) {
        return ParseExpressionStatement();
    }

    const std::string word = token.text;
    if (word == "pass") {
        Advance();
        return MakeNode(NodeKind::kPass, line);
    }
    if (word == "break") {
        Advance();
        return MakeNode(NodeKind::kBreak, line);
    }
    if (word == "continue") {
        Advance();
        return MakeNode(NodeKind::kContinue, line);
    }
    if (word == "return") {
        Advance();
        auto node = MakeNode(NodeKind::kReturn, line);
        if (!AtExpressionEnd()) {
            Append(*node, ParseStarExpressions());
        }
        return node;
    }
    if (word == "raise") {
        Advance();
        auto node = MakeNode(NodeKind::kRaise, line);
        if (!AtExpressionEnd()) {
            Append(*node, ParseExpression());
            if (AcceptKeyword("from")) {
                Append(*node, ParseExpression());
            }
        }
        return node;
    }
    if (word == "global" || word == "nonlocal") {
        Advance();
        auto node = MakeNode(word == "global" ? NodeKind::kGlobal : NodeKind::kNonlocal, line);
        do {
            Append(*node, MakeNode(NodeKind::kName, Peek().line, ExpectIdentifier()));
        } while (AcceptOp(","));
        return node;
    }
    if (word == "del") {
        Advance();
        auto node = MakeNode(NodeKind::kDelete, line);
        do {
            if (AtExpressionEnd()) {
                break;
            }
            auto target = ParseBinary(0);
            CheckTarget(*target);
            Append(*node, std::move(target));
        } while (AcceptOp(","));
        if (node->children.empty()) {
            Fail("invalid syntax");
        }
        return node;
    }
    if (word == "assert") {
        Advance();
        auto node = MakeNode(NodeKind::kAssert, line);
        Append(*node, ParseExpression());
        if (AcceptOp(",")) {
            Append(*node, ParseExpression());
        }
        return node;
    }
    if (word == "import") {
        return ParseImport();
    }
    if (word == "from") {
        return ParseImportFrom();
    }
    if (word == "print") {
        const Token& next = Peek(1);
        if (next.kind == TokenKind::kString || next.kind == TokenKind::kNumber ||
            (next.kind == TokenKind::kName && !IsKeyword(next.text))) {
            Fail("Missing parentheses in call to 'print'. Did you mean print(...)?", line);
        }
    }
    return ParseExpressionStatement();
}

NodePtr Parser::ParseExpressionStatement() {
    const int line = Peek().line;
    NodePtr first = CheckKeyword("yield") ? ParseYield() : ParseStarExpressions();

    for (const char* op : kAugmentedOps) {
        if (CheckOp(op)) {
            if (!IsSimpleTarget(*first)) {
                Fail("'" + Describe(*first) + "' is an illegal expression for augmented assignment",
                     first->line);
            }
            Advance();
            auto node = MakeNode(NodeKind::kAugAssign, line, op);
            Append(*node, std::move(first));
            Append(*node, CheckKeyword("yield") ? ParseYield() : ParseStarExpressions());
            return node;
        }
    }

    if (CheckOp(":")) {
        if (!IsSimpleTarget(*first)) {
            if (first->kind == NodeKind::kTuple) {
                Fail("only single target (not tuple) can be annotated", first->line);
            }
            Fail("illegal target for annotation", first->line);
        }
        Advance();
        auto node = MakeNode(NodeKind::kAnnAssign, line);
        Append(*node, std::move(first));
        Append(*node, ParseExpression());
        if (AcceptOp("=")) {
            Append(*node, CheckKeyword("yield") ? ParseYield() : ParseStarExpressions());
        }
        return node;
    }

    if (CheckOp("=")) {
        auto node = MakeNode(NodeKind::kAssign, line);
        Append(*node, std::move(first));
        while (AcceptOp("=")) {
            Append(*node, CheckKeyword("yield") ? ParseYield() : ParseStarExpressions());
        }
        for (std::size_t i = 0; i + 1 < node->children.size(); ++i) {
            CheckTarget(*node->children[i]);
        }
        return node;
    }

    auto node = MakeNode(NodeKind::kExpr, line);
    Append(*node, std::move(first));
    return node;
}

NodePtr Parser::ParseImport() {
    const int line = Advance().line;
    auto node = MakeNode(NodeKind::kImport, line);
    do {
        const int alias_line = Peek().line;
        std::string name = ExpectIdentifier();
        while (AcceptOp(".")) {
            name += "." + ExpectIdentifier();
        }
        auto alias = MakeNode(NodeKind::kAlias, alias_line, std::move(name));
        if (AcceptKeyword("as")) {
            ExpectIdentifier();
        }
        Append(*node, std::move(alias));
    } while (AcceptOp(","));
    return node;
}

NodePtr Parser::ParseImportFrom() {
    const int line = Advance().line;
    auto node = MakeNode(NodeKind::kImportFrom, line);
    while (true) {
        if (AcceptOp(".")) {
            node->level += 1;
        } else if (AcceptOp("...")) {
            node->level += 3;
        } else {
            break;
        }
    }
    if (!CheckKeyword("import")) {
        std::string module = ExpectIdentifier();
        while (AcceptOp(".")) {
            module += "." + ExpectIdentifier();
        }
        node->value = std::move(module);
    } else if (node->level == 0) {
        Fail("invalid syntax");
    }
    ExpectKeyword("import");

    if (CheckOp("*")) {
        Append(*node, MakeNode(NodeKind::kAlias, Advance().line, "*"));
        return node;
    }
    const bool parenthesized = AcceptOp("(");
    do {
        if (parenthesized && CheckOp(")")) {
            break;
        }
        const int alias_line = Peek().line;
        auto alias = MakeNode(NodeKind::kAlias, alias_line, ExpectIdentifier());
        if (AcceptKeyword("as")) {
            ExpectIdentifier();
        }
        Append(*node, std::move(alias));
    } while (AcceptOp(","));
    if (parenthesized) {
        ExpectOp(")");
    }
    if (node->children.empty()) {
        Fail("invalid syntax");
    }
    return node;
}

NodePtr Parser::ParseIf(const char* keyword) {
    const int line = Advance().line;
    auto node = MakeNode(NodeKind::kIf, line);
    Append(*node, ParseNamedExpression());
    ParseBlock(*node, std::string("'") + keyword + "' statement", line);
    if (CheckKeyword("elif")) {
        Append(*node, ParseIf("elif"));
    } else if (CheckKeyword("else")) {
        const int else_line = Advance().line;
        ParseBlock(*node, "'else' statement", else_line);
    }
    return node;
}

NodePtr Parser::ParseWhile() {
    const int line = Advance().line;
    auto node = MakeNode(NodeKind::kWhile, line);
    Append(*node, ParseNamedExpression());
    ParseBlock(*node, "'while' statement", line);
    if (CheckKeyword("else")) {
        const int else_line = Advance().line;
        ParseBlock(*node, "'else' statement", else_line);
    }
    return node;
}

NodePtr Parser::ParseFor(bool is_async, int line) {
    ExpectKeyword("for");
    auto node = MakeNode(is_async ? NodeKind::kAsyncFor : NodeKind::kFor, line);
    Append(*node, ParseTargetList());
    ExpectKeyword("in");
    Append(*node, ParseStarExpressions());
    ParseBlock(*node, "'for' statement", line);
    if (CheckKeyword("else")) {
        const int else_line = Advance().line;
        ParseBlock(*node, "'else' statement", else_line);
    }
    return node;
}

NodePtr Parser::ParseTry() {
    const int line = Advance().line;
    auto node = MakeNode(NodeKind::kTry, line);
    ParseBlock(*node, "'try' statement", line);

    bool has_handlers = false;
    while (CheckKeyword("except")) {
        const int handler_line = Advance().line;
        const bool star = AcceptOp("*");
        if (star) {
            node->kind = NodeKind::kTryStar;
        }
        auto handler = MakeNode(NodeKind::kExceptHandler, handler_line);
        if (!CheckOp(":")) {
            Append(*handler, ParseExpression());
            if (CheckOp(",")) {
                Fail("multiple exception types must be parenthesized");
            }
            if (AcceptKeyword("as")) {
                handler->value = ExpectIdentifier();
            }
        } else if (star) {
            Fail("expected one or more exception types");
        }
        ParseBlock(*handler, star ? "'except*' statement" : "'except' statement", handler_line);
        Append(*node, std::move(handler));
        has_handlers = true;
    }
    if (has_handlers && CheckKeyword("else")) {
        const int else_line = Advance().line;
        ParseBlock(*node, "'else' statement", else_line);
    }
    bool has_finally = false;
    if (CheckKeyword("finally")) {
        const int finally_line = Advance().line;
        ParseBlock(*node, "'finally' statement", finally_line);
        has_finally = true;
    }
    if (!has_handlers && !has_finally) {
        Fail("expected 'except' or 'finally' block");
    }
    return node;
}

NodePtr Parser::ParseWith(bool is_async, int line) {
    ExpectKeyword("with");
    auto node = MakeNode(is_async ? NodeKind::kAsyncWith : NodeKind::kWith, line);

    // `with (a as b, c as d):` is only a parenthesized item list when the
    // closing parenthesis is followed by the colon.
    bool parsed = false;
    if (CheckOp("(")) {
        const std::size_t saved = pos_;
        auto attempt = MakeNode(node->kind, line);
        try {
            Advance();
            ParseWithItems(*attempt, ")");
            ExpectOp(")");
            parsed = CheckOp(":");
        } catch (const SyntaxError&) {
            parsed = false;
        }
        if (parsed) {
            node = std::move(attempt);
        } else {
            pos_ = saved;
        }
    }
    if (!parsed) {
        ParseWithItems(*node, nullptr);
    }
    ParseBlock(*node, "'with' statement", line);
    return node;
}

void Parser::ParseWithItems(Node& owner, const char* closing) {
    do {
        if (closing != nullptr && CheckOp(closing)) {
            break;
        }
        auto item = MakeNode(NodeKind::kWithItem, Peek().line);
        Append(*item, ParseExpression());
        if (AcceptKeyword("as")) {
            auto target = ParseTarget();
            CheckTarget(*target);
            Append(*item, std::move(target));
        }
        Append(owner, std::move(item));
    } while (AcceptOp(","));
    if (owner.children.empty()) {
        Fail("invalid syntax");
    }
}

NodePtr Parser::ParseFunctionDef(bool is_async, int line) {
    ExpectKeyword("def");
    auto node = MakeNode(is_async ? NodeKind::kAsyncFunctionDef : NodeKind::kFunctionDef, line,
                         ExpectIdentifier());
    ExpectOp("(");
    Append(*node, ParseParameters(")", true));
    ExpectOp(")");
    if (AcceptOp("->")) {
        Append(*node, ParseExpression());
    }
    ParseBlock(*node, "function definition", line);
    return node;
}

NodePtr Parser::ParseClassDef() {
    const int line = Advance().line;
    auto node = MakeNode(NodeKind::kClassDef, line, ExpectIdentifier());
    if (AcceptOp("(")) {
        ParseCallArguments(*node);
    }
    ParseBlock(*node, "class definition", line);
    return node;
}

NodePtr Parser::ParseDecorated() {
    std::vector<NodePtr> decorators;
    while (AcceptOp("@")) {
        decorators.push_back(ParseNamedExpression());
        if (Peek().kind != TokenKind::kNewline) {
            Fail("invalid syntax");
        }
        Advance();
    }

    const int line = Peek().line;
    NodePtr node;
    if (CheckKeyword("def")) {
        node = ParseFunctionDef(false, line);
    } else if (CheckKeyword("class")) {
        node = ParseClassDef();
    } else if (CheckKeyword("async") && CheckKeyword("def", 1)) {
        Advance();
        node = ParseFunctionDef(true, line);
    } else {
        Fail("invalid syntax");
    }
    for (auto& decorator : decorators) {
        Append(*node, std::move(decorator));
    }
    return node;
}

bool Parser::TryParseMatch(std::vector<NodePtr>& out) {
    // `match` is a soft keyword: the statement form needs a subject followed
    // by ':' and a newline, anything else is an ordinary expression.
    const std::size_t saved = pos_;
    const int line = Advance().line;
    NodePtr subject;
    try {
        subject = ParseStarNamedExpressions();
    } catch (const SyntaxError&) {
        pos_ = saved;
        return false;
    }
    if (!CheckOp(":") || Peek(1).kind != TokenKind::kNewline) {
        pos_ = saved;
        return false;
    }

    auto node = MakeNode(NodeKind::kMatch, line);
    Append(*node, std::move(subject));
    Advance();
    Advance();
    if (Peek().kind != TokenKind::kIndent) {
        Fail("expected an indented block after 'match' statement on line " + std::to_string(line));
    }
    Advance();
    while (CheckKeyword("case")) {
        const int case_line = Advance().line;
        auto match_case = MakeNode(NodeKind::kMatchCase, case_line);
        Append(*match_case, ParsePatterns());
        if (AcceptKeyword("if")) {
            Append(*match_case, ParseNamedExpression());
        }
        ParseBlock(*match_case, "'case' statement", case_line);
        Append(*node, std::move(match_case));
    }
    if (node->children.size() < 2 || Peek().kind != TokenKind::kDedent) {
        Fail("invalid syntax");
    }
    Advance();
    out.push_back(std::move(node));
    return true;
}

void Parser::ParseBlock(Node& owner, const std::string& what, int line) {
    ExpectColon();
    if (Peek().kind != TokenKind::kNewline) {
        ParseSimpleStatements(owner.children);
        return;
    }
    Advance();
    if (Peek().kind != TokenKind::kIndent) {
        Fail("expected an indented block after " + what + " on line " + std::to_string(line));
    }
    Advance();
    while (Peek().kind != TokenKind::kDedent && Peek().kind != TokenKind::kEndMarker) {
        ParseStatement(owner.children);
    }
    if (Peek().kind == TokenKind::kDedent) {
        Advance();
    }
}

// ---------------------------------------------------------------------------
// Patterns

NodePtr Parser::ParsePatterns() {
    auto first = ParsePattern();
    if (!CheckOp(",")) {
        return first;
    }
    auto sequence = MakeNode(NodeKind::kPattern, first->line, "sequence");
    Append(*sequence, std::move(first));
    while (AcceptOp(",")) {
        if (CheckOp(":") || CheckKeyword("if")) {
            break;
        }
        Append(*sequence, ParsePattern());
    }
    return sequence;
}

NodePtr Parser::ParsePattern() {
    auto first = ParseClosedPattern();
    if (CheckOp("|")) {
        auto alternatives = MakeNode(NodeKind::kPattern, first->line, "or");
        Append(*alternatives, std::move(first));
        while (AcceptOp("|")) {
            Append(*alternatives, ParseClosedPattern());
        }
        first = std::move(alternatives);
    }
    if (AcceptKeyword("as")) {
        auto capture = MakeNode(NodeKind::kPattern, first->line, "as");
        Append(*capture, std::move(first));
        Append(*capture, MakeNode(NodeKind::kName, Peek().line, ExpectIdentifier()));
        return capture;
    }
    return first;
}

NodePtr Parser::ParseClosedPattern() {
    const Token& token = Peek();
    const int line = token.line;

    if (AcceptOp("(")) {
        auto group = MakeNode(NodeKind::kPattern, line, "group");
        ParsePatternList(*group, ")");
        return group;
    }
    if (AcceptOp("[")) {
        auto sequence = MakeNode(NodeKind::kPattern, line, "sequence");
        ParsePatternList(*sequence, "]");
        return sequence;
    }
    if (AcceptOp("{")) {
        auto mapping = MakeNode(NodeKind::kPattern, line, "mapping");
        while (!CheckOp("}")) {
            if (AcceptOp("**")) {
                Append(*mapping, MakeNode(NodeKind::kName, Peek().line, ExpectIdentifier()));
            } else {
                Append(*mapping, ParseClosedPattern());
                ExpectOp(":");
                Append(*mapping, ParsePattern());
            }
            if (!AcceptOp(",")) {
                break;
            }
        }
        ExpectOp("}");
        return mapping;
    }
    if (AcceptOp("*")) {
        return MakeNode(NodeKind::kPattern, line, "*" + ExpectIdentifier());
    }
    if (CheckOp("-") || token.kind == TokenKind::kNumber) {
        std::string literal;
        if (AcceptOp("-")) {
            literal = "-";
        }
        if (Peek().kind != TokenKind::kNumber) {
            Fail("invalid syntax");
        }
        literal += Advance().text;
        if (CheckOp("+") || CheckOp("-")) {
            literal += Advance().text;
            if (Peek().kind != TokenKind::kNumber) {
                Fail("invalid syntax");
            }
            literal += Advance().text;
        }
        return MakeNode(NodeKind::kPattern, line, literal);
    }
    if (token.kind == TokenKind::kString) {
        auto value = MakeNode(NodeKind::kPattern, line, "value");
        Append(*value, ParseStrings());
        return value;
    }
    if (CheckKeyword("None") || CheckKeyword("True") || CheckKeyword("False")) {
        return MakeNode(NodeKind::kPattern, line, Advance().text);
    }
    if (CheckIdentifier()) {
        std::string name = Advance().text;
        while (AcceptOp(".")) {
            name += "." + ExpectIdentifier();
        }
        if (!AcceptOp("(")) {
            return MakeNode(NodeKind::kPattern, line, name);
        }
        auto class_pattern = MakeNode(NodeKind::kPattern, line, name);
        while (!CheckOp(")")) {
            if (CheckIdentifier() && CheckOp("=", 1)) {
                Advance();
                Advance();
            }
            Append(*class_pattern, ParsePattern());
            if (!AcceptOp(",")) {
                break;
            }
        }
        ExpectOp(")");
        return class_pattern;
    }
    Fail("invalid syntax");
}

void Parser::ParsePatternList(Node& owner, const char* closing) {
    while (!CheckOp(closing)) {
        Append(owner, ParsePattern());
        if (!AcceptOp(",")) {
            break;
        }
    }
    ExpectOp(closing);
}

// ---------------------------------------------------------------------------
// Expressions

NodePtr Parser::ParseStarExpressions() {
    auto first = ParseStarExpression();
    if (!CheckOp(",")) {
        return first;
    }
    auto tuple = MakeNode(NodeKind::kTuple, first->line);
    Append(*tuple, std::move(first));
    while (AcceptOp(",")) {
        if (AtExpressionEnd()) {
            break;
        }
        Append(*tuple, ParseStarExpression());
    }
    return tuple;
}

NodePtr Parser::ParseStarExpression() {
    if (CheckOp("*")) {
        auto node = MakeNode(NodeKind::kStarred, Advance().line);
        Append(*node, ParseBinary(0));
        return node;
    }
    return ParseExpression();
}

NodePtr Parser::ParseStarNamedExpressions() {
    auto first = ParseStarNamedExpression();
    if (!CheckOp(",")) {
        return first;
    }
    auto tuple = MakeNode(NodeKind::kTuple, first->line);
    Append(*tuple, std::move(first));
    while (AcceptOp(",")) {
        if (AtExpressionEnd()) {
            break;
        }
        Append(*tuple, ParseStarNamedExpression());
    }
    return tuple;
}

NodePtr Parser::ParseStarNamedExpression() {
    if (CheckOp("*")) {
        auto node = MakeNode(NodeKind::kStarred, Advance().line);
        Append(*node, ParseBinary(0));
        return node;
    }
    return ParseNamedExpression();
}

NodePtr Parser::ParseNamedExpression() {
    if (CheckIdentifier() && CheckOp(":=", 1)) {
        const Token& name = Advance();
        auto node = MakeNode(NodeKind::kNamedExpr, name.line);
        Append(*node, MakeNode(NodeKind::kName, name.line, name.text));
        Advance();
        Append(*node, ParseExpression());
        return node;
    }
    return ParseExpression();
}

NodePtr Parser::ParseExpression() {
    if (CheckKeyword("lambda")) {
        return ParseLambda();
    }
    auto body = ParseDisjunction();
    if (!CheckKeyword("if")) {
        return body;
    }
    auto node = MakeNode(NodeKind::kIfExp, Advance().line);
    auto test = ParseDisjunction();
    if (!AcceptKeyword("else")) {
        Fail("expected 'else' after 'if' expression");
    }
    Append(*node, std::move(test));
    Append(*node, std::move(body));
    Append(*node, ParseExpression());
    return node;
}

NodePtr Parser::ParseLambda() {
    auto node = MakeNode(NodeKind::kLambda, Advance().line);
    Append(*node, ParseParameters(":", false));
    ExpectOp(":");
    Append(*node, ParseExpression());
    return node;
}

NodePtr Parser::ParseDisjunction() {
    auto first = ParseConjunction();
    if (!CheckKeyword("or")) {
        return first;
    }
    auto node = MakeNode(NodeKind::kBoolOp, first->line, "or");
    Append(*node, std::move(first));
    while (AcceptKeyword("or")) {
        Append(*node, ParseConjunction());
    }
    return node;
}

NodePtr Parser::ParseConjunction() {
    auto first = ParseInversion();
    if (!CheckKeyword("and")) {
        return first;
    }
    auto node = MakeNode(NodeKind::kBoolOp, first->line, "and");
    Append(*node, std::move(first));
    while (AcceptKeyword("and")) {
        Append(*node, ParseInversion());
    }
    return node;
}

NodePtr Parser::ParseInversion() {
    if (CheckKeyword("not")) {
        auto node = MakeNode(NodeKind::kUnaryOp, Advance().line, "not");
        Append(*node, ParseInversion());
        return node;
    }
    return ParseComparison();
}

NodePtr Parser::ParseComparison() {
    auto left = ParseBinary(0);
    NodePtr node;
    while (true) {
        std::string op;
        bool matched = false;
        for (const char* candidate : kComparisonOps) {
            if (CheckOp(candidate)) {
                op = Advance().text;
                matched = true;
                break;
            }
        }
        if (!matched) {
            if (CheckKeyword("in")) {
                op = Advance().text;
            } else if (CheckKeyword("not") && CheckKeyword("in", 1)) {
                Advance();
                Advance();
                op = "not in";
            } else if (CheckKeyword("is")) {
                Advance();
                op = AcceptKeyword("not") ? "is not" : "is";
            } else {
                break;
            }
        }
        if (!node) {
            node = MakeNode(NodeKind::kCompare, left->line, op);
            Append(*node, std::move(left));
        }
        Append(*node, ParseBinary(0));
    }
    return node ? std::move(node) : std::move(left);
}

NodePtr Parser::ParseBinary(int level) {
    if (level >= static_cast<int>(kBinaryLevels.size())) {
        return ParseFactor();
    }
    auto left = ParseBinary(level + 1);
    while (true) {
        std::string op;
        for (const auto& candidate : kBinaryLevels[level]) {
            if (CheckOp(candidate.c_str())) {
                op = candidate;
                break;
            }
        }
        if (op.empty()) {
            return left;
        }
        auto node = MakeNode(NodeKind::kBinOp, Advance().line, op);
        Append(*node, std::move(left));
        Append(*node, ParseBinary(level + 1));
        left = std::move(node);
    }
}

NodePtr Parser::ParseFactor() {
    if (CheckOp("+") || CheckOp("-") || CheckOp("~")) {
        const Token& op = Advance();
        auto node = MakeNode(NodeKind::kUnaryOp, op.line, op.text);
        Append(*node, ParseFactor());
        return node;
    }
    return ParsePower();
}

NodePtr Parser::ParsePower() {
    auto base = ParseAwaitPrimary();
    if (!CheckOp("**")) {
        return base;
    }
    auto node = MakeNode(NodeKind::kBinOp, Advance().line, "**");
    Append(*node, std::move(base));
    Append(*node, ParseFactor());
    return node;
}

NodePtr Parser::ParseAwaitPrimary() {
    if (CheckKeyword("await")) {
        auto node = MakeNode(NodeKind::kAwait, Advance().line);
        Append(*node, ParsePrimary());
        return node;
    }
    return ParsePrimary();
}

NodePtr Parser::ParsePrimary() {
    auto node = ParseAtom();
    while (true) {
        if (CheckOp(".")) {
            const int line = Advance().line;
            auto attribute = MakeNode(NodeKind::kAttribute, line, ExpectIdentifier());
            Append(*attribute, std::move(node));
            node = std::move(attribute);
        } else if (CheckOp("(")) {
            auto call = MakeNode(NodeKind::kCall, Advance().line);
            Append(*call, std::move(node));
            ParseCallArguments(*call);
            node = std::move(call);
        } else if (CheckOp("[")) {
            auto subscript = MakeNode(NodeKind::kSubscript, Advance().line);
            Append(*subscript, std::move(node));
            Append(*subscript, ParseSlices());
            ExpectOp("]");
            node = std::move(subscript);
        } else {
            return node;
        }
    }
}

NodePtr Parser::ParseAtom() {
    const Token& token = Peek();
    const int line = token.line;
    switch (token.kind) {
        case TokenKind::kName:
            if (token.text == "True" || token.text == "False" || token.text == "None") {
                return MakeNode(NodeKind::kConstant, line, Advance().text);
            }
            if (IsKeyword(token.text)) {
                Fail("invalid syntax");
            }
            return MakeNode(NodeKind::kName, line, Advance().text);
        case TokenKind::kNumber:
            return MakeNode(NodeKind::kConstant, line, Advance().text);
        case TokenKind::kString:
            return ParseStrings();
        case TokenKind::kOp:
            if (token.text == "...") {
                Advance();
                return MakeNode(NodeKind::kConstant, line, "...");
            }
            if (token.text == "(") {
                return ParseParenthesized();
            }
            if (token.text == "[") {
                return ParseListDisplay();
            }
            if (token.text == "{") {
                return ParseBraceDisplay();
            }
            break;
        case TokenKind::kIndent:
            Fail("unexpected indent");
        default:
            break;
    }
    Fail("invalid syntax");
}

NodePtr Parser::ParseStrings() {
    const int line = Peek().line;
    std::vector<Token> parts;
    bool formatted = false;
    bool bytes = false;
    while (Peek().kind == TokenKind::kString) {
        parts.push_back(Advance());
        const auto prefix = StringPrefix(parts.back().text);
        formatted = formatted || prefix.find('f') != std::string::npos;
        bytes = bytes || prefix.find('b') != std::string::npos;
    }
    if (!formatted) {
        return MakeNode(NodeKind::kConstant, line, bytes ? "bytes" : "str");
    }

    auto joined = MakeNode(NodeKind::kJoinedStr, line);
    for (const auto& part : parts) {
        const auto prefix = StringPrefix(part.text);
        const auto body = StringBody(part.text, prefix.size());
        if (prefix.find('f') == std::string::npos) {
            if (!body.empty()) {
                AppendLiteral(*joined, part.line);
            }
            continue;
        }
        ParseFormattedBody(body, prefix.find('r') != std::string::npos, part.line, *joined, 0);
    }
    return joined;
}

// Splits an f-string body into literal runs and replacement fields.
void Parser::ParseFormattedBody(const std::string& body, bool raw, int line, Node& joined, int depth) const {
    bool literal = false;
    auto flush = [&]() {
        if (literal) {
            AppendLiteral(joined, line);
            literal = false;
        }
    };

    std::size_t i = 0;
    while (i < body.size()) {
        const char c = body[i];
        const char next = i + 1 < body.size() ? body[i + 1] : '\0';
        if (c == '\\' && !raw) {
            literal = true;
            if (next == 'N' && i + 2 < body.size() && body[i + 2] == '{') {
                const auto close = body.find('}', i);
                i = close == std::string::npos ? body.size() : close + 1;
                continue;
            }
            if (next == '\n') {
                ++line;
            }
            i += (next == '{' || next == '}' || next == '\0') ? 1 : 2;
            continue;
        }
        if (c == '{' || c == '}') {
            if (next == c) {
                literal = true;
                i += 2;
                continue;
            }
            if (c == '}') {
                Fail("f-string: single '}' is not allowed", line);
            }
            flush();
            i = ParseReplacementField(body, i + 1, raw, line, joined, depth);
            continue;
        }
        if (c == '\n') {
            ++line;
        }
        literal = true;
        ++i;
    }
    flush();
}

// Parses the field opened just before `start` and returns the index past its '}'.
std::size_t Parser::ParseReplacementField(const std::string& body, std::size_t start, bool raw, int& line,
                                          Node& joined, int depth) const {
    if (depth >= 2) {
        Fail("f-string: expressions nested too deeply", line);
    }
    const int field_line = line;
    std::size_t i = start;
    int nesting = 0;
    char quote = '\0';
    bool debug = false;
    while (true) {
        if (i >= body.size()) {
            Fail("f-string: expecting '}'", field_line);
        }
        const char c = body[i];
        const char next = i + 1 < body.size() ? body[i + 1] : '\0';
        if (c == '\n') {
            ++line;
        }
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            }
            ++i;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '\\') {
            Fail("f-string expression part cannot include a backslash", field_line);
        } else if (c == '#') {
            Fail("f-string expression part cannot include '#'", field_line);
        } else if (c == '(' || c == '[' || c == '{') {
            ++nesting;
        } else if (c == ')' || c == ']') {
            if (nesting == 0) {
                Fail(std::string("f-string: unmatched '") + c + "'", field_line);
            }
            --nesting;
        } else if (c == '}') {
            if (nesting == 0) {
                break;
            }
            --nesting;
        } else if (nesting == 0) {
            if (c == ':' || (c == '!' && next != '=')) {
                break;
            }
            const char previous = i > start ? body[i - 1] : '\0';
            if (c == '=' && next != '=' && previous != '=' && previous != '!' && previous != '<' &&
                previous != '>') {
                debug = true;
                break;
            }
        }
        ++i;
    }

    const auto expression = body.substr(start, i - start);
    if (IsBlank(expression)) {
        Fail("f-string: empty expression not allowed", field_line);
    }
    auto field = MakeNode(NodeKind::kFormattedValue, field_line);
    Append(*field, ParseFieldExpression(expression, field_line));
    if (debug) {
        // f"{x=}" also renders the expression text itself.
        AppendLiteral(joined, field_line);
        ++i;
    }

    if (i < body.size() && body[i] == '!') {
        const char conversion = i + 1 < body.size() ? body[i + 1] : '\0';
        if (conversion != 's' && conversion != 'r' && conversion != 'a') {
            Fail("f-string: invalid conversion character: expected 's', 'r', or 'a'", field_line);
        }
        i += 2;
    }
    if (i < body.size() && body[i] == ':') {
        const auto spec_start = ++i;
        int braces = 0;
        while (i < body.size()) {
            if (body[i] == '{') {
                ++braces;
            } else if (body[i] == '}') {
                if (braces == 0) {
                    break;
                }
                --braces;
            }
            ++i;
        }
        auto spec = MakeNode(NodeKind::kJoinedStr, line);
        ParseFormattedBody(body.substr(spec_start, i - spec_start), raw, line, *spec, depth + 1);
        Append(*field, std::move(spec));
    }
    if (i >= body.size() || body[i] != '}') {
        Fail("f-string: expecting '}'", field_line);
    }
    Append(joined, std::move(field));
    return i + 1;
}

// Replacement fields parse as if parenthesized, so they may span lines.
NodePtr Parser::ParseFieldExpression(const std::string& expression, int line) const {
    const std::string source = "(" + expression + ")";
    NodePtr value;
    try {
        Lexer lexer(source);
        Parser parser(lexer.Tokenize());
        value = parser.ParseStarExpressions();
        while (parser.Peek().kind == TokenKind::kNewline) {
            parser.Advance();
        }
        if (parser.Peek().kind != TokenKind::kEndMarker) {
            parser.Fail("invalid syntax");
        }
    } catch (const SyntaxError& e) {
        throw SyntaxError(std::string("f-string: ") + e.what(), line + e.Line() - 1);
    }
    ShiftLines(*value, line - 1);
    return value;
}

NodePtr Parser::ParseParenthesized() {
    const int line = Advance().line;
    if (AcceptOp(")")) {
        return MakeNode(NodeKind::kTuple, line);
    }
    if (CheckKeyword("yield")) {
        auto node = ParseYield();
        ExpectOp(")");
        return node;
    }

    auto first = ParseStarNamedExpression();
    if (CheckKeyword("for") || (CheckKeyword("async") && CheckKeyword("for", 1))) {
        auto generator = MakeNode(NodeKind::kGeneratorExp, line);
        Append(*generator, std::move(first));
        ParseComprehensions(*generator);
        ExpectOp(")");
        return generator;
    }
    if (!CheckOp(",")) {
        ExpectOp(")");
        return first;
    }
    auto tuple = MakeNode(NodeKind::kTuple, line);
    Append(*tuple, std::move(first));
    while (AcceptOp(",")) {
        if (CheckOp(")")) {
            break;
        }
        Append(*tuple, ParseStarNamedExpression());
    }
    ExpectOp(")");
    return tuple;
}

NodePtr Parser::ParseListDisplay() {
    const int line = Advance().line;
    if (AcceptOp("]")) {
        return MakeNode(NodeKind::kList, line);
    }
    auto first = ParseStarNamedExpression();
    if (CheckKeyword("for") || (CheckKeyword("async") && CheckKeyword("for", 1))) {
        auto comprehension = MakeNode(NodeKind::kListComp, line);
        Append(*comprehension, std::move(first));
        ParseComprehensions(*comprehension);
        ExpectOp("]");
        return comprehension;
    }
    auto list = MakeNode(NodeKind::kList, line);
    Append(*list, std::move(first));
    while (AcceptOp(",")) {
        if (CheckOp("]")) {
            break;
        }
        Append(*list, ParseStarNamedExpression());
    }
    ExpectOp("]");
    return list;
}

NodePtr Parser::ParseBraceDisplay() {
    const int line = Advance().line;
    if (AcceptOp("}")) {
        return MakeNode(NodeKind::kDict, line);
    }

    auto parse_dict_item = [this](Node& dict) {
        if (CheckOp("**")) {
            auto unpack = MakeNode(NodeKind::kStarred, Advance().line, "**");
            Append(*unpack, ParseBinary(0));
            Append(dict, std::move(unpack));
            return;
        }
        Append(dict, ParseExpression());
        ExpectOp(":");
        Append(dict, ParseExpression());
    };
    auto parse_dict_rest = [&](NodePtr dict) {
        while (AcceptOp(",")) {
            if (CheckOp("}")) {
                break;
            }
            parse_dict_item(*dict);
        }
        ExpectOp("}");
        return dict;
    };

    if (CheckOp("**")) {
        auto dict = MakeNode(NodeKind::kDict, line);
        parse_dict_item(*dict);
        return parse_dict_rest(std::move(dict));
    }

    auto first = ParseStarNamedExpression();
    if (AcceptOp(":")) {
        auto value = ParseExpression();
        if (CheckKeyword("for") || (CheckKeyword("async") && CheckKeyword("for", 1))) {
            auto comprehension = MakeNode(NodeKind::kDictComp, line);
            Append(*comprehension, std::move(first));
            Append(*comprehension, std::move(value));
            ParseComprehensions(*comprehension);
            ExpectOp("}");
            return comprehension;
        }
        auto dict = MakeNode(NodeKind::kDict, line);
        Append(*dict, std::move(first));
        Append(*dict, std::move(value));
        return parse_dict_rest(std::move(dict));
    }

    if (CheckKeyword("for") || (CheckKeyword("async") && CheckKeyword("for", 1))) {
        auto comprehension = MakeNode(NodeKind::kSetComp, line);
        Append(*comprehension, std::move(first));
        ParseComprehensions(*comprehension);
        ExpectOp("}");
        return comprehension;
    }
    auto set = MakeNode(NodeKind::kSet, line);
    Append(*set, std::move(first));
    while (AcceptOp(",")) {
        if (CheckOp("}")) {
            break;
        }
        Append(*set, ParseStarNamedExpression());
    }
    ExpectOp("}");
    return set;
}

NodePtr Parser::ParseYield() {
    const int line = Advance().line;
    if (AcceptKeyword("from")) {
        auto node = MakeNode(NodeKind::kYieldFrom, line);
        Append(*node, ParseExpression());
        return node;
    }
    auto node = MakeNode(NodeKind::kYield, line);
    if (!AtExpressionEnd()) {
        Append(*node, ParseStarExpressions());
    }
    return node;
}

NodePtr Parser::ParseSlices() {
    auto first = ParseSlice();
    if (!CheckOp(",")) {
        return first;
    }
    auto tuple = MakeNode(NodeKind::kTuple, first->line);
    Append(*tuple, std::move(first));
    while (AcceptOp(",")) {
        if (CheckOp("]")) {
            break;
        }
        Append(*tuple, ParseSlice());
    }
    return tuple;
}

NodePtr Parser::ParseSlice() {
    const int line = Peek().line;
    NodePtr lower;
    if (!CheckOp(":")) {
        if (CheckOp("*")) {
            return ParseStarNamedExpression();
        }
        lower = ParseNamedExpression();
        if (!CheckOp(":")) {
            return lower;
        }
    }
    auto slice = MakeNode(NodeKind::kSlice, line);
    if (lower) {
        Append(*slice, std::move(lower));
    }
    ExpectOp(":");
    auto bound_follows = [this]() {
        return !CheckOp(":") && !CheckOp(",") && !CheckOp("]");
    };
    if (bound_follows()) {
        Append(*slice, ParseExpression());
    }
    if (AcceptOp(":") && bound_follows()) {
        Append(*slice, ParseExpression());
    }
    return slice;
}

NodePtr Parser::ParseTargetList() {
    auto first = ParseTarget();
    if (!CheckOp(",")) {
        CheckTarget(*first);
        return first;
    }
    auto tuple = MakeNode(NodeKind::kTuple, first->line);
    Append(*tuple, std::move(first));
    while (AcceptOp(",")) {
        if (CheckKeyword("in") || CheckOp("=")) {
            break;
        }
        Append(*tuple, ParseTarget());
    }
    CheckTarget(*tuple);
    return tuple;
}

NodePtr Parser::ParseTarget() {
    if (CheckOp("*")) {
        auto node = MakeNode(NodeKind::kStarred, Advance().line);
        Append(*node, ParseBinary(0));
        return node;
    }
    return ParseBinary(0);
}

void Parser::ParseComprehensions(Node& owner) {
    while (CheckKeyword("for") || (CheckKeyword("async") && CheckKeyword("for", 1))) {
        auto clause = MakeNode(NodeKind::kComprehension, Peek().line);
        if (AcceptKeyword("async")) {
            clause->value = "async";
        }
        ExpectKeyword("for");
        Append(*clause, ParseTargetList());
        ExpectKeyword("in");
        Append(*clause, ParseDisjunction());
        while (AcceptKeyword("if")) {
            Append(*clause, ParseDisjunction());
        }
        Append(owner, std::move(clause));
    }
}

void Parser::ParseCallArguments(Node& owner) {
    // The opening parenthesis has already been consumed.
    while (!CheckOp(")")) {
        if (CheckOp("*")) {
            auto starred = MakeNode(NodeKind::kStarred, Advance().line);
            Append(*starred, ParseExpression());
            Append(owner, std::move(starred));
        } else if (CheckOp("**")) {
            auto keyword = MakeNode(NodeKind::kKeyword, Advance().line);
            Append(*keyword, ParseExpression());
            Append(owner, std::move(keyword));
        } else if (CheckIdentifier() && CheckOp("=", 1)) {
            const Token& name = Advance();
            auto keyword = MakeNode(NodeKind::kKeyword, name.line, name.text);
            Advance();
            Append(*keyword, ParseExpression());
            Append(owner, std::move(keyword));
        } else {
            auto argument = ParseNamedExpression();
            if (CheckKeyword("for") || (CheckKeyword("async") && CheckKeyword("for", 1))) {
                auto generator = MakeNode(NodeKind::kGeneratorExp, argument->line);
                Append(*generator, std::move(argument));
                ParseComprehensions(*generator);
                argument = std::move(generator);
            } else if (CheckOp("=")) {
                Fail("expression cannot contain assignment, perhaps you meant \"==\"?");
            }
            Append(owner, std::move(argument));
        }
        if (!AcceptOp(",")) {
            break;
        }
    }
    ExpectOp(")");
}

NodePtr Parser::ParseParameters(const char* closing, bool annotations) {
    auto arguments = MakeNode(NodeKind::kArguments, Peek().line);
    bool seen_default = false;
    bool keyword_only = false;
    while (!CheckOp(closing)) {
        if (AcceptOp("/")) {
            if (keyword_only || arguments->children.empty()) {
                Fail("invalid syntax");
            }
        } else if (CheckOp("**")) {
            Advance();
            auto arg = MakeNode(NodeKind::kArg, Peek().line, "**" + ExpectIdentifier());
            if (annotations && AcceptOp(":")) {
                Append(*arg, ParseExpression());
            }
            Append(*arguments, std::move(arg));
            AcceptOp(",");
            break;
        } else if (AcceptOp("*")) {
            keyword_only = true;
            if (CheckIdentifier()) {
                auto arg = MakeNode(NodeKind::kArg, Peek().line, "*" + ExpectIdentifier());
                if (annotations && AcceptOp(":")) {
                    Append(*arg, CheckOp("*") ? ParseStarExpression() : ParseExpression());
                }
                Append(*arguments, std::move(arg));
            } else if (CheckOp(closing)) {
                Fail("named arguments must follow bare *");
            }
        } else {
            const int line = Peek().line;
            auto arg = MakeNode(NodeKind::kArg, line, ExpectIdentifier());
            if (annotations && AcceptOp(":")) {
                Append(*arg, ParseExpression());
            }
            if (AcceptOp("=")) {
                Append(*arg, ParseExpression());
                seen_default = true;
            } else if (seen_default && !keyword_only) {
                Fail("non-default argument follows default argument", line);
            }
            Append(*arguments, std::move(arg));
        }
        if (!AcceptOp(",")) {
            break;
        }
    }
    return arguments;
}

void Parser::CheckTarget(const Node& target) const {
    switch (target.kind) {
        case NodeKind::kName:
        case NodeKind::kAttribute:
        case NodeKind::kSubscript:
            return;
        case NodeKind::kStarred:
            if (!target.children.empty()) {
                CheckTarget(*target.children.front());
            }
            return;
        case NodeKind::kTuple:
        case NodeKind::kList:
            for (const auto& child : target.children) {
                CheckTarget(*child);
            }
            return;
        default:
            Fail("cannot assign to " + Describe(target), target.line);
    }
}

// ---------------------------------------------------------------------------
// Tokens

const Token& Parser::Peek(std::size_t ahead) const {
    const std::size_t index = pos_ + ahead;
    return index < tokens_.size() ? tokens_[index] : tokens_.back();
}

const Token& Parser::Advance() {
    const Token& token = Peek();
    if (pos_ < tokens_.size() - 1) {
        ++pos_;
    }
    return token;
}

bool Parser::CheckOp(const char* op, std::size_t ahead) const {
    const Token& token = Peek(ahead);
    return token.kind == TokenKind::kOp && token.text == op;
}

bool Parser::CheckKeyword(const char* word, std::size_t ahead) const {
    const Token& token = Peek(ahead);
    return token.kind == TokenKind::kName && token.text == word;
}

bool Parser::CheckIdentifier(std::size_t ahead) const {
    const Token& token = Peek(ahead);
    return token.kind == TokenKind::kName && !IsKeyword(token.text);
}

bool Parser::AcceptOp(const char* op) {
    if (!CheckOp(op)) {
        return false;
    }
    Advance();
    return true;
}

bool Parser::AcceptKeyword(const char* word) {
    if (!CheckKeyword(word)) {
        return false;
    }
    Advance();
    return true;
}

void Parser::ExpectOp(const char* op) {
    if (!AcceptOp(op)) {
        Fail("invalid syntax");
    }
}

void Parser::ExpectKeyword(const char* word) {
    if (!AcceptKeyword(word)) {
        Fail("invalid syntax");
    }
}

void Parser::ExpectColon() {
    if (!AcceptOp(":")) {
        Fail("expected ':'");
    }
}

std::string Parser::ExpectIdentifier() {
    if (!CheckIdentifier()) {
        Fail("invalid syntax");
    }
    return Advance().text;
}

bool Parser::AtExpressionEnd() const {
    const Token& token = Peek();
    if (token.kind == TokenKind::kNewline || token.kind == TokenKind::kEndMarker) {
        return true;
    }
    if (token.kind != TokenKind::kOp) {
        return false;
    }
    return token.text == ";" || token.text == ")" || token.text == "]" || token.text == "}" ||
           token.text == "=" || token.text == ":";
}

void Parser::Fail(const std::string& message) const {
    Fail(message, Peek().line);
}

void Parser::Fail(const std::string& message, int line) const {
    throw SyntaxError(message, line);
}

}  // namespace pysandbox::validator::python
