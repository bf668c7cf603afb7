#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "validator/python_ast.hpp"
#include "validator/python_lexer.hpp"

namespace pysandbox::validator::python {

// Tokenizes and parses a module. Throws SyntaxError.
NodePtr Parse(std::string_view source);

class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    NodePtr ParseModule();

private:
    // statements
    void ParseStatement(std::vector<NodePtr>& out);
    void ParseSimpleStatements(std::vector<NodePtr>& out);
    NodePtr ParseSmallStatement();
    NodePtr ParseExpressionStatement();
    NodePtr ParseImport();
    NodePtr ParseImportFrom();
    NodePtr ParseIf(const char* keyword);
    NodePtr ParseWhile();
    NodePtr ParseFor(bool is_async, int line);
    NodePtr ParseTry();
    NodePtr ParseWith(bool is_async, int line);
    NodePtr ParseFunctionDef(bool is_async, int line);
    NodePtr ParseClassDef();
    NodePtr ParseDecorated();
    bool TryParseMatch(std::vector<NodePtr>& out);
    void ParseBlock(Node& owner, const std::string& what, int line);
    void ParseWithItems(Node& owner, const char* closing);

    // match patterns
    NodePtr ParsePatterns();
    NodePtr ParsePattern();
    NodePtr ParseClosedPattern();
    void ParsePatternList(Node& owner, const char* closing);

    // expressions
    NodePtr ParseStarExpressions();
    NodePtr ParseStarExpression();
    NodePtr ParseStarNamedExpressions();
    NodePtr ParseStarNamedExpression();
    NodePtr ParseNamedExpression();
    NodePtr ParseExpression();
    NodePtr ParseLambda();
    NodePtr ParseDisjunction();
    NodePtr ParseConjunction();
    NodePtr ParseInversion();
    NodePtr ParseComparison();
    NodePtr ParseBinary(int level);
    NodePtr ParseFactor();
    NodePtr ParsePower();
    NodePtr ParseAwaitPrimary();
    NodePtr ParsePrimary();
    NodePtr ParseAtom();
    NodePtr ParseStrings();
    void ParseFormattedBody(const std::string& body, bool raw, int line, Node& joined, int depth) const;
    std::size_t ParseReplacementField(const std::string& body, std::size_t start, bool raw, int& line,
                                      Node& joined, int depth) const;
    NodePtr ParseFieldExpression(const std::string& expression, int line) const;
    NodePtr ParseParenthesized();
    NodePtr ParseListDisplay();
    NodePtr ParseBraceDisplay();
    NodePtr ParseYield();
    NodePtr ParseSlices();
    NodePtr ParseSlice();
    NodePtr ParseTargetList();
    NodePtr ParseTarget();
    void ParseComprehensions(Node& owner);
    void ParseCallArguments(Node& owner);
    NodePtr ParseParameters(const char* closing, bool annotations);
    void CheckTarget(const Node& target) const;

    // tokens
    const Token& Peek(std::size_t ahead = 0) const;
    const Token& Advance();
    bool CheckOp(const char* op, std::size_t ahead = 0) const;
    bool CheckKeyword(const char* word, std::size_t ahead = 0) const;
    bool CheckIdentifier(std::size_t ahead = 0) const;
    bool AcceptOp(const char* op);
    bool AcceptKeyword(const char* word);
    void ExpectOp(const char* op);
    void ExpectKeyword(const char* word);
    void ExpectColon();
    std::string ExpectIdentifier();
    bool AtExpressionEnd() const;
    [[noreturn]] void Fail(const std::string& message) const;
    [[noreturn]] void Fail(const std::string& message, int line) const;

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
};

}  // namespace pysandbox::validator::python
