#pragma once

#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace pysandbox::validator::python {

// Node kinds follow the class names of CPython's ast module.
enum class NodeKind {
    kModule,
    // statements
    kFunctionDef,
    kAsyncFunctionDef,
    kClassDef,
    kReturn,
    kDelete,
    kAssign,
    kAugAssign,
    kAnnAssign,
    kFor,
    kAsyncFor,
    kWhile,
    kIf,
    kWith,
    kAsyncWith,
    kWithItem,
    kMatch,
    kMatchCase,
    kRaise,
    kTry,
    kTryStar,
    kExceptHandler,
    kAssert,
    kImport,
    kImportFrom,
    kAlias,
    kGlobal,
    kNonlocal,
    kExpr,
    kPass,
    kBreak,
    kContinue,
    // expressions
    kBoolOp,
    kNamedExpr,
    kBinOp,
    kUnaryOp,
    kLambda,
    kIfExp,
    kDict,
    kSet,
    kListComp,
    kSetComp,
    kDictComp,
    kGeneratorExp,
    kComprehension,
    kAwait,
    kYield,
    kYieldFrom,
    kCompare,
    kCall,
    kKeyword,
    kConstant,
    kJoinedStr,
    kFormattedValue,
    kAttribute,
    kSubscript,
    kStarred,
    kName,
    kList,
    kTuple,
    kSlice,
    // parameters and patterns
    kArguments,
    kArg,
    kPattern
};

const char* ToString(NodeKind kind);

// Generic tree node. `value` holds the identifier, operator, module or
// constant text depending on the kind; `children` keeps source order.
//
//   Import      children: kAlias (value = dotted name)
//   ImportFrom  value: module without dots, level: leading dots, children: kAlias
//   While/If    children[0]: test, then body and orelse statements
//   Call        children[0]: func, then arguments and keywords
//   BoolOp      value: "and"/"or", children: operands (flattened)
//   *Comp       element(s) first, then kComprehension nodes
//   Constant    value: "True", "False", "None", "...", a number, "str" or "bytes"
//   JoinedStr   children: "str" Constants and FormattedValues in source order
//   FormattedValue  children[0]: value, then an optional JoinedStr format spec
struct Node {
    NodeKind kind = NodeKind::kModule;
    int line = 0;
    std::string value;
    int level = 0;
    std::vector<std::unique_ptr<Node>> children;

    const Node* Child(std::size_t index) const {
        return index < children.size() ? children[index].get() : nullptr;
    }
};

using NodePtr = std::unique_ptr<Node>;

NodePtr MakeNode(NodeKind kind, int line, std::string value = {});

// Breadth-first traversal in the order of Python's ast.walk.
template <typename Visitor>
void Walk(const Node& root, Visitor&& visit) {
    std::deque<const Node*> pending{&root};
    while (!pending.empty()) {
        const Node* node = pending.front();
        pending.pop_front();
        visit(*node);
        for (const auto& child : node->children) {
            pending.push_back(child.get());
        }
    }
}

}  // namespace pysandbox::validator::python
