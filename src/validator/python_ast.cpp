#include "validator/python_ast.hpp"

#include <utility>

namespace pysandbox::validator::python {

const char* ToString(NodeKind kind) {
    switch (kind) {
        case NodeKind::kModule: return "Module";
        case NodeKind::kFunctionDef: return "FunctionDef";
        case NodeKind::kAsyncFunctionDef: return "AsyncFunctionDef";
        case NodeKind::kClassDef: return "ClassDef";
        case NodeKind::kReturn: return "Return";
        case NodeKind::kDelete: return "Delete";
        case NodeKind::kAssign: return "Assign";
        case NodeKind::kAugAssign: return "AugAssign";
        case NodeKind::kAnnAssign: return "AnnAssign";
        case NodeKind::kFor: return "For";
        case NodeKind::kAsyncFor: return "AsyncFor";
        case NodeKind::kWhile: return "While";
        case NodeKind::kIf: return "If";
        case NodeKind::kWith: return "With";
        case NodeKind::kAsyncWith: return "AsyncWith";
        case NodeKind::kWithItem: return "withitem";
        case NodeKind::kMatch: return "Match";
        case NodeKind::kMatchCase: return "match_case";
        case NodeKind::kRaise: return "Raise";
        case NodeKind::kTry: return "Try";
        case NodeKind::kTryStar: return "TryStar";
        case NodeKind::kExceptHandler: return "ExceptHandler";
        case NodeKind::kAssert: return "Assert";
        case NodeKind::kImport: return "Import";
        case NodeKind::kImportFrom: return "ImportFrom";
        case NodeKind::kAlias: return "alias";
        case NodeKind::kGlobal: return "Global";
        case NodeKind::kNonlocal: return "Nonlocal";
        case NodeKind::kExpr: return "Expr";
        case NodeKind::kPass: return "Pass";
        case NodeKind::kBreak: return "Break";
        case NodeKind::kContinue: return "Continue";
        case NodeKind::kBoolOp: return "BoolOp";
        case NodeKind::kNamedExpr: return "NamedExpr";
        case NodeKind::kBinOp: return "BinOp";
        case NodeKind::kUnaryOp: return "UnaryOp";
        case NodeKind::kLambda: return "Lambda";
        case NodeKind::kIfExp: return "IfExp";
        case NodeKind::kDict: return "Dict";
        case NodeKind::kSet: return "Set";
        case NodeKind::kListComp: return "ListComp";
        case NodeKind::kSetComp: return "SetComp";
        case NodeKind::kDictComp: return "DictComp";
        case NodeKind::kGeneratorExp: return "GeneratorExp";
        case NodeKind::kComprehension: return "comprehension";
        case NodeKind::kAwait: return "Await";
        case NodeKind::kYield: return "Yield";
        case NodeKind::kYieldFrom: return "YieldFrom";
        case NodeKind::kCompare: return "Compare";
        case NodeKind::kCall: return "Call";
        case NodeKind::kKeyword: return "keyword";
        case NodeKind::kConstant: return "Constant";
        case NodeKind::kJoinedStr: return "JoinedStr";
        case NodeKind::kFormattedValue: return "FormattedValue";
        case NodeKind::kAttribute: return "Attribute";
        case NodeKind::kSubscript: return "Subscript";
        case NodeKind::kStarred: return "Starred";
        case NodeKind::kName: return "Name";
        case NodeKind::kList: return "List";
        case NodeKind::kTuple: return "Tuple";
        case NodeKind::kSlice: return "Slice";
        case NodeKind::kArguments: return "arguments";
        case NodeKind::kArg: return "arg";
        case NodeKind::kPattern: return "Pattern";
    }
    return "unknown";
}

NodePtr MakeNode(NodeKind kind, int line, std::string value) {
    auto node = std::make_unique<Node>();
    node->kind = kind;
    node->line = line;
    node->value = std::move(value);
    return node;
}

}  // namespace pysandbox::validator::python
