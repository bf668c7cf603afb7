#include "validator/code_validator.hpp"

#include <algorithm>

#include "utils/logging.hpp"
#include "validator/python_lexer.hpp"
#include "validator/python_parser.hpp"

namespace pysandbox::validator {
namespace {

using python::Node;
using python::NodeKind;

const char* const kDangerousBuiltins[] = {"eval", "exec", "compile", "__import__"};

std::string TopLevel(const std::string& dotted) {
    return dotted.substr(0, dotted.find('.'));
}

}  // namespace

std::size_t CountCodePoints(const std::string& text) {
    std::size_t count = 0;
    for (const char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

CodeValidator::CodeValidator(const config::ValidatorConfig& config)
    : forbidden_(config.forbidden_imports.begin(), config.forbidden_imports.end())
    , max_code_length_(static_cast<std::size_t>(std::max(config.max_code_length, 0)))
    , max_complexity_(config.max_complexity) {}

core::ValidationResult CodeValidator::Validate(const std::string& code) const {
    core::ValidationResult result{};

    if (CountCodePoints(code) > max_code_length_) {
        result.errors.push_back("Code exceeds maximum length of " +
                                std::to_string(max_code_length_) + " characters");
        return result;
    }

    python::NodePtr module;
    try {
        module = python::Parse(code);
    } catch (const python::SyntaxError& e) {
        result.errors.push_back("Syntax error at line " + std::to_string(e.Line()) + ": " +
                                e.what());
        return result;
    }

    for (const auto& name : FindForbiddenImports(*module)) {
        result.errors.push_back("Forbidden import: " + name);
    }
    for (const auto& warning : FindWarnings(*module)) {
        result.warnings.push_back(core::kWarningPrefix + warning);
    }
    if (!result.errors.empty()) {
        utils::Log(utils::LogLevel::kDebug, "validator")
            << "rejected " << result.errors.size() << " forbidden import(s)";
        return result;
    }

    const int complexity = Complexity(*module);
    if (complexity > max_complexity_) {
        result.errors.push_back("Code complexity " + std::to_string(complexity) +
                                " exceeds maximum " + std::to_string(max_complexity_));
        return result;
    }

    result.ok = true;
    return result;
}

std::vector<std::string> CodeValidator::FindForbiddenImports(const Node& module) const {
    std::vector<std::string> found;
    auto report = [&](const std::string& name) {
        if (forbidden_.count(TopLevel(name)) == 0) {
            return;
        }
        if (std::find(found.begin(), found.end(), name) == found.end()) {
            found.push_back(name);
        }
    };

    python::Walk(module, [&](const Node& node) {
        if (node.kind == NodeKind::kImport) {
            for (const auto& alias : node.children) {
                report(alias->value);
            }
        } else if (node.kind == NodeKind::kImportFrom && !node.value.empty()) {
            report(node.value);
        }
    });
    return found;
}

std::vector<std::string> CodeValidator::FindWarnings(const Node& module) {
    std::vector<std::string> warnings;
    python::Walk(module, [&](const Node& node) {
        if (node.kind == NodeKind::kWhile) {
            const Node* test = node.Child(0);
            if (test && test->kind == NodeKind::kConstant && test->value == "True") {
                warnings.emplace_back("Potential infinite loop detected (while True)");
            }
        }
        if (node.kind == NodeKind::kCall) {
            const Node* func = node.Child(0);
            if (!func || func->kind != NodeKind::kName) {
                return;
            }
            for (const char* builtin : kDangerousBuiltins) {
                if (func->value == builtin) {
                    warnings.push_back(std::string("Dangerous builtin usage: ") + builtin);
                }
            }
        }
    });
    return warnings;
}

int CodeValidator::Complexity(const Node& module) {
    int complexity = 1;
    python::Walk(module, [&](const Node& node) {
        switch (node.kind) {
            case NodeKind::kIf:
            case NodeKind::kWhile:
            case NodeKind::kFor:
            case NodeKind::kExceptHandler:
                complexity += 1;
                break;
            case NodeKind::kBoolOp:
                complexity += static_cast<int>(node.children.size()) - 1;
                break;
            case NodeKind::kListComp:
            case NodeKind::kSetComp:
            case NodeKind::kDictComp:
                complexity += static_cast<int>(std::count_if(
                    node.children.begin(), node.children.end(), [](const python::NodePtr& child) {
                        return child->kind == NodeKind::kComprehension;
                    }));
                break;
            default:
                break;
        }
    });
    return complexity;
}

}  // namespace pysandbox::validator
