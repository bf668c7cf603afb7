#pragma once

#include <set>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "core/types.hpp"
#include "validator/python_ast.hpp"

namespace pysandbox::validator {

// Static checks run on every submission before any backend is involved:
// length, syntax, forbidden imports, advisory warnings, complexity.
class CodeValidator {
public:
    explicit CodeValidator(const config::ValidatorConfig& config);

    core::ValidationResult Validate(const std::string& code) const;

    // Full dotted names of forbidden modules, each reported once.
    std::vector<std::string> FindForbiddenImports(const python::Node& module) const;

    static std::vector<std::string> FindWarnings(const python::Node& module);
    static int Complexity(const python::Node& module);

private:
    std::set<std::string> forbidden_;
    std::size_t max_code_length_;
    int max_complexity_;
};

// Number of Unicode code points in UTF-8 text.
std::size_t CountCodePoints(const std::string& text);

}  // namespace pysandbox::validator
