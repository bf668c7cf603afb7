#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace pysandbox::core {

inline constexpr const char* kWarningPrefix = "Warning: ";
inline constexpr const char* kErrorTimeout = "Execution timeout";
inline constexpr const char* kErrorFailed = "Execution failed";
inline constexpr const char* kErrorContainer = "Container error";

struct ValidationResult {
    bool ok = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

struct ExecutionRequest {
    std::string code;
    int timeout = 10;
};

struct ExecutionResult {
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
    double execution_time = 0.0;
    std::optional<std::string> error;
    std::vector<std::string> files;
};

inline ExecutionResult FailureResult(const std::string& error,
                                     const std::string& stderr_text,
                                     double execution_time) {
    ExecutionResult result{};
    result.success = false;
    result.stderr_text = stderr_text;
    result.exit_code = -1;
    result.execution_time = execution_time;
    result.error = error;
    return result;
}

inline nlohmann::json ToJson(const ExecutionResult& result) {
    return {
        {"success", result.success},
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"exit_code", result.exit_code},
        {"execution_time", result.execution_time},
        {"error", result.error ? nlohmann::json(*result.error) : nlohmann::json(nullptr)},
        {"files", result.files}
    };
}

inline nlohmann::json ToJson(const ValidationResult& result) {
    return {
        {"ok", result.ok},
        {"errors", result.errors},
        {"warnings", result.warnings}
    };
}

// Process output can be arbitrary bytes; never let serialisation throw on it.
inline std::string DumpJson(const nlohmann::json& json, int indent = -1) {
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace pysandbox::core
