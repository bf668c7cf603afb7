#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pysandbox::core {

class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Rejected before any backend runs. Carries every violation that was found.
class ValidationError : public SandboxError {
public:
    explicit ValidationError(const std::string& message,
                             std::vector<std::string> errors = {})
        : SandboxError(message)
        , errors_(std::move(errors)) {}

    const std::vector<std::string>& Errors() const { return errors_; }

private:
    std::vector<std::string> errors_;
};

class SecurityError : public ValidationError {
public:
    using ValidationError::ValidationError;
};

class ExecutionError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

class NotFoundError : public ExecutionError {
public:
    using ExecutionError::ExecutionError;
};

class TimeoutError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

// No backend could be brought up. Lists what was tried and what exists.
class InfrastructureError : public ExecutionError {
public:
    InfrastructureError(const std::string& message,
                        std::vector<std::string> tried,
                        std::vector<std::string> registered)
        : ExecutionError(message)
        , tried_(std::move(tried))
        , registered_(std::move(registered)) {}

    const std::vector<std::string>& Tried() const { return tried_; }
    const std::vector<std::string>& Registered() const { return registered_; }

private:
    std::vector<std::string> tried_;
    std::vector<std::string> registered_;
};

}  // namespace pysandbox::core
