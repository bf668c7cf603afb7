#pragma once

#include <string>

#include "core/types.hpp"

namespace pysandbox::executors {

// One isolation backend. Execute never throws for a failed run: the failure
// is folded into the returned result.
class Executor {
public:
    virtual ~Executor() = default;
    virtual core::ExecutionResult Execute(const std::string& code, int timeout_s) = 0;
    virtual bool HealthCheck() = 0;
    virtual void Cleanup() = 0;
    virtual std::string Name() const = 0;
};

}  // namespace pysandbox::executors
