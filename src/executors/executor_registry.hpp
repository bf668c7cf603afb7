#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "executors/executor.hpp"

namespace pysandbox::executors {

using ExecutorCreator = std::function<std::unique_ptr<Executor>()>;

// Provider name -> constructor. Filled once at startup, read-only afterwards.
class ExecutorRegistry {
public:
    void Register(const std::string& name, ExecutorCreator creator);
    // Throws NotFoundError listing the known names.
    const ExecutorCreator& Get(const std::string& name) const;
    bool Has(const std::string& name) const;
    std::vector<std::string> List() const;
    void Clear();

private:
    std::map<std::string, ExecutorCreator> creators_;
};

}  // namespace pysandbox::executors
