#include "executors/executor_registry.hpp"

#include <utility>

#include "core/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pysandbox::executors {

void ExecutorRegistry::Register(const std::string& name, ExecutorCreator creator) {
    if (creators_.count(name) > 0) {
        utils::Log(utils::LogLevel::kWarn, "registry") << "overwriting executor provider '" << name << "'";
    }
    creators_[name] = std::move(creator);
    utils::Log(utils::LogLevel::kInfo, "registry") << "registered executor provider: " << name;
}

const ExecutorCreator& ExecutorRegistry::Get(const std::string& name) const {
    const auto it = creators_.find(name);
    if (it == creators_.end()) {
        const auto names = List();
        const auto available = names.empty() ? std::string("none") : utils::Join(names, ", ");
        throw core::NotFoundError("Unknown executor provider '" + name +
                                  "'. Available providers: " + available);
    }
    return it->second;
}

bool ExecutorRegistry::Has(const std::string& name) const {
    return creators_.find(name) != creators_.end();
}

std::vector<std::string> ExecutorRegistry::List() const {
    std::vector<std::string> names;
    names.reserve(creators_.size());
    for (const auto& [name, _] : creators_) {
        names.push_back(name);
    }
    return names;
}

void ExecutorRegistry::Clear() {
    creators_.clear();
}

}  // namespace pysandbox::executors
