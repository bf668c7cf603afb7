#pragma once

#include <map>
#include <optional>
#include <string>

namespace pysandbox::storage {

using Metadata = std::map<std::string, std::string>;

// Persists files produced by an execution and hands out links to them.
class Storage {
public:
    virtual ~Storage() = default;

    // Returns the stored location, or nothing when storage is disabled.
    virtual std::optional<std::string> Save(const std::string& content,
                                            const std::string& filename,
                                            const std::string& execution_id,
                                            const Metadata& metadata) = 0;
    // Bounded-lifetime access URL for a location returned by Save.
    virtual std::string GenerateTemporaryUrl(const std::string& location, int ttl_s) = 0;
    virtual bool HealthCheck() = 0;
    virtual bool IsEnabled() const = 0;
    virtual std::string Name() const = 0;
};

}  // namespace pysandbox::storage
