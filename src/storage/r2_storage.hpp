#pragma once

#include <ctime>
#include <functional>
#include <string>

#include "config/config_schema.hpp"
#include "storage/sigv4.hpp"
#include "storage/storage.hpp"

namespace pysandbox::storage {

// Cloudflare R2 through its S3-compatible API, path-style addressing:
// <endpoint>/<bucket>/<prefix>/executions/<execution_id>/<filename>
class R2Storage : public Storage {
public:
    using Clock = std::function<std::time_t()>;

    explicit R2Storage(const config::R2Config& config, Clock clock = nullptr);

    std::optional<std::string> Save(const std::string& content,
                                    const std::string& filename,
                                    const std::string& execution_id,
                                    const Metadata& metadata) override;
    std::string GenerateTemporaryUrl(const std::string& location, int ttl_s) override;
    bool HealthCheck() override;
    bool IsEnabled() const override { return true; }
    std::string Name() const override { return "r2"; }

    std::string ObjectKey(const std::string& execution_id, const std::string& filename) const;
    // Accepts r2://bucket/key, a public URL under public_url, or a bare key.
    std::string KeyFromLocation(const std::string& location) const;

private:
    std::string ObjectPath(const std::string& key) const;

    std::string bucket_;
    std::string prefix_;
    std::string public_url_;
    std::string endpoint_;
    std::string host_;
    sigv4::Credentials credentials_;
    Clock clock_;
};

}  // namespace pysandbox::storage
