#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "storage/storage.hpp"

namespace pysandbox::executors {

// Cuts text to at most max_bytes (backing off to a UTF-8 boundary) and
// appends "\n\n[Output truncated - exceeded N bytes]".
std::string TruncateOutput(const std::string& text, std::size_t max_bytes);

// Last-resort timeout classification for errors that carry no explicit
// deadline signal: matches "timeout" or "timed out", case-insensitively.
bool LooksLikeTimeout(const std::string& message);

struct FileLimits {
    std::size_t max_file_size = 0;
    std::size_t max_total_size = 0;
    std::size_t max_file_count = 0;

    static FileLimits FromConfig(const config::LimitsConfig& limits);
};

// Applies the per-file, total and count ceilings to the files one execution
// produced and pushes the survivors to storage.
class ArtifactCollector {
public:
    enum class Decision {
        kAccept,
        kSkip,
        kStop
    };

    ArtifactCollector(std::shared_ptr<storage::Storage> storage,
                      FileLimits limits,
                      int url_ttl_s,
                      std::string execution_id,
                      const char* log_tag);

    bool Enabled() const;

    // Decides on a file from its name and size alone. kAccept reserves the
    // file's share of the count and total budgets.
    Decision Admit(const std::string& name, std::size_t size);

    // Saves an admitted file and records its temporary URL. Storage failures
    // are logged and the file is dropped.
    void Store(const std::string& name, const std::string& content, const std::string& original_path);

    const std::vector<std::string>& Urls() const { return urls_; }

private:
    std::shared_ptr<storage::Storage> storage_;
    FileLimits limits_;
    int url_ttl_s_;
    std::string execution_id_;
    const char* log_tag_;
    std::size_t file_count_ = 0;
    std::size_t total_size_ = 0;
    std::vector<std::string> urls_;
};

}  // namespace pysandbox::executors
