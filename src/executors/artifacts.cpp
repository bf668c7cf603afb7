#include "executors/artifacts.hpp"

#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pysandbox::executors {

std::string TruncateOutput(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "\n\n[Output truncated - exceeded " + std::to_string(max_bytes) +
           " bytes]";
}

bool LooksLikeTimeout(const std::string& message) {
    const auto lower = utils::ToLower(message);
    return lower.find("timeout") != std::string::npos || lower.find("timed out") != std::string::npos;
}

FileLimits FileLimits::FromConfig(const config::LimitsConfig& limits) {
    FileLimits result{};
    result.max_file_size = limits.max_file_size;
    result.max_total_size = limits.max_total_size;
    result.max_file_count = limits.max_file_count;
    return result;
}

ArtifactCollector::ArtifactCollector(std::shared_ptr<storage::Storage> storage,
                                     FileLimits limits,
                                     int url_ttl_s,
                                     std::string execution_id,
                                     const char* log_tag)
    : storage_(std::move(storage))
    , limits_(limits)
    , url_ttl_s_(url_ttl_s)
    , execution_id_(std::move(execution_id))
    , log_tag_(log_tag) {}

bool ArtifactCollector::Enabled() const {
    return storage_ && storage_->IsEnabled();
}

ArtifactCollector::Decision ArtifactCollector::Admit(const std::string& name, std::size_t size) {
    if (name.empty() || name.front() == '.') {
        return Decision::kSkip;
    }
    if (file_count_ >= limits_.max_file_count) {
        utils::Log(utils::LogLevel::kWarn, log_tag_)
            << "file count limit reached (" << limits_.max_file_count << "), skipping remaining files";
        return Decision::kStop;
    }
    if (size > limits_.max_file_size) {
        utils::Log(utils::LogLevel::kWarn, log_tag_)
            << "file " << name << " exceeds size limit (" << size << " > " << limits_.max_file_size
            << "), skipping";
        return Decision::kSkip;
    }
    if (total_size_ + size > limits_.max_total_size) {
        utils::Log(utils::LogLevel::kWarn, log_tag_)
            << "total size limit reached (" << limits_.max_total_size << "), skipping remaining files";
        return Decision::kStop;
    }
    if (size == 0) {
        return Decision::kSkip;
    }
    ++file_count_;
    total_size_ += size;
    return Decision::kAccept;
}

void ArtifactCollector::Store(const std::string& name, const std::string& content,
                              const std::string& original_path) {
    if (!Enabled()) {
        return;
    }
    try {
        const storage::Metadata metadata{
            {"size", std::to_string(content.size())},
            {"original_path", original_path}
        };
        const auto location = storage_->Save(content, name, execution_id_, metadata);
        if (!location) {
            return;
        }
        urls_.push_back(storage_->GenerateTemporaryUrl(*location, url_ttl_s_));
    } catch (const std::exception& e) {
        utils::Log(utils::LogLevel::kWarn, log_tag_) << "failed to save file " << name << ": " << e.what();
    }
}

}  // namespace pysandbox::executors
