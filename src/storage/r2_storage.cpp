#include "storage/r2_storage.hpp"

#include <iomanip>
#include <map>
#include <sstream>
#include <utility>

#include "core/errors.hpp"
#include "httplib.h"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pysandbox::storage {
namespace {

std::string StripSlashes(std::string value) {
    while (!value.empty() && value.front() == '/') {
        value.erase(value.begin());
    }
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

std::string HostOf(const std::string& endpoint) {
    auto host = endpoint;
    const auto scheme_end = host.find("://");
    if (scheme_end != std::string::npos) {
        host = host.substr(scheme_end + 3);
    }
    const auto path_start = host.find('/');
    if (path_start != std::string::npos) {
        host = host.substr(0, path_start);
    }
    return host;
}

std::string IsoTime(std::time_t when) {
    std::tm tm{};
    gmtime_r(&when, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

std::string MetadataHeaderName(const std::string& key) {
    auto name = utils::ToLower(key);
    for (auto& c : name) {
        if (c == '_') {
            c = '-';
        }
    }
    return "x-amz-meta-" + name;
}

httplib::Headers ToRequestHeaders(const std::map<std::string, std::string>& signed_headers,
                                  const std::string& authorization) {
    httplib::Headers headers;
    for (const auto& [name, value] : signed_headers) {
        headers.emplace(name == "host" ? "Host" : name, value);
    }
    headers.emplace("Authorization", authorization);
    return headers;
}

void Require(const std::string& value, const char* name) {
    if (value.empty()) {
        throw core::ExecutionError(std::string("Missing R2 configuration: ") + name);
    }
}

}  // namespace

R2Storage::R2Storage(const config::R2Config& config, Clock clock)
    : bucket_(config.bucket)
    , prefix_(StripSlashes(config.prefix))
    , public_url_(config.public_url)
    , clock_(std::move(clock)) {
    Require(config.bucket, "bucket");
    Require(config.access_key, "access_key");
    Require(config.secret_key, "secret_key");
    if (config.endpoint.empty()) {
        Require(config.account_id, "account_id");
        endpoint_ = "https://" + config.account_id + ".r2.cloudflarestorage.com";
    } else {
        endpoint_ = config.endpoint;
    }
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
    while (!public_url_.empty() && public_url_.back() == '/') {
        public_url_.pop_back();
    }
    host_ = HostOf(endpoint_);
    credentials_.access_key = config.access_key;
    credentials_.secret_key = config.secret_key;
    credentials_.region = "auto";
    credentials_.service = "s3";
    if (!clock_) {
        clock_ = [] { return std::time(nullptr); };
    }
}

std::string R2Storage::ObjectKey(const std::string& execution_id,
                                 const std::string& filename) const {
    const std::string tail = "executions/" + execution_id + "/" + filename;
    return prefix_.empty() ? tail : prefix_ + "/" + tail;
}

std::string R2Storage::KeyFromLocation(const std::string& location) const {
    const std::string scheme = "r2://";
    if (location.rfind(scheme, 0) == 0) {
        const auto rest = location.substr(scheme.size());
        const auto slash = rest.find('/');
        return slash == std::string::npos ? std::string() : rest.substr(slash + 1);
    }
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) {
        if (!public_url_.empty() && location.rfind(public_url_, 0) == 0) {
            return StripSlashes(location.substr(public_url_.size()));
        }
        throw core::ExecutionError("Cannot parse public URL: " + location);
    }
    return location;
}

std::string R2Storage::ObjectPath(const std::string& key) const {
    return "/" + sigv4::UriEncode(bucket_) + "/" + sigv4::UriEncode(key, false);
}

std::optional<std::string> R2Storage::Save(const std::string& content,
                                           const std::string& filename,
                                           const std::string& execution_id,
                                           const Metadata& metadata) {
    const auto key = ObjectKey(execution_id, filename);
    const auto path = ObjectPath(key);
    const auto now = clock_();
    const auto amz_date = sigv4::AmzDate(now);
    const auto payload_hash = sigv4::Sha256Hex(content);

    std::map<std::string, std::string> headers{
        {"host", host_},
        {"x-amz-content-sha256", payload_hash},
        {"x-amz-date", amz_date},
        {"x-amz-meta-execution-id", execution_id},
        {"x-amz-meta-saved-at", IsoTime(now)}
    };
    for (const auto& [name, value] : metadata) {
        headers[MetadataHeaderName(name)] = utils::Trim(value);
    }
    const auto authorization = sigv4::AuthorizationHeader(credentials_, "PUT", path, "", headers,
                                                          payload_hash, amz_date);

    httplib::Client client(endpoint_);
    client.set_connection_timeout(15);
    client.set_read_timeout(60);
    client.set_write_timeout(60);
    auto response = client.Put(path, ToRequestHeaders(headers, authorization), content,
                               "application/octet-stream");
    if (!response) {
        throw core::ExecutionError("Failed to save file to R2: " +
                                   httplib::to_string(response.error()));
    }
    if (response->status < 200 || response->status >= 300) {
        throw core::ExecutionError("Failed to save file to R2: HTTP " +
                                   std::to_string(response->status) + " " + response->body);
    }
    utils::Log(utils::LogLevel::kDebug, "storage")
        << "saved " << key << " size=" << content.size();

    if (!public_url_.empty()) {
        return public_url_ + "/" + key;
    }
    return "r2://" + bucket_ + "/" + key;
}

std::string R2Storage::GenerateTemporaryUrl(const std::string& location, int ttl_s) {
    const auto key = KeyFromLocation(location);
    if (!public_url_.empty()) {
        return public_url_ + "/" + key;
    }
    const auto filename = key.substr(key.find_last_of('/') + 1);
    const auto path = ObjectPath(key);
    const auto query = sigv4::PresignQuery(
        credentials_, "GET", host_, path, sigv4::AmzDate(clock_()), ttl_s,
        {{"response-content-disposition", "attachment; filename=\"" + filename + "\""}});
    return endpoint_ + path + "?" + query;
}

bool R2Storage::HealthCheck() {
    const std::string path = "/" + sigv4::UriEncode(bucket_);
    const auto amz_date = sigv4::AmzDate(clock_());
    const auto payload_hash = sigv4::Sha256Hex("");
    const std::map<std::string, std::string> headers{
        {"host", host_},
        {"x-amz-content-sha256", payload_hash},
        {"x-amz-date", amz_date}
    };
    const auto authorization = sigv4::AuthorizationHeader(credentials_, "HEAD", path, "", headers,
                                                          payload_hash, amz_date);
    httplib::Client client(endpoint_);
    client.set_connection_timeout(5);
    client.set_read_timeout(5);
    auto response = client.Head(path, ToRequestHeaders(headers, authorization));
    if (!response) {
        utils::Log(utils::LogLevel::kWarn, "storage")
            << "health check failed: " << httplib::to_string(response.error());
        return false;
    }
    return response->status == 200;
}

}  // namespace pysandbox::storage
