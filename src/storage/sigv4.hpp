#pragma once

#include <ctime>
#include <map>
#include <string>

namespace pysandbox::storage::sigv4 {

inline constexpr const char* kAlgorithm = "AWS4-HMAC-SHA256";
inline constexpr const char* kUnsignedPayload = "UNSIGNED-PAYLOAD";

struct Credentials {
    std::string access_key;
    std::string secret_key;
    std::string region = "auto";
    std::string service = "s3";
};

std::string Sha256Hex(const std::string& data);
std::string HmacSha256(const std::string& key, const std::string& data);
std::string ToHex(const std::string& bytes);

// RFC 3986 encoding as S3 expects it; '/' survives unless encode_slash.
std::string UriEncode(const std::string& value, bool encode_slash = true);

// "20130524T000000Z"
std::string AmzDate(std::time_t when);

std::string SigningKey(const std::string& secret_key, const std::string& date,
                       const std::string& region, const std::string& service);

std::string CanonicalQuery(const std::map<std::string, std::string>& params);

// Headers must use lowercase names; all of them are signed.
std::string AuthorizationHeader(const Credentials& credentials,
                                const std::string& method,
                                const std::string& canonical_uri,
                                const std::string& canonical_query,
                                const std::map<std::string, std::string>& headers,
                                const std::string& payload_hash,
                                const std::string& amz_date);

// Query string (without '?') for a presigned request signing only `host`.
std::string PresignQuery(const Credentials& credentials,
                         const std::string& method,
                         const std::string& host,
                         const std::string& canonical_uri,
                         const std::string& amz_date,
                         int expires_s,
                         std::map<std::string, std::string> extra_params = {});

}  // namespace pysandbox::storage::sigv4
