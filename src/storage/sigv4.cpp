#include "storage/sigv4.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace pysandbox::storage::sigv4 {
namespace {

std::string Scope(const std::string& date, const Credentials& credentials) {
    return date + "/" + credentials.region + "/" + credentials.service + "/aws4_request";
}

std::string Signature(const Credentials& credentials, const std::string& amz_date,
                      const std::string& canonical_request) {
    const auto date = amz_date.substr(0, 8);
    const std::string string_to_sign = std::string(kAlgorithm) + "\n" + amz_date + "\n" +
                                       Scope(date, credentials) + "\n" +
                                       Sha256Hex(canonical_request);
    const auto key = SigningKey(credentials.secret_key, date, credentials.region,
                                credentials.service);
    return ToHex(HmacSha256(key, string_to_sign));
}

}  // namespace

std::string Sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, data.data(), data.size());
    SHA256_Final(hash, &ctx);
    return ToHex(std::string(reinterpret_cast<const char*>(hash), sizeof(hash)));
}

std::string HmacSha256(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &length);
    return std::string(reinterpret_cast<const char*>(digest), length);
}

std::string ToHex(const std::string& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (const unsigned char byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::string UriEncode(const std::string& value, bool encode_slash) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (const unsigned char c : value) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                                c == '~';
        if (unreserved || (c == '/' && !encode_slash)) {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string AmzDate(std::time_t when) {
    std::tm tm{};
    gmtime_r(&when, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

std::string SigningKey(const std::string& secret_key, const std::string& date,
                       const std::string& region, const std::string& service) {
    const auto date_key = HmacSha256("AWS4" + secret_key, date);
    const auto region_key = HmacSha256(date_key, region);
    const auto service_key = HmacSha256(region_key, service);
    return HmacSha256(service_key, "aws4_request");
}

std::string CanonicalQuery(const std::map<std::string, std::string>& params) {
    std::string query;
    for (const auto& [name, value] : params) {
        if (!query.empty()) {
            query += "&";
        }
        query += UriEncode(name) + "=" + UriEncode(value);
    }
    return query;
}

std::string AuthorizationHeader(const Credentials& credentials,
                                const std::string& method,
                                const std::string& canonical_uri,
                                const std::string& canonical_query,
                                const std::map<std::string, std::string>& headers,
                                const std::string& payload_hash,
                                const std::string& amz_date) {
    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : headers) {
        canonical_headers += name + ":" + value + "\n";
        if (!signed_headers.empty()) {
            signed_headers += ";";
        }
        signed_headers += name;
    }
    const std::string canonical_request = method + "\n" + canonical_uri + "\n" +
                                          canonical_query + "\n" + canonical_headers + "\n" +
                                          signed_headers + "\n" + payload_hash;
    return std::string(kAlgorithm) + " Credential=" + credentials.access_key + "/" +
           Scope(amz_date.substr(0, 8), credentials) + ", SignedHeaders=" + signed_headers +
           ", Signature=" + Signature(credentials, amz_date, canonical_request);
}

std::string PresignQuery(const Credentials& credentials,
                         const std::string& method,
                         const std::string& host,
                         const std::string& canonical_uri,
                         const std::string& amz_date,
                         int expires_s,
                         std::map<std::string, std::string> extra_params) {
    auto params = std::move(extra_params);
    params["X-Amz-Algorithm"] = kAlgorithm;
    params["X-Amz-Credential"] = credentials.access_key + "/" +
                                 Scope(amz_date.substr(0, 8), credentials);
    params["X-Amz-Date"] = amz_date;
    params["X-Amz-Expires"] = std::to_string(expires_s);
    params["X-Amz-SignedHeaders"] = "host";

    const auto query = CanonicalQuery(params);
    const std::string canonical_request = method + "\n" + canonical_uri + "\n" + query + "\n" +
                                          "host:" + host + "\n\nhost\n" + kUnsignedPayload;
    return query + "&X-Amz-Signature=" + Signature(credentials, amz_date, canonical_request);
}

}  // namespace pysandbox::storage::sigv4
