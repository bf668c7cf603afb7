#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace pysandbox::vsock {

// Every message on the host/guest channel is a 4-byte big-endian length
// followed by that many payload bytes.
inline constexpr std::size_t kHeaderSize = 4;
inline constexpr std::uint32_t kMaxFrameSize = 256u * 1024u * 1024u;

std::string EncodeLength(std::uint32_t length);
std::uint32_t DecodeLength(const char* header);

std::string EncodeFrame(const std::string& payload);
std::string EncodeJsonFrame(const nlohmann::json& message);

// Nothing when the payload is not a JSON object.
std::optional<nlohmann::json> ParseJsonPayload(const std::string& payload);

}  // namespace pysandbox::vsock
