#include "vsock/frame_codec.hpp"

#include "core/errors.hpp"
#include "core/types.hpp"

namespace pysandbox::vsock {

std::string EncodeLength(std::uint32_t length) {
    std::string header(kHeaderSize, '\0');
    header[0] = static_cast<char>((length >> 24) & 0xFF);
    header[1] = static_cast<char>((length >> 16) & 0xFF);
    header[2] = static_cast<char>((length >> 8) & 0xFF);
    header[3] = static_cast<char>(length & 0xFF);
    return header;
}

std::uint32_t DecodeLength(const char* header) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(header);
    return (static_cast<std::uint32_t>(bytes[0]) << 24) |
           (static_cast<std::uint32_t>(bytes[1]) << 16) |
           (static_cast<std::uint32_t>(bytes[2]) << 8) |
           static_cast<std::uint32_t>(bytes[3]);
}

std::string EncodeFrame(const std::string& payload) {
    if (payload.size() > kMaxFrameSize) {
        throw core::ExecutionError("frame too large: " + std::to_string(payload.size()) + " bytes");
    }
    return EncodeLength(static_cast<std::uint32_t>(payload.size())) + payload;
}

std::string EncodeJsonFrame(const nlohmann::json& message) {
    return EncodeFrame(core::DumpJson(message));
}

std::optional<nlohmann::json> ParseJsonPayload(const std::string& payload) {
    auto parsed = nlohmann::json::parse(payload, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace pysandbox::vsock
