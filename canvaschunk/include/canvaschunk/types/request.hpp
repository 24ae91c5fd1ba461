#pragma once

#include <string>
#include <type_traits>
#include <variant>

namespace canvaschunk {

/// @brief The chunk is not fetched individually (e.g. the whole bounded board)
struct NoRequest {
    bool operator==(const NoRequest&) const noexcept = default;
};

/// @brief Plain HTTP GET without body
struct HttpGet {
    std::string url;

    bool operator==(const HttpGet&) const = default;
};

/// @brief Message to send verbatim over the service's persistent socket connection
struct SocketMessage {
    std::string payload;

    bool operator==(const SocketMessage&) const = default;
};

/// @brief What the external transport has to do to obtain a chunk's payload
using RequestDescriptor = std::variant<NoRequest, HttpGet, SocketMessage>;

/// @brief URL or message payload of a descriptor, empty for NoRequest
[[nodiscard]] inline const std::string& request_target(const RequestDescriptor& request) noexcept {
    static const std::string empty;
    return std::visit([](const auto& r) -> const std::string& {
        using R = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<R, HttpGet>) {
            return r.url;
        } else if constexpr (std::is_same_v<R, SocketMessage>) {
            return r.payload;
        } else {
            return empty;
        }
    }, request);
}

} // namespace canvaschunk
