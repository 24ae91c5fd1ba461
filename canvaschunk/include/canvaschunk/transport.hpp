#pragma once

#include <atomic>
#include <concepts>
#include <cstddef>
#include <new>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include "types/request.hpp"
#include "types/result.hpp"

namespace canvaschunk {

/// Concept for the external component that turns a request descriptor into payload bytes
/// fetch() must be thread-safe: the fetcher calls it from several workers at once.
/// For HttpGet the payload is the response body, for SocketMessage the text
/// content of the matching response message.
template <typename T>
concept ChunkTransport = requires(const T transport, const RequestDescriptor& request) {
    { transport.fetch(request) } -> std::same_as<Result<std::vector<std::byte>>>;
};

/// In-memory transport serving canned payloads keyed by URL or socket message
/// Used for tests and for replaying previously recorded responses.
/// Payloads must all be added before the first concurrent fetch().
class MemoryTransport {
public:
    MemoryTransport() = default;

    MemoryTransport(const MemoryTransport&) = delete;
    MemoryTransport& operator=(const MemoryTransport&) = delete;

    /// Register the payload returned for a URL or a socket message
    void add(std::string target, std::vector<std::byte> payload) {
        payloads_.insert_or_assign(std::move(target), std::move(payload));
    }

    void add(std::string target, std::span<const std::byte> payload) {
        add(std::move(target), std::vector<std::byte>(payload.begin(), payload.end()));
    }

    /// @retval TransportError NoRequest, or no payload registered for the target
    [[nodiscard]] Result<std::vector<std::byte>> fetch(const RequestDescriptor& request) const noexcept {
        requests_.fetch_add(1, std::memory_order_relaxed);

        if (std::holds_alternative<NoRequest>(request)) [[unlikely]] {
            return Err(Error::Code::TransportError, "Nothing to fetch for NoRequest");
        }

        const std::string& target = request_target(request);
        try {
            const auto it = payloads_.find(target);
            if (it == payloads_.end()) {
                return Err(Error::Code::TransportError, "No payload for " + target);
            }
            return Ok(std::vector<std::byte>(it->second));
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to copy payload");
        }
    }

    /// Number of fetch() calls so far, successful or not
    [[nodiscard]] std::size_t request_count() const noexcept {
        return requests_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::size_t size() const noexcept { return payloads_.size(); }

private:
    std::unordered_map<std::string, std::vector<std::byte>> payloads_;
    mutable std::atomic<std::size_t> requests_{0};
};

static_assert(ChunkTransport<MemoryTransport>, "MemoryTransport must satisfy ChunkTransport concept");

} // namespace canvaschunk
