#pragma once

#include "discovery/endpoint.hpp"

#include <chrono>
#include <mutex>
#include <optional>

// Last validated endpoint, shared by every dispatch path of the process.
// The lock covers only reads and writes of the slot; re-validation (which
// touches /proc and the filesystem) runs outside it.
class EndpointCache {
public:
    explicit EndpointCache(const EndpointValidator& validator,
                           std::chrono::steady_clock::duration ttl = std::chrono::seconds(600));

    EndpointCache(const EndpointCache&) = delete;
    EndpointCache& operator=(const EndpointCache&) = delete;

    // The cached endpoint if it is younger than the TTL and still validates.
    // Anything else empties the cache.
    std::optional<DiscoveredEndpoint> get();

    // Stores a copy of `endpoint` stamped with the current time.
    void set(const DiscoveredEndpoint& endpoint);

    void invalidate();

    // Current slot without TTL or validation checks.
    std::optional<DiscoveredEndpoint> peek() const;

    std::chrono::steady_clock::duration ttl() const { return ttl_; }

private:
    const EndpointValidator& validator_;
    std::chrono::steady_clock::duration ttl_;

    mutable std::mutex mutex_;
    std::optional<DiscoveredEndpoint> entry_;
};
