#include "discovery/endpoint_cache.hpp"

#include <print>

EndpointCache::EndpointCache(const EndpointValidator& validator,
                             std::chrono::steady_clock::duration ttl)
    : validator_(validator), ttl_(ttl) {}

std::optional<DiscoveredEndpoint> EndpointCache::get() {
    std::optional<DiscoveredEndpoint> snapshot;
    {
        std::lock_guard lock(mutex_);
        if (!entry_) return std::nullopt;

        auto age = DiscoveredEndpoint::Clock::now() - entry_->validated_at();
        if (age >= ttl_) {
            entry_.reset();
            return std::nullopt;
        }
        snapshot = entry_;
    }

    if (validator_.validate(*snapshot)) return snapshot;

    std::println(stderr, "cache: endpoint {} (pid {}) no longer valid, dropping it",
                 snapshot->socket_path(), snapshot->pid());

    // Another caller may have stored a fresh endpoint meanwhile; keep that one
    std::lock_guard lock(mutex_);
    if (entry_ == snapshot) entry_.reset();
    return std::nullopt;
}

void EndpointCache::set(const DiscoveredEndpoint& endpoint) {
    DiscoveredEndpoint stamped(endpoint.pid(), endpoint.socket_path());
    std::lock_guard lock(mutex_);
    entry_ = std::move(stamped);
}

void EndpointCache::invalidate() {
    std::lock_guard lock(mutex_);
    entry_.reset();
}

std::optional<DiscoveredEndpoint> EndpointCache::peek() const {
    std::lock_guard lock(mutex_);
    return entry_;
}
