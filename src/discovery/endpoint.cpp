#include "discovery/endpoint.hpp"

#include <filesystem>
#include <format>

namespace fs = std::filesystem;

DiscoveredEndpoint::DiscoveredEndpoint(int pid, std::string socket_path,
                                       Clock::time_point validated_at)
    : pid_(pid), socket_path_(std::move(socket_path)), validated_at_(validated_at) {}

std::string SocketLayout::file_for(int pid) const {
    return std::format("{}/{}-{}", dir, app, pid);
}

std::string SocketLayout::address_for(int pid) const {
    return scheme + ":" + file_for(pid);
}

std::string SocketLayout::file_of(const std::string& address) const {
    auto prefix = scheme + ":";
    if (address.starts_with(prefix)) return address.substr(prefix.size());
    return address;
}

EndpointValidator::EndpointValidator(const ProcessIntrospector& introspector, SocketLayout layout)
    : introspector_(introspector), layout_(std::move(layout)) {}

bool EndpointValidator::validate(const DiscoveredEndpoint& endpoint) const {
    if (!introspector_.matches(endpoint.pid())) return false;

    std::error_code ec;
    return fs::exists(layout_.file_of(endpoint.socket_path()), ec);
}

std::optional<DiscoveredEndpoint> EndpointValidator::make(int pid) const {
    DiscoveredEndpoint endpoint(pid, layout_.address_for(pid));
    if (!validate(endpoint)) return std::nullopt;
    return endpoint;
}
