#pragma once

#include "discovery/process_introspector.hpp"

#include <cstdint>
#include <functional>
#include <optional>

// Climbs parent links from a starting process. The walk stops after
// `max_hops` processes, on the first repeated PID, or when the ancestry
// runs out; all three end in "not found".
class AncestorWalker {
public:
    using Predicate = std::function<bool(int pid)>;

    explicit AncestorWalker(const ProcessIntrospector& introspector, uint32_t max_hops = 20);

    // First process, starting with `start_pid` itself, for which `pred` holds.
    std::optional<int> find(int start_pid, const Predicate& pred) const;

    // find() with the introspector's target signature as predicate.
    std::optional<int> find_target(int start_pid) const;

    uint32_t max_hops() const { return max_hops_; }

private:
    const ProcessIntrospector& introspector_;
    uint32_t max_hops_;
};
