#include "discovery/ancestor_walker.hpp"

#include <unordered_set>

AncestorWalker::AncestorWalker(const ProcessIntrospector& introspector, uint32_t max_hops)
    : introspector_(introspector), max_hops_(max_hops) {}

std::optional<int> AncestorWalker::find(int start_pid, const Predicate& pred) const {
    std::unordered_set<int> visited;
    int current = start_pid;

    for (uint32_t hop = 0; hop < max_hops_; ++hop) {
        if (current <= 0) return std::nullopt;

        // A parent cycle can only come from corrupt metadata; treat it as the end
        if (!visited.insert(current).second) return std::nullopt;

        if (pred(current)) return current;

        auto parent = introspector_.parent(current);
        if (!parent) return std::nullopt;
        current = *parent;
    }

    return std::nullopt;
}

std::optional<int> AncestorWalker::find_target(int start_pid) const {
    return find(start_pid, [this](int pid) { return introspector_.matches(pid); });
}
