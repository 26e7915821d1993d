#pragma once

#include "platform/process_table.hpp"

#include <optional>
#include <string>
#include <vector>

// Answers "is this the terminal we are looking for" and "who is its parent"
// on top of a ProcessTable.
class ProcessIntrospector {
public:
    // `signature` must appear in a matching command line; `self_name` must not,
    // so that this tool never matches itself when its name embeds the signature.
    ProcessIntrospector(const ProcessTable& table, std::string signature, std::string self_name);

    bool matches(int pid) const;

    // Parent of `pid`, or nullopt when the process is gone or its parent is
    // init / the root of the tree (PID <= 1).
    std::optional<int> parent(int pid) const;

    bool has_children(int pid) const;

    // Every live process whose command line matches, in PID order.
    std::vector<int> find_matching() const;

    const std::string& signature() const { return signature_; }

private:
    const ProcessTable& table_;
    std::string signature_;
    std::string self_name_;
};
