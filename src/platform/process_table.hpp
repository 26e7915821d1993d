#pragma once

#include <optional>
#include <string>
#include <vector>

// Read-only view of the OS process list. Every query tolerates processes
// that exit between enumeration and inspection: a vanished process reads as
// an empty command line, no parent and no children.
class ProcessTable {
public:
    virtual ~ProcessTable() = default;

    // Command line with arguments joined by single spaces.
    virtual std::string cmdline(int pid) const = 0;

    // Parent PID exactly as the OS reports it (may be 0 or 1).
    virtual std::optional<int> parent_pid(int pid) const = 0;

    virtual std::vector<int> children(int pid) const = 0;

    virtual std::vector<int> all_pids() const = 0;
};
