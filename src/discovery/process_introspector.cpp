#include "discovery/process_introspector.hpp"

ProcessIntrospector::ProcessIntrospector(const ProcessTable& table, std::string signature,
                                         std::string self_name)
    : table_(table), signature_(std::move(signature)), self_name_(std::move(self_name)) {}

bool ProcessIntrospector::matches(int pid) const {
    if (pid <= 0 || signature_.empty()) return false;

    auto cmd = table_.cmdline(pid);
    if (cmd.empty()) return false;

    if (cmd.find(signature_) == std::string::npos) return false;
    return self_name_.empty() || cmd.find(self_name_) == std::string::npos;
}

std::optional<int> ProcessIntrospector::parent(int pid) const {
    if (pid <= 1) return std::nullopt;

    auto ppid = table_.parent_pid(pid);
    if (!ppid || *ppid <= 1) return std::nullopt;
    return ppid;
}

bool ProcessIntrospector::has_children(int pid) const {
    if (pid <= 0) return false;
    return !table_.children(pid).empty();
}

std::vector<int> ProcessIntrospector::find_matching() const {
    std::vector<int> found;
    for (int pid : table_.all_pids()) {
        if (matches(pid)) found.push_back(pid);
    }
    return found;
}
