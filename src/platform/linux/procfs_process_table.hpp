#pragma once

#include "platform/process_table.hpp"

#include <string>
#include <vector>

class ProcfsProcessTable : public ProcessTable {
public:
    explicit ProcfsProcessTable(std::string proc_root = "/proc");

    std::string cmdline(int pid) const override;
    std::optional<int> parent_pid(int pid) const override;
    std::vector<int> children(int pid) const override;
    std::vector<int> all_pids() const override;

private:
    std::string proc_root_;
};
