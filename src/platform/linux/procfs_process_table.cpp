#include "platform/linux/procfs_process_table.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::optional<int> parse_pid(std::string_view text) {
    int pid = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), pid);
    if (ec != std::errc() || ptr != text.data() + text.size() || pid <= 0) return std::nullopt;
    return pid;
}

} // namespace

ProcfsProcessTable::ProcfsProcessTable(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

std::string ProcfsProcessTable::cmdline(int pid) const {
    if (pid <= 0) return {};

    std::ifstream f(std::format("{}/{}/cmdline", proc_root_, pid), std::ios::binary);
    if (!f.is_open()) return {};

    std::string raw{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    while (!raw.empty() && raw.back() == '\0') raw.pop_back();
    std::replace(raw.begin(), raw.end(), '\0', ' ');
    return raw;
}

std::optional<int> ProcfsProcessTable::parent_pid(int pid) const {
    if (pid <= 0) return std::nullopt;

    std::ifstream f(std::format("{}/{}/stat", proc_root_, pid));
    if (!f.is_open()) return std::nullopt;
    std::string stat;
    std::getline(f, stat);

    // "pid (comm) state ppid ..." where comm may itself contain ") "
    auto close = stat.rfind(')');
    if (close == std::string::npos) return std::nullopt;

    std::istringstream rest(stat.substr(close + 1));
    std::string state;
    int ppid = -1;
    if (!(rest >> state >> ppid) || ppid < 0) return std::nullopt;
    return ppid;
}

std::vector<int> ProcfsProcessTable::children(int pid) const {
    std::vector<int> children;
    if (pid <= 0) return children;

    std::error_code ec;
    for (auto& entry : fs::directory_iterator(std::format("{}/{}/task", proc_root_, pid), ec)) {
        std::ifstream f(entry.path() / "children");
        if (!f.is_open()) continue;

        int child;
        while (f >> child) {
            children.push_back(child);
        }
    }

    return children;
}

std::vector<int> ProcfsProcessTable::all_pids() const {
    std::vector<int> pids;

    std::error_code ec;
    for (auto& entry : fs::directory_iterator(proc_root_, ec)) {
        if (auto pid = parse_pid(entry.path().filename().string())) {
            pids.push_back(*pid);
        }
    }

    std::sort(pids.begin(), pids.end());
    return pids;
}
