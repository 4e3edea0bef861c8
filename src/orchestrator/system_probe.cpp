// EN: Implementation of LinuxSystemProbe
// FR: Implémentation de LinuxSystemProbe

#include "orchestrator/system_probe.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string_view>
#include <unordered_set>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>

namespace DAO {
namespace Orchestrator {

namespace {

constexpr size_t kMaxSocketLines = 20;

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

uint64_t parseKilobytes(std::string_view sv) {
    while (!sv.empty() && (sv.back() < '0' || sv.back() > '9')) sv.remove_suffix(1);
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
    uint64_t value = 0;
    std::from_chars(sv.data(), sv.data() + sv.size(), value);
    return value;
}

bool isPseudoFilesystem(const std::string& fstype) {
    static const std::unordered_set<std::string> pseudo = {
        "proc", "sysfs", "devtmpfs", "devpts", "tmpfs", "cgroup", "cgroup2", "pstore", "securityfs",
        "bpf", "autofs", "mqueue", "hugetlbfs", "configfs", "debugfs", "tracefs", "nsfs", "ramfs",
        "fusectl", "squashfs", "overlay", "binfmt_misc", "efivarfs"
    };
    return pseudo.count(fstype) != 0;
}

bool isNumeric(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

LinuxSystemProbe::LinuxSystemProbe(ICommandRunner& runner, ProbePaths paths, IPrivilegedCapability* privileged)
    : runner_(runner), paths_(std::move(paths)), privileged_(privileged) {
}

std::optional<std::string> LinuxSystemProbe::readProcFile(const std::string& relative) const {
    std::ifstream in(paths_.proc_root + "/" + relative);
    if (!in) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return content;
}

std::optional<MemoryUsage> LinuxSystemProbe::parseMeminfo(const std::string& content) {
    uint64_t total = 0, free_kb = 0, available = 0, buffers = 0, cached = 0, swap_total = 0, swap_free = 0;
    bool has_available = false;

    for (const auto& line : splitLines(content)) {
        std::string_view sv(line);
        if (sv.rfind("MemTotal:", 0) == 0) total = parseKilobytes(sv.substr(9));
        else if (sv.rfind("MemFree:", 0) == 0) free_kb = parseKilobytes(sv.substr(8));
        else if (sv.rfind("MemAvailable:", 0) == 0) { available = parseKilobytes(sv.substr(13)); has_available = true; }
        else if (sv.rfind("Buffers:", 0) == 0) buffers = parseKilobytes(sv.substr(8));
        else if (sv.rfind("Cached:", 0) == 0) cached = parseKilobytes(sv.substr(7));
        else if (sv.rfind("SwapTotal:", 0) == 0) swap_total = parseKilobytes(sv.substr(10));
        else if (sv.rfind("SwapFree:", 0) == 0) swap_free = parseKilobytes(sv.substr(9));
    }

    if (total == 0) {
        return std::nullopt;
    }

    MemoryUsage usage;
    usage.total_kb = total;
    usage.available_kb = has_available ? available : free_kb + buffers + cached;
    usage.used_kb = total > usage.available_kb ? total - usage.available_kb : 0;
    usage.swap_total_kb = swap_total;
    usage.swap_used_kb = swap_total > swap_free ? swap_total - swap_free : 0;
    usage.used_pct = 100.0 * static_cast<double>(usage.used_kb) / static_cast<double>(total);
    return usage;
}

std::optional<LoadAverage> LinuxSystemProbe::parseLoadAverage(const std::string& content) {
    std::istringstream iss(content);
    LoadAverage load;
    if (!(iss >> load.one >> load.five >> load.fifteen)) {
        return std::nullopt;
    }
    return load;
}

std::optional<std::string> LinuxSystemProbe::parseUptime(const std::string& content) {
    std::istringstream iss(content);
    double seconds = 0.0;
    if (!(iss >> seconds) || seconds < 0.0) {
        return std::nullopt;
    }

    auto total_minutes = static_cast<long long>(seconds) / 60;
    const long long days = total_minutes / (60 * 24);
    const long long hours = (total_minutes / 60) % 24;
    const long long minutes = total_minutes % 60;

    std::ostringstream oss;
    oss << "up ";
    if (days > 0) {
        oss << days << (days == 1 ? " day, " : " days, ");
    }
    oss << hours << (hours == 1 ? " hour, " : " hours, ") << minutes << (minutes == 1 ? " minute" : " minutes");
    return oss.str();
}

std::optional<std::string> LinuxSystemProbe::hostname() {
    char buffer[256] = {};
    if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return std::nullopt;
    }
    return std::string(buffer);
}

std::optional<std::string> LinuxSystemProbe::uptime() {
    auto content = readProcFile("uptime");
    if (!content) return std::nullopt;
    return parseUptime(*content);
}

std::optional<LoadAverage> LinuxSystemProbe::loadAverage() {
    auto content = readProcFile("loadavg");
    if (!content) return std::nullopt;
    return parseLoadAverage(*content);
}

std::optional<std::string> LinuxSystemProbe::kernelVersion() {
    struct utsname uts {};
    if (::uname(&uts) != 0) {
        return std::nullopt;
    }
    return std::string(uts.release);
}

std::optional<MemoryUsage> LinuxSystemProbe::memoryUsage() {
    auto content = readProcFile("meminfo");
    if (!content) return std::nullopt;
    return parseMeminfo(*content);
}

std::optional<std::vector<FilesystemUsage>> LinuxSystemProbe::filesystemUsage() {
    auto content = readProcFile("self/mounts");
    if (!content) return std::nullopt;

    std::vector<FilesystemUsage> mounts;
    std::unordered_set<std::string> seen;
    for (const auto& line : splitLines(*content)) {
        std::istringstream ls(line);
        FilesystemUsage fs;
        if (!(ls >> fs.device >> fs.mountpoint >> fs.fstype)) continue;
        if (isPseudoFilesystem(fs.fstype) || !seen.insert(fs.mountpoint).second) continue;

        struct statvfs vfs {};
        if (::statvfs(fs.mountpoint.c_str(), &vfs) != 0) continue;
        fs.total_bytes = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
        if (fs.total_bytes == 0) continue;
        fs.avail_bytes = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
        fs.used_bytes = fs.total_bytes - static_cast<uint64_t>(vfs.f_bfree) * vfs.f_frsize;
        // EN: Same ratio as df: used / (used + available to unprivileged users)
        // FR: Même ratio que df : utilisé / (utilisé + disponible pour les utilisateurs)
        const uint64_t usable = fs.used_bytes + fs.avail_bytes;
        fs.used_pct = usable > 0 ? 100.0 * static_cast<double>(fs.used_bytes) / static_cast<double>(usable) : 0.0;
        mounts.push_back(std::move(fs));
    }
    return mounts;
}

std::optional<std::vector<ServiceState>> LinuxSystemProbe::serviceStates(const std::vector<std::string>& services) {
    if (!runner_.isAvailable("systemctl")) {
        return std::nullopt;
    }
    std::vector<ServiceState> states;
    for (const auto& name : services) {
        ServiceState state;
        state.name = name;
        state.active = runner_.run({"systemctl", "is-active", "--quiet", name}).succeeded();
        state.enabled = runner_.run({"systemctl", "is-enabled", "--quiet", name}).succeeded();
        states.push_back(std::move(state));
    }
    return states;
}

std::optional<std::vector<NetworkAddress>> LinuxSystemProbe::networkInterfaces() {
    struct ifaddrs* interface_addrs = nullptr;
    if (::getifaddrs(&interface_addrs) != 0) {
        return std::nullopt;
    }

    std::vector<NetworkAddress> addresses;
    for (struct ifaddrs* ifa = interface_addrs; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || !ifa->ifa_name) continue;

        char buffer[INET6_ADDRSTRLEN] = {};
        const int family = ifa->ifa_addr->sa_family;
        if (family == AF_INET) {
            auto* sin = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
            if (!::inet_ntop(AF_INET, &sin->sin_addr, buffer, sizeof(buffer))) continue;
            addresses.push_back({ifa->ifa_name, "inet", buffer});
        } else if (family == AF_INET6) {
            auto* sin6 = reinterpret_cast<struct sockaddr_in6*>(ifa->ifa_addr);
            if (!::inet_ntop(AF_INET6, &sin6->sin6_addr, buffer, sizeof(buffer))) continue;
            addresses.push_back({ifa->ifa_name, "inet6", buffer});
        }
    }
    ::freeifaddrs(interface_addrs);
    return addresses;
}

std::optional<std::vector<std::string>> LinuxSystemProbe::listeningSockets() {
    std::vector<std::string> command;
    if (runner_.isAvailable("ss")) {
        command = {"ss", "-tuln"};
    } else if (runner_.isAvailable("netstat")) {
        command = {"netstat", "-tuln"};
    } else {
        return std::nullopt;
    }

    CommandResult result = runner_.run(command);
    if (!result.succeeded()) {
        LOG_DEBUG("probe", formatCommand(command) + " failed: " + result.failureReason());
        return std::nullopt;
    }
    auto lines = splitLines(result.stdout_output);
    if (lines.size() > kMaxSocketLines) {
        lines.resize(kMaxSocketLines);
    }
    return lines;
}

std::optional<std::vector<std::string>> LinuxSystemProbe::topProcesses(size_t limit) {
    if (!runner_.isAvailable("ps")) {
        return std::nullopt;
    }
    CommandResult result = runner_.run({"ps", "aux", "--sort=-%cpu"});
    if (!result.succeeded()) {
        LOG_DEBUG("probe", "ps failed: " + result.failureReason());
        return std::nullopt;
    }
    auto lines = splitLines(result.stdout_output);
    // EN: Header line plus `limit` processes
    // FR: Ligne d'en-tête plus `limit` processus
    if (lines.size() > limit + 1) {
        lines.resize(limit + 1);
    }
    return lines;
}

std::optional<int> LinuxSystemProbe::failedLoginCount() {
    for (const auto& path : paths_.auth_logs) {
        std::ifstream in(path);
        if (!in) continue;
        // EN: Sliding window over the tail of the log, one flag per line
        // FR: Fenêtre glissante sur la fin du journal, un indicateur par ligne
        std::deque<bool> window;
        int count = 0;
        std::string line;
        while (std::getline(in, line)) {
            const bool failed = line.find("Failed password") != std::string::npos;
            window.push_back(failed);
            if (failed) ++count;
            if (window.size() > paths_.auth_log_window) {
                if (window.front()) --count;
                window.pop_front();
            }
        }
        return count;
    }
    return std::nullopt;
}

CommandResult LinuxSystemProbe::runFirewallQuery(const std::vector<std::string>& argv) {
    if (privileged_ != nullptr) {
        return privileged_->execute(argv);
    }
    return runner_.run(argv);
}

std::optional<std::string> LinuxSystemProbe::firewallSummary() {
    if (runner_.isAvailable("ufw")) {
        CommandResult result = runFirewallQuery({"ufw", "status"});
        if (result.succeeded()) {
            auto lines = splitLines(result.stdout_output);
            if (!lines.empty()) {
                return "UFW " + lines.front();
            }
        } else {
            LOG_DEBUG("probe", "ufw status failed: " + result.failureReason());
        }
    }
    if (runner_.isAvailable("iptables")) {
        CommandResult result = runFirewallQuery({"iptables", "-S"});
        if (result.succeeded()) {
            int rules = 0;
            for (const auto& line : splitLines(result.stdout_output)) {
                if (line.rfind("-A ", 0) == 0) ++rules;
            }
            return "iptables rules count: " + std::to_string(rules);
        }
        LOG_DEBUG("probe", "iptables -S failed: " + result.failureReason());
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> LinuxSystemProbe::runningProcesses(const std::vector<std::string>& names) {
    std::error_code ec;
    std::filesystem::directory_iterator it(paths_.proc_root, ec);
    if (ec) {
        return std::nullopt;
    }

    std::unordered_set<std::string> wanted(names.begin(), names.end());
    std::unordered_set<std::string> found;
    // EN: increment(ec) instead of a range-for, which throws filesystem_error mid-scan
    // FR: increment(ec) plutôt qu'une boucle range-for, qui lève filesystem_error en cours de parcours
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const auto& entry = *it;
        const std::string pid = entry.path().filename().string();
        if (!isNumeric(pid)) continue;

        // EN: Processes may exit between listing and reading; skip them.
        // FR: Un processus peut se terminer entre le listage et la lecture ; on l'ignore.
        std::ifstream comm(entry.path() / "comm");
        std::string name;
        if (!comm || !std::getline(comm, name)) continue;
        if (wanted.count(name)) {
            found.insert(name);
        }
    }
    if (ec) {
        LOG_DEBUG("probe", "Process scan of " + paths_.proc_root + " stopped: " + ec.message());
        return std::nullopt;
    }

    std::vector<std::string> matches;
    for (const auto& name : names) {
        if (found.count(name)) {
            matches.push_back(name);
        }
    }
    return matches;
}

std::optional<UpdateSummary> LinuxSystemProbe::pendingUpdates() {
    if (runner_.isAvailable("apt")) {
        CommandResult result = runner_.run({"apt", "list", "--upgradable"});
        if (!result.succeeded()) return std::nullopt;
        int count = 0;
        for (const auto& line : splitLines(result.stdout_output)) {
            if (line.find('/') != std::string::npos && line.rfind("Listing", 0) != 0) ++count;
        }
        return UpdateSummary{"apt", count};
    }

    for (const char* tool : {"dnf", "yum"}) {
        if (!runner_.isAvailable(tool)) continue;
        CommandResult result = runner_.run({tool, "check-update", "-q"});
        if (!result.launched || result.timed_out || (result.exit_code != 0 && result.exit_code != 100)) {
            return std::nullopt;
        }
        int count = 0;
        for (const auto& line : splitLines(result.stdout_output)) {
            if (!line.empty() && !std::isspace(static_cast<unsigned char>(line.front()))) ++count;
        }
        return UpdateSummary{tool, count};
    }
    return std::nullopt;
}

} // namespace Orchestrator
} // namespace DAO
