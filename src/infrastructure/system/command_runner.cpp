// EN: Implementation of SystemCommandRunner - fork/execv with piped stdout/stderr, poll loop and timeout
// FR: Implémentation de SystemCommandRunner - fork/execv avec stdout/stderr redirigés, boucle poll et délai

#include "infrastructure/system/command_runner.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace DAO {

namespace {

// EN: Directories searched after PATH; administrative tools often live in sbin.
// FR: Répertoires parcourus après PATH ; les outils d'administration sont souvent dans sbin.
constexpr const char* kFallbackDirectories[] = {"/usr/local/sbin", "/usr/local/bin", "/usr/sbin",
                                                "/usr/bin", "/sbin", "/bin"};

bool isExecutableFile(const std::string& path) {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

std::string CommandResult::failureReason() const {
    if (!launched) {
        return stderr_output.empty() ? "command could not be started" : stderr_output;
    }
    if (timed_out) {
        return "command timed out";
    }
    std::string reason = "exit code " + std::to_string(exit_code);
    std::string detail = stderr_output.empty() ? stdout_output : stderr_output;
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r' || detail.back() == ' ')) {
        detail.pop_back();
    }
    auto newline = detail.find('\n');
    if (newline != std::string::npos) {
        detail = detail.substr(0, newline);
    }
    if (!detail.empty()) {
        reason += ": " + detail;
    }
    return reason;
}

std::string formatCommand(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << argv[i];
    }
    return oss.str();
}

SystemCommandRunner::SystemCommandRunner(std::chrono::seconds timeout)
    : timeout_(timeout) {
}

std::string SystemCommandRunner::resolveProgram(const std::string& program) {
    if (program.empty()) {
        return "";
    }
    if (program.find('/') != std::string::npos) {
        return isExecutableFile(program) ? program : "";
    }

    const char* path_env = std::getenv("PATH");
    if (path_env) {
        std::stringstream ss(path_env);
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (dir.empty()) continue;
            std::string candidate = dir + "/" + program;
            if (isExecutableFile(candidate)) {
                return candidate;
            }
        }
    }

    for (const char* dir : kFallbackDirectories) {
        std::string candidate = std::string(dir) + "/" + program;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
    }
    return "";
}

bool SystemCommandRunner::isAvailable(const std::string& program) {
    return !resolveProgram(program).empty();
}

// EN: Run a command without a shell, so arguments are never re-interpreted.
// FR: Exécute une commande sans shell, les arguments ne sont donc jamais réinterprétés.
CommandResult SystemCommandRunner::run(const std::vector<std::string>& argv) {
    CommandResult result;
    if (argv.empty()) {
        result.stderr_output = "empty command";
        return result;
    }

    const std::string program = resolveProgram(argv[0]);
    if (program.empty()) {
        result.stderr_output = argv[0] + ": command not found";
        LOG_DEBUG("command_runner", result.stderr_output);
        return result;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.stderr_output = std::string("pipe failed: ") + std::strerror(errno);
        closeFd(out_pipe[0]);
        closeFd(out_pipe[1]);
        LOG_ERROR("command_runner", result.stderr_output);
        return result;
    }

    // EN: Build argv before forking; only async-signal-safe calls happen in the child.
    // FR: Construit argv avant le fork ; l'enfant n'utilise que des appels async-signal-safe.
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.stderr_output = std::string("fork failed: ") + std::strerror(errno);
        closeFd(out_pipe[0]);
        closeFd(out_pipe[1]);
        closeFd(err_pipe[0]);
        closeFd(err_pipe[1]);
        LOG_ERROR("command_runner", result.stderr_output);
        return result;
    }

    if (pid == 0) {
        int dev_null = ::open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execv(program.c_str(), c_argv.data());
        _exit(127); // execv failed
    }

    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);
    result.launched = true;

    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&result.stdout_output, &result.stderr_output};
    int open_streams = 2;
    char buffer[4096];

    while (open_streams > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (timeout_.count() > 0 && remaining.count() <= 0) {
            result.timed_out = true;
            ::kill(pid, SIGKILL);
            break;
        }

        int wait_ms = timeout_.count() > 0 ? static_cast<int>(remaining.count()) : -1;
        int ready = ::poll(fds, 2, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("command_runner", std::string("poll failed: ") + std::strerror(errno));
            ::kill(pid, SIGKILL);
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    for (auto& fd : fds) {
        if (fd.fd >= 0) {
            ::close(fd.fd);
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            LOG_ERROR("command_runner", std::string("waitpid failed: ") + std::strerror(errno));
            result.exit_code = -1;
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == 127 && result.stdout_output.empty() && result.stderr_output.empty()) {
            result.launched = false;
            result.stderr_output = argv[0] + ": exec failed";
        }
    } else {
        result.exit_code = -1;
    }

    LOG_DEBUG("command_runner", formatCommand(argv) + " -> " +
              (result.timed_out ? std::string("timeout") : std::to_string(result.exit_code)));
    return result;
}

} // namespace DAO
