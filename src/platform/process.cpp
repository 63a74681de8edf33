#include "process.hpp"
#include <core/errors.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <fmt/format.h>

extern char** environ;

namespace platform {

// ── helpers ──────────────────────────────────────────────────

namespace {

// Ambient environment with overrides applied, as KEY=VALUE strings.
std::vector<std::string> merged_environment(const EnvMap& overrides) {
    EnvMap merged;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [k, v] : overrides) merged[k] = v;

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) out.push_back(k + "=" + v);
    return out;
}

std::vector<char*> to_cstrings(std::vector<std::string>& strs) {
    std::vector<char*> out;
    out.reserve(strs.size() + 1);
    for (auto& s : strs) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

// exec in a forked child. On failure, report errno through err_fd and exit.
[[noreturn]] void exec_or_report(char* const* argv, char* const* envp, int err_fd) {
    execvpe(argv[0], argv, envp);
    int err = errno;
    ssize_t ignored = write(err_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

// Read an errno reported by exec_or_report. 0 means exec succeeded
// (the CLOEXEC pipe closed without data).
int read_exec_errno(int fd) {
    int err = 0;
    ssize_t n;
    do {
        n = read(fd, &err, sizeof(err));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(err)) ? err : 0;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::optional<std::string> read_proc_file(int pid, const char* name) {
    std::ifstream in(fmt::format("/proc/{}/{}", pid, name), std::ios::binary);
    if (!in) return std::nullopt;
    std::string data((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return data;
}

std::vector<std::string> split_nul(const std::string& data) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < data.size()) {
        size_t end = data.find('\0', start);
        if (end == std::string::npos) end = data.size();
        out.push_back(data.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

} // namespace

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    reaped_ = other.reaped_;
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        other.pid_ = -1;
    }
    return *this;
}

int ProcessHandle::wait() {
    if (pid_ <= 0 || reaped_) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    reaped_ = true;
    return ret == pid_ ? decode_status(status) : -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const Argv& argv, const EnvMap& env) {
    if (argv.empty()) throw LaunchError("Empty command line");

    std::vector<std::string> args(argv.begin(), argv.end());
    std::vector<std::string> envs = merged_environment(env);
    auto c_argv = to_cstrings(args);
    auto c_envp = to_cstrings(envs);

    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        throw LaunchError(fmt::format("pipe() failed: {}", std::strerror(errno)));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(err_pipe[0]);
        close(err_pipe[1]);
        throw LaunchError(fmt::format("fork() failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        close(err_pipe[0]);
        exec_or_report(c_argv.data(), c_envp.data(), err_pipe[1]);
    }

    close(err_pipe[1]);
    int err = read_exec_errno(err_pipe[0]);
    close(err_pipe[0]);

    ProcessHandle handle;
    handle.pid_ = pid;
    if (err != 0) {
        handle.wait();
        throw LaunchError(fmt::format("Cannot execute {}: {}", argv[0], std::strerror(err)));
    }
    return handle;
}

CommandResult run_captured(const Argv& argv) {
    if (argv.empty()) return CommandResult{127, "", "Empty command line"};

    std::vector<std::string> args(argv.begin(), argv.end());
    std::vector<std::string> envs = merged_environment({});
    auto c_argv = to_cstrings(args);
    auto c_envp = to_cstrings(envs);

    int out_pipe[2], err_pipe[2], exec_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        return CommandResult{127, "", fmt::format("pipe() failed: {}", std::strerror(errno))};
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        return CommandResult{127, "", fmt::format("pipe() failed: {}", std::strerror(errno))};
    }
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return CommandResult{127, "", fmt::format("pipe() failed: {}", std::strerror(errno))};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1],
                       exec_pipe[0], exec_pipe[1]}) close(fd);
        return CommandResult{127, "", fmt::format("fork() failed: {}", std::strerror(err))};
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        // dup2 clears CLOEXEC on the new descriptors
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        exec_or_report(c_argv.data(), c_envp.data(), exec_pipe[1]);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    close(exec_pipe[1]);

    CommandResult result{0, "", ""};
    struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    int open_fds = 2;
    char buf[4096];

    while (open_fds > 0) {
        int pr = poll(fds, 2, -1);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }
    for (auto& p : fds) {
        if (p.fd >= 0) close(p.fd);
    }

    int exec_err = read_exec_errno(exec_pipe[0]);
    close(exec_pipe[0]);

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid, &status, 0);
    } while (ret < 0 && errno == EINTR);

    if (exec_err != 0) {
        return CommandResult{127, "", fmt::format("Cannot execute {}: {}",
                                                  argv[0], std::strerror(exec_err))};
    }
    result.exit_code = ret == pid ? decode_status(status) : -1;
    return result;
}

// ── detached launch ──────────────────────────────────────────

int spawn_detached(const Argv& argv, const EnvMap& env, const std::string& log_path) {
    if (argv.empty()) throw LaunchError("Empty command line");

    std::vector<std::string> args(argv.begin(), argv.end());
    std::vector<std::string> envs = merged_environment(env);
    auto c_argv = to_cstrings(args);
    auto c_envp = to_cstrings(envs);

    // The intermediate child reports the grandchild's pid on pid_pipe. The
    // grandchild writes an errno on exec_pipe only if exec fails; EOF there
    // means it is running the program.
    int pid_pipe[2], exec_pipe[2];
    if (pipe2(pid_pipe, O_CLOEXEC) != 0) {
        throw LaunchError(fmt::format("pipe() failed: {}", std::strerror(errno)));
    }
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(pid_pipe[0]);
        close(pid_pipe[1]);
        throw LaunchError(fmt::format("pipe() failed: {}", std::strerror(err)));
    }

    pid_t child = fork();
    if (child < 0) {
        int err = errno;
        for (int fd : {pid_pipe[0], pid_pipe[1], exec_pipe[0], exec_pipe[1]}) close(fd);
        throw LaunchError(fmt::format("fork() failed: {}", std::strerror(err)));
    }

    if (child == 0) {
        close(pid_pipe[0]);
        close(exec_pipe[0]);
        setsid();

        pid_t grandchild = fork();
        if (grandchild < 0) _exit(1);
        if (grandchild == 0) {
            close(pid_pipe[1]);
            int in = open("/dev/null", O_RDONLY);
            int out = log_path.empty()
                ? open("/dev/null", O_WRONLY)
                : open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0600);
            if (in >= 0) { dup2(in, STDIN_FILENO); close(in); }
            if (out >= 0) {
                dup2(out, STDOUT_FILENO);
                dup2(out, STDERR_FILENO);
                close(out);
            }
            exec_or_report(c_argv.data(), c_envp.data(), exec_pipe[1]);
        }

        ssize_t ignored = write(pid_pipe[1], &grandchild, sizeof(grandchild));
        (void)ignored;
        _exit(0);
    }

    close(pid_pipe[1]);
    close(exec_pipe[1]);

    int status = 0;
    while (waitpid(child, &status, 0) < 0 && errno == EINTR) {}

    pid_t grandchild = -1;
    ssize_t n;
    do {
        n = read(pid_pipe[0], &grandchild, sizeof(grandchild));
    } while (n < 0 && errno == EINTR);
    close(pid_pipe[0]);

    if (n != static_cast<ssize_t>(sizeof(grandchild)) || grandchild <= 0) {
        close(exec_pipe[0]);
        throw LaunchError(fmt::format("Failed to start {}: fork() failed", argv[0]));
    }

    int err = read_exec_errno(exec_pipe[0]);
    close(exec_pipe[0]);
    if (err != 0) {
        throw LaunchError(fmt::format("Cannot execute {}: {}", argv[0], std::strerror(err)));
    }
    return static_cast<int>(grandchild);
}

// ── /proc inspection ─────────────────────────────────────────

bool pid_alive(int pid) {
    if (pid <= 0) return false;
    if (kill(pid, 0) != 0 && errno != EPERM) return false;

    // A zombie still answers kill(0) but is not running.
    auto stat = read_proc_file(pid, "stat");
    if (!stat) return false;
    auto close_paren = stat->rfind(')');
    if (close_paren == std::string::npos || close_paren + 2 >= stat->size()) return true;
    char state = (*stat)[close_paren + 2];
    return state != 'Z' && state != 'X';
}

std::optional<Argv> read_cmdline(int pid) {
    auto data = read_proc_file(pid, "cmdline");
    if (!data || data->empty()) return std::nullopt;
    return split_nul(*data);
}

std::optional<EnvMap> read_environ(int pid) {
    auto data = read_proc_file(pid, "environ");
    if (!data) return std::nullopt;

    EnvMap env;
    for (const auto& entry : split_nul(*data)) {
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return env;
}

bool send_terminate(int pid) {
    if (pid <= 0) return false;
    return kill(pid, SIGTERM) == 0;
}

} // namespace platform
