#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

namespace platform {

// Owning handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // Wait for the process to exit. Returns its exit code, or 128+signal
    // if it was killed; -1 if there is nothing to wait for.
    int wait();

private:
    int pid_ = -1;
    bool reaped_ = false;
    friend ProcessHandle spawn(const Argv& argv, const EnvMap& env);
};

// Spawn a child sharing our stdio. env entries override the inherited
// environment. Throws LaunchError if the program cannot be executed.
ProcessHandle spawn(const Argv& argv, const EnvMap& env = {});

// Run a program to completion, capturing stdout and stderr. A program that
// cannot be executed yields exit code 127 with the reason in stderr_data.
CommandResult run_captured(const Argv& argv);

// Start a program in its own session, reparented away from us so it
// outlives the launcher. stdin is /dev/null; stdout/stderr go to log_path
// (appended) or /dev/null. Returns its pid. Throws LaunchError.
int spawn_detached(const Argv& argv, const EnvMap& env,
                   const std::string& log_path = "");

// True if pid names a live (non-zombie) process.
bool pid_alive(int pid);

// argv of a live process from /proc/<pid>/cmdline. nullopt if unreadable.
std::optional<Argv> read_cmdline(int pid);

// Environment of a live process from /proc/<pid>/environ. nullopt if unreadable.
std::optional<EnvMap> read_environ(int pid);

// Graceful termination request (SIGTERM). False if the signal was not delivered.
bool send_terminate(int pid);

} // namespace platform
