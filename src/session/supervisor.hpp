#pragma once

#include <filesystem>
#include <optional>
#include <core/types.hpp>
#include "process_table.hpp"

namespace fs = std::filesystem;

// What the pid file says, checked against the process table.
enum class RecordState {
    Absent,   // no pid file
    Stale,    // pid file present, but no such live process (or unparsable)
    Live,     // pid file names a running process
};

struct SupervisedRecord {
    RecordState state = RecordState::Absent;
    int pid = 0;
};

// Snapshot of the supervised process as it runs right now.
struct LiveProcess {
    int pid = 0;
    Argv command_line;
    EnvMap environment;
};

// Tracks the single companion process of a session through its pid file.
class ProcessSupervisor {
public:
    ProcessSupervisor(ProcessTable& table, fs::path pid_file);

    // Re-read the pid file and check liveness. A stale record is reported
    // once and its file removed. Never throws for stale or missing records.
    SupervisedRecord inspect() const;

    // The live process with its invocation, or nullopt when absent/stale.
    std::optional<LiveProcess> current_process() const;

    // Launch detached and record the pid, replacing any previous record.
    // Throws LaunchError.
    int start(const Argv& command, const EnvMap& environment);

    // SIGTERM the live process if any; always remove the pid file.
    void stop();

    const fs::path& pid_file() const { return pid_file_; }

private:
    ProcessTable& table_;
    fs::path pid_file_;

    void write_pid(int pid);
};
