#include "supervisor.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fstream>
#include <iterator>
#include <system_error>
#include <fmt/format.h>

ProcessSupervisor::ProcessSupervisor(ProcessTable& table, fs::path pid_file)
    : table_(table), pid_file_(std::move(pid_file)) {}

SupervisedRecord ProcessSupervisor::inspect() const {
    SupervisedRecord rec;

    std::ifstream in(pid_file_);
    if (!in) return rec;  // Absent

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    trim(content);

    rec.pid = safe_stoi(content, 0);
    rec.state = (rec.pid > 0 && table_.alive(rec.pid)) ? RecordState::Live : RecordState::Stale;
    if (rec.state == RecordState::Stale) {
        wprs_log(fmt::format("supervisor: stale record '{}' in {}, removing",
                             content, pid_file_.string()));
        std::error_code ec;
        fs::remove(pid_file_, ec);
        if (ec) wprs_log(fmt::format("supervisor: remove {}: {}", pid_file_.string(), ec.message()));
    }
    return rec;
}

std::optional<LiveProcess> ProcessSupervisor::current_process() const {
    auto rec = inspect();
    if (rec.state != RecordState::Live) return std::nullopt;

    // The process can exit between the liveness check and reading /proc.
    auto cmdline = table_.command_line(rec.pid);
    if (!cmdline) return std::nullopt;

    LiveProcess proc;
    proc.pid = rec.pid;
    proc.command_line = std::move(*cmdline);
    proc.environment = table_.environment(rec.pid).value_or(EnvMap{});
    return proc;
}

int ProcessSupervisor::start(const Argv& command, const EnvMap& environment) {
    int pid = table_.launch(command, environment);
    wprs_log(fmt::format("supervisor: started pid {}: {}", pid, join_words(command)));
    write_pid(pid);
    return pid;
}

void ProcessSupervisor::stop() {
    auto rec = inspect();
    if (rec.state == RecordState::Live) {
        if (table_.terminate(rec.pid)) {
            wprs_log(fmt::format("supervisor: sent SIGTERM to {}", rec.pid));
        }
    }

    std::error_code ec;
    fs::remove(pid_file_, ec);
    if (ec) wprs_log(fmt::format("supervisor: remove {}: {}", pid_file_.string(), ec.message()));
}

void ProcessSupervisor::write_pid(int pid) {
    std::error_code ec;
    fs::create_directories(pid_file_.parent_path(), ec);

    std::ofstream out(pid_file_, std::ios::trunc);
    if (!out) {
        throw LaunchError(fmt::format("Started pid {} but cannot write {}", pid, pid_file_.string()));
    }
    out << pid;
    out.close();
    if (!out) {
        throw LaunchError(fmt::format("Started pid {} but cannot write {}", pid, pid_file_.string()));
    }
}
