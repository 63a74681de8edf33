#include "process_table.hpp"
#include <platform/process.hpp>

LocalProcessTable::LocalProcessTable(std::string log_path)
    : log_path_(std::move(log_path)) {}

bool LocalProcessTable::alive(int pid) {
    return platform::pid_alive(pid);
}

std::optional<Argv> LocalProcessTable::command_line(int pid) {
    return platform::read_cmdline(pid);
}

std::optional<EnvMap> LocalProcessTable::environment(int pid) {
    return platform::read_environ(pid);
}

bool LocalProcessTable::terminate(int pid) {
    return platform::send_terminate(pid);
}

int LocalProcessTable::launch(const Argv& argv, const EnvMap& env) {
    return platform::spawn_detached(argv, env, log_path_);
}
