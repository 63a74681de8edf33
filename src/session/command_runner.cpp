#include "command_runner.hpp"
#include <platform/process.hpp>

CommandResult SystemCommandRunner::run(const Argv& argv) {
    return platform::run_captured(argv);
}

int SystemCommandRunner::run_attached(const Argv& argv) {
    auto handle = platform::spawn(argv);
    return handle.wait();
}
