#pragma once

#include <core/types.hpp>

// Executes external programs (ssh). Abstract so the session components can
// be driven by a scripted runner in tests.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Run to completion with stdout/stderr captured.
    virtual CommandResult run(const Argv& argv) = 0;

    // Run sharing our terminal (prompts, remote stdio) and return its exit
    // status. Throws LaunchError if the program cannot be started.
    virtual int run_attached(const Argv& argv) = 0;
};

class SystemCommandRunner : public CommandRunner {
public:
    CommandResult run(const Argv& argv) override;
    int run_attached(const Argv& argv) override;
};
