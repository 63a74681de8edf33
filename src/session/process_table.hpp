#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>

// View of the local process table as the supervisor needs it.
class ProcessTable {
public:
    virtual ~ProcessTable() = default;

    virtual bool alive(int pid) = 0;
    virtual std::optional<Argv> command_line(int pid) = 0;
    virtual std::optional<EnvMap> environment(int pid) = 0;

    // Graceful termination request; false if nothing was signalled.
    virtual bool terminate(int pid) = 0;

    // Start a detached process with env merged over ours. Returns its pid.
    // Throws LaunchError.
    virtual int launch(const Argv& argv, const EnvMap& env) = 0;
};

// Backed by kill(2) and /proc.
class LocalProcessTable : public ProcessTable {
public:
    // log_path receives the launched process's stdout/stderr ("" = discard).
    explicit LocalProcessTable(std::string log_path = "");

    bool alive(int pid) override;
    std::optional<Argv> command_line(int pid) override;
    std::optional<EnvMap> environment(int pid) override;
    bool terminate(int pid) override;
    int launch(const Argv& argv, const EnvMap& env) override;

private:
    std::string log_path_;
};
