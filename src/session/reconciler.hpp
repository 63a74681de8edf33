#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>
#include "supervisor.hpp"

// Restarts the companion only when its live invocation differs from the
// desired one. Repeated attaches with unchanged settings leave it alone.
class SessionReconciler {
public:
    explicit SessionReconciler(ProcessSupervisor& supervisor);

    // Returns true if the process was (re)started.
    bool reconcile(const Argv& desired_command, const EnvMap& desired_env);

    // Why `live` does not satisfy the desired invocation, or nullopt if it
    // does. Only keys in desired_env are compared.
    static std::optional<std::string> mismatch(const LiveProcess& live,
                                               const Argv& desired_command,
                                               const EnvMap& desired_env);

private:
    ProcessSupervisor& supervisor_;
};
