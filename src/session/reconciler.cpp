#include "reconciler.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

SessionReconciler::SessionReconciler(ProcessSupervisor& supervisor)
    : supervisor_(supervisor) {}

std::optional<std::string> SessionReconciler::mismatch(const LiveProcess& live,
                                                       const Argv& desired_command,
                                                       const EnvMap& desired_env) {
    if (live.command_line != desired_command) {
        return fmt::format("command line differs: running [{}]", join_words(live.command_line));
    }
    for (const auto& [key, want] : desired_env) {
        auto it = live.environment.find(key);
        if (it == live.environment.end()) {
            return fmt::format("{} not set", key);
        }
        if (it->second != want) {
            return fmt::format("{}={} (want {})", key, it->second, want);
        }
    }
    return std::nullopt;
}

bool SessionReconciler::reconcile(const Argv& desired_command, const EnvMap& desired_env) {
    auto live = supervisor_.current_process();
    if (live) {
        auto why = mismatch(*live, desired_command, desired_env);
        if (!why) {
            wprs_log(fmt::format("reconcile: pid {} up to date", live->pid));
            return false;
        }
        wprs_log(fmt::format("reconcile: restarting pid {}: {}", live->pid, *why));
    } else {
        wprs_log("reconcile: no live companion");
    }

    supervisor_.stop();
    supervisor_.start(desired_command, desired_env);
    return true;
}
