#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string wprs_log_path() {
    static std::string path = (platform::temp_dir() / "wprs_debug.log").string();
    return path;
}

inline void wprs_log(const std::string& msg) {
    std::ofstream out(wprs_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

inline void wprs_log_cmd(const std::string& label, const Argv& argv,
                         const CommandResult& r) {
    wprs_log(fmt::format("{} CMD: {}", label, join_words(argv)));
    wprs_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                         r.stdout_data.size(), r.stdout_data.substr(0, CMD_LOG_TRUNCATE)));
    if (!r.stderr_data.empty())
        wprs_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, CMD_LOG_TRUNCATE)));
}
