#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// ~/.config/wprs
fs::path get_config_dir();

// ~/.config/wprs/launcher.yaml
fs::path get_config_path();

bool config_exists(const fs::path& path = get_config_path());

// Parse YAML text over the built-in defaults. Unknown keys are ignored.
Result<LauncherConfig> parse_config(const std::string& yaml_text);

// Load a config file. A missing file yields defaults unless `required`.
Result<LauncherConfig> load_config(const fs::path& path, bool required = false);

// `configured` if > 0, else `local_value` if it is a positive number, else 24.
int probe_cursor_size(int configured, const std::string& local_value);

// Fill runtime_dir, local_hostname, local_agent_socket and cursor_size from
// this host where the file and flags left them unset. Called once by main;
// nothing else consults the process environment.
void resolve_local_settings(LauncherConfig& config);
