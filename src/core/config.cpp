#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// Accept either a single scalar or a sequence of scalars.
static std::vector<std::string> parse_string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& item : node) out.push_back(item.as<std::string>());
    } else {
        throw YAML::Exception(node.Mark(), "expected a string or a list of strings");
    }
    return out;
}

static LauncherConfig parse_launcher_config(const YAML::Node& root) {
    LauncherConfig cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) {
        throw YAML::Exception(root.Mark(), "top level must be a mapping");
    }

    cfg.wprsc_path = root["wprsc_path"].as<std::string>(cfg.wprsc_path);
    if (root["wprsc_args"]) cfg.wprsc_args = parse_string_list(root["wprsc_args"]);
    cfg.title_prefix = root["title_prefix"].as<bool>(cfg.title_prefix);
    cfg.wayland_debug = root["wayland_debug"].as<bool>(cfg.wayland_debug);
    cfg.backtrace = root["backtrace"].as<std::string>(cfg.backtrace);

    if (root["ssh_args"]) cfg.ssh_args = parse_string_list(root["ssh_args"]);
    cfg.pulseaudio_forwarding = root["pulseaudio_forwarding"].as<bool>(cfg.pulseaudio_forwarding);
    cfg.pulse_socket = root["pulse_socket"].as<std::string>(cfg.pulse_socket);
    cfg.forward_agent = root["forward_agent"].as<bool>(cfg.forward_agent);

    cfg.remote_runtime_dir = root["remote_runtime_dir"].as<std::string>(cfg.remote_runtime_dir);
    cfg.remote_socket_name = root["remote_socket_name"].as<std::string>(cfg.remote_socket_name);
    cfg.remote_control_socket_name =
        root["remote_control_socket_name"].as<std::string>(cfg.remote_control_socket_name);

    cfg.wayland_display = root["wayland_display"].as<std::string>(cfg.wayland_display);
    cfg.x_display = root["x_display"].as<std::string>(cfg.x_display);
    cfg.cursor_size = root["cursor_size"].as<int>(cfg.cursor_size);

    if (root["env"]) {
        if (!root["env"].IsMap()) {
            throw YAML::Exception(root["env"].Mark(), "env must be a mapping");
        }
        for (const auto& kv : root["env"]) {
            cfg.env[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }

    cfg.runtime_dir = root["runtime_dir"].as<std::string>(cfg.runtime_dir);
    return cfg;
}

fs::path get_config_dir() {
    return platform::home_dir() / ".config" / "wprs";
}

fs::path get_config_path() {
    return get_config_dir() / "launcher.yaml";
}

bool config_exists(const fs::path& path) {
    return fs::exists(path);
}

Result<LauncherConfig> parse_config(const std::string& yaml_text) {
    try {
        return Result<LauncherConfig>::Ok(parse_launcher_config(YAML::Load(yaml_text)));
    } catch (const YAML::Exception& e) {
        return Result<LauncherConfig>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<LauncherConfig> load_config(const fs::path& path, bool required) {
    if (!config_exists(path)) {
        if (required) {
            return Result<LauncherConfig>::Err("Config not found at " + path.string());
        }
        return Result<LauncherConfig>::Ok(LauncherConfig{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<LauncherConfig>::Err("Cannot read config at " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    auto result = parse_config(buf.str());
    if (result.is_err()) {
        result.error += " (" + path.string() + ")";
    }
    return result;
}

int probe_cursor_size(int configured, const std::string& local_value) {
    if (configured > 0) return configured;
    int local = safe_stoi(local_value, 0);
    return local > 0 ? local : DEFAULT_CURSOR_SIZE;
}

void resolve_local_settings(LauncherConfig& config) {
    if (config.runtime_dir.empty()) config.runtime_dir = platform::runtime_dir().string();
    if (config.local_hostname.empty()) config.local_hostname = platform::hostname();
    if (config.local_agent_socket.empty()) {
        config.local_agent_socket = platform::getenv_or_empty("SSH_AUTH_SOCK");
    }
    config.cursor_size = probe_cursor_size(config.cursor_size,
                                           platform::getenv_or_empty("XCURSOR_SIZE"));
}
