#include "steward/config.hpp"
#include "steward/platform.hpp"

#include <nlohmann/json.hpp>

#include <limits>
#include <string>

namespace steward {

Paths make_paths(const std::string& host_root, const std::string& state_dir) {
    Paths paths;
    paths.host_root = host_root;
    paths.settings_file = host_root + "/settings.json";
    paths.hooks_dir = host_root + "/hooks";
    paths.capabilities_dir = host_root + "/skills";

    paths.state_dir = state_dir;
    paths.registries_dir = state_dir + "/registries";
    paths.hook_registry = paths.registries_dir + "/hook-registry.json";
    paths.capability_registry = paths.registries_dir + "/capability-registry.json";
    paths.servers_file = state_dir + "/servers.json";
    paths.instructions_dir = state_dir + "/instructions";
    paths.process_table = state_dir + "/server-processes.json";
    paths.archive_dir = state_dir + "/archive";
    paths.logs_dir = state_dir + "/logs";
    paths.reports_dir = state_dir + "/reports";
    paths.config_file = state_dir + "/config.json";
    return paths;
}

std::string resolve_host_root(const std::optional<std::string>& override_root) {
    if (override_root && !override_root->empty()) {
        return *override_root;
    }

    auto env_root = get_env("STEWARD_HOST_ROOT");
    if (env_root && !env_root->empty()) {
        return *env_root;
    }

    return get_home_directory() + "/.claude";
}

std::string resolve_state_dir(const std::optional<std::string>& override_dir,
                              const std::string& host_root) {
    if (override_dir && !override_dir->empty()) {
        return *override_dir;
    }

    auto env_dir = get_env("STEWARD_STATE_DIR");
    if (env_dir && !env_dir->empty()) {
        return *env_dir;
    }

    return host_root + "/steward";
}

namespace {

// Read a positive integer tunable; anything else is a warning
template<typename T>
void read_tunable(const nlohmann::json& j, const char* key, T& out,
                  std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    bool positive = v.is_number_unsigned() ? v.get<unsigned long long>() > 0
                                           : v.is_number_integer() && v.get<long long>() > 0;
    if (!positive) {
        warnings.push_back(std::string("config: ") + key + " must be a positive integer");
        return;
    }
    auto value = v.get<unsigned long long>();
    if (value > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        warnings.push_back(std::string("config: ") + key + " is out of range (max " +
                           std::to_string(std::numeric_limits<T>::max()) + ")");
        return;
    }
    out = static_cast<T>(value);
}

} // namespace

ConfigLoadResult apply_config_json(const std::string& json_str, Config config) {
    ConfigLoadResult result;

    try {
        auto j = nlohmann::json::parse(json_str);
        if (!j.is_object()) {
            result.error = "config must be a JSON object";
            return result;
        }

        read_tunable(j, "start_grace_ms", config.start_grace_ms, result.warnings);
        read_tunable(j, "stop_grace_ms", config.stop_grace_ms, result.warnings);
        read_tunable(j, "kill_wait_ms", config.kill_wait_ms, result.warnings);
        read_tunable(j, "check_timeout_ms", config.check_timeout_ms, result.warnings);
        read_tunable(j, "path_check_timeout_ms", config.path_check_timeout_ms, result.warnings);
        read_tunable(j, "log_max_bytes", config.log_max_bytes, result.warnings);
        read_tunable(j, "log_max_files", config.log_max_files, result.warnings);

        static const char* known[] = {
            "start_grace_ms", "stop_grace_ms", "kill_wait_ms", "check_timeout_ms",
            "path_check_timeout_ms", "log_max_bytes", "log_max_files",
        };
        for (auto it = j.begin(); it != j.end(); ++it) {
            bool is_known = false;
            for (const char* k : known) {
                if (it.key() == k) {
                    is_known = true;
                    break;
                }
            }
            if (!is_known) {
                result.warnings.push_back("config: unknown key '" + it.key() + "'");
            }
        }

        result.config = std::move(config);
        result.ok = true;
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("config parse error: ") + e.what();
    } catch (const std::exception& e) {
        result.error = std::string("config error: ") + e.what();
    }

    return result;
}

ConfigLoadResult load_config(const std::string& host_root, const std::string& state_dir) {
    Config config;
    config.paths = make_paths(host_root, state_dir);

    auto content = read_file(config.paths.config_file);
    if (!content) {
        ConfigLoadResult result;
        result.ok = true;
        result.config = std::move(config);
        return result;
    }

    std::string config_path = config.paths.config_file;
    auto result = apply_config_json(*content, std::move(config));
    if (!result.ok) {
        result.error = config_path + ": " + result.error;
    }
    return result;
}

Result<void> ensure_directories(const Config& config) {
    const std::string dirs[] = {
        config.paths.state_dir,
        config.paths.registries_dir,
        config.paths.instructions_dir,
        config.paths.archive_dir,
        config.paths.logs_dir,
        config.paths.reports_dir,
    };
    for (const auto& dir : dirs) {
        if (!create_directories(dir)) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR, "cannot create directory " + dir));
        }
    }
    return Result<void>::ok();
}

} // namespace steward
