#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

Config::Config() {
    lock_.file_name = LOCK_FILE_NAME;
    lock_.kill_poll_attempts = KILL_POLL_ATTEMPTS;
    lock_.kill_poll_interval_ms = KILL_POLL_INTERVAL_MS;
    tls_.clock_skew_hours = CLOCK_SKEW_TOLERANCE_HOURS;
    tls_.timeout_secs = HTTPS_TIMEOUT_SECS;
}

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

fs::path Config::lock_file_path() const {
    fs::path dir = lock_.dir.empty() ? platform::temp_dir() : fs::path(lock_.dir);
    return dir / lock_.file_name;
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("Failed to create {}: {}", config_path.parent_path().string(), ec.message()));
    }

    const char* default_config = R"(# mcpcore configuration

lock:
  dir: ""                          # Empty = system temp directory
  file_name: "matlab-mcp-core-server.lock"
  kill_existing: true              # Terminate a running instance on startup
  kill_poll_attempts: 10
  kill_poll_interval_ms: 100
  reclaim_unconfirmed: true        # Take the lock even if the old owner outlives the wait

tls:
  clock_skew_hours: 24             # Certificate validity tolerance either way
  min_version: "1.2"               # "1.2" or "1.3"
  timeout_secs: 30

log:
  path: ""                         # Empty = <temp>/mcpcore_debug.log
  level: "info"                    # debug, info, warn, error
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::Config,
            "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

// Present, non-null keys must convert; a type mismatch throws and is
// reported as a config error.
template <typename T>
static void read_key(const YAML::Node& node, const char* key, T& out) {
    if (node[key] && !node[key].IsNull()) {
        out = node[key].as<T>();
    }
}

static void parse_lock_config(const YAML::Node& node, LockConfig& lock) {
    read_key(node, "dir", lock.dir);
    read_key(node, "file_name", lock.file_name);
    read_key(node, "kill_existing", lock.kill_existing);
    read_key(node, "kill_poll_attempts", lock.kill_poll_attempts);
    read_key(node, "kill_poll_interval_ms", lock.kill_poll_interval_ms);
    read_key(node, "reclaim_unconfirmed", lock.reclaim_unconfirmed);
}

static void parse_tls_config(const YAML::Node& node, TlsConfig& tls) {
    read_key(node, "clock_skew_hours", tls.clock_skew_hours);
    read_key(node, "min_version", tls.min_version);
    read_key(node, "timeout_secs", tls.timeout_secs);
}

static void parse_log_config(const YAML::Node& node, LogConfig& log) {
    read_key(node, "path", log.path);
    read_key(node, "level", log.level);
}

static Result<void> validate(const Config& cfg) {
    const auto& lock = cfg.lock();
    if (lock.file_name.empty() || lock.file_name.find_first_of("/\\") != std::string::npos) {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("lock.file_name must be a plain file name, got '{}'", lock.file_name));
    }
    if (lock.kill_poll_attempts < 0 || lock.kill_poll_interval_ms < 0) {
        return Result<void>::Err(ErrorKind::Config, "lock poll settings must not be negative");
    }
    const auto& tls = cfg.tls();
    if (tls.clock_skew_hours < 0) {
        return Result<void>::Err(ErrorKind::Config, "tls.clock_skew_hours must not be negative");
    }
    if (tls.min_version != "1.2" && tls.min_version != "1.3") {
        return Result<void>::Err(ErrorKind::Config,
            fmt::format("tls.min_version must be \"1.2\" or \"1.3\", got '{}'", tls.min_version));
    }
    if (tls.timeout_secs <= 0) {
        return Result<void>::Err(ErrorKind::Config, "tls.timeout_secs must be positive");
    }
    return Result<void>::Ok();
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config cfg;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return Result<Config>::Ok(cfg);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::Config, "config root must be a mapping");
        }
        if (root["lock"] && root["lock"].IsMap()) {
            parse_lock_config(root["lock"], cfg.lock_);
        }
        if (root["tls"] && root["tls"].IsMap()) {
            parse_tls_config(root["tls"], cfg.tls_);
        }
        if (root["log"] && root["log"].IsMap()) {
            parse_log_config(root["log"], cfg.log_);
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Config, fmt::format("invalid config: {}", e.what()));
    }

    auto valid = validate(cfg);
    if (valid.is_err()) {
        return Result<Config>::Err(valid.kind, valid.error);
    }
    return Result<Config>::Ok(cfg);
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::Config, "Cannot read " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        result.error = fmt::format("{}: {}", path.string(), result.error);
    }
    return result;
}

Result<Config> Config::load() {
    return load_file(get_config_path());
}
