#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from ~/.mcpcore/config.yaml; a missing file yields defaults.
    static Result<Config> load();

    // Load from an explicit path; a missing file yields defaults.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by load_file and tests).
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const LockConfig& lock() const { return lock_; }
    const TlsConfig& tls() const { return tls_; }
    const LogConfig& log() const { return log_; }

    // Lock file location after applying defaults.
    fs::path lock_file_path() const;

    Config();

private:
    LockConfig lock_;
    TlsConfig tls_;
    LogConfig log_;
};

bool config_exists();
fs::path get_config_dir();
fs::path get_config_path();

// Write the commented default config if none exists.
Result<void> create_default_config();
