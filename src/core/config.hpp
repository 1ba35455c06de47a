#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ./roxy.yaml (or the given file). A missing file yields defaults.
    static Result<Config> load(const fs::path& path = default_config_path());

    // Parse config from YAML text. Used by load() and by tests.
    static Result<Config> parse(const std::string& yaml_text);

    static fs::path default_config_path();

    // Accessors
    const ServerConfig& server() const { return server_; }

    // Mappings file resolved against the config file's directory.
    fs::path mappings_path() const;

public:
    Config() = default;
    explicit Config(ServerConfig server) : server_(std::move(server)) {}

private:
    ServerConfig server_;
    fs::path source_;
};

// Create a commented default config. Does not overwrite an existing file.
Result<void> create_default_config(const fs::path& path = Config::default_config_path());
