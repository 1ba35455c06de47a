#include "config.hpp"
#include "constants.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

static Result<void> check_range(const char* key, int value, int lo, int hi) {
    if (value < lo || value > hi) {
        return Result<void>::Err(fmt::format("{} must be in [{}, {}], got {}", key, lo, hi, value));
    }
    return Result<void>::Ok();
}

static Result<ServerConfig> parse_server_config(const YAML::Node& node) {
    ServerConfig s;
    s.bind_address = node["bind_address"].as<std::string>(s.bind_address);
    s.start_port = node["start_port"].as<int>(s.start_port);
    s.mappings_file = node["mappings_file"].as<std::string>(s.mappings_file);
    s.listen_backlog = node["listen_backlog"].as<int>(s.listen_backlog);
    s.connect_timeout_ms = node["connect_timeout_ms"].as<int>(s.connect_timeout_ms);
    s.buffer_size = node["buffer_size"].as<int>(s.buffer_size);
    s.accept_poll_ms = node["accept_poll_ms"].as<int>(s.accept_poll_ms);
    s.rescan_interval_secs = node["rescan_interval_secs"].as<int>(s.rescan_interval_secs);
    s.log_file = node["log_file"].as<std::string>(s.log_file);
    s.log_to_stderr = node["log_to_stderr"].as<bool>(s.log_to_stderr);

    if (s.bind_address.empty()) {
        return Result<ServerConfig>::Err("bind_address must not be empty");
    }
    if (s.mappings_file.empty()) {
        return Result<ServerConfig>::Err("mappings_file must not be empty");
    }

    for (auto r : {check_range("start_port", s.start_port, MIN_PORT, MAX_PORT),
                   check_range("listen_backlog", s.listen_backlog, 1, 4096),
                   check_range("connect_timeout_ms", s.connect_timeout_ms, 1, 600000),
                   check_range("buffer_size", s.buffer_size, MIN_BUFFER_SIZE, MAX_BUFFER_SIZE),
                   check_range("accept_poll_ms", s.accept_poll_ms, 10, 10000),
                   check_range("rescan_interval_secs", s.rescan_interval_secs, 0, 86400)}) {
        if (r.is_err()) return Result<ServerConfig>::Err(r.error);
    }

    return Result<ServerConfig>::Ok(s);
}

fs::path Config::default_config_path() {
    return fs::current_path() / DEFAULT_CONFIG_FILE;
}

fs::path Config::mappings_path() const {
    fs::path p(server_.mappings_file);
    if (p.is_absolute() || source_.empty()) return p;
    return source_.parent_path() / p;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return Result<Config>::Ok(Config{});
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("config root must be a mapping");
        }

        // Keys may sit at top level or under a `server:` block
        YAML::Node node = (root["server"] && root["server"].IsMap()) ? root["server"] : root;
        auto server = parse_server_config(node);
        if (server.is_err()) {
            return Result<Config>::Err(server.error);
        }
        return Result<Config>::Ok(Config(server.value));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse config: " + std::string(e.what()));
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        Config config;
        config.source_ = path;
        return Result<Config>::Ok(config);
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        return Result<Config>::Err(fmt::format("{}: {}", path.string(), result.error));
    }
    result.value.source_ = path;
    return result;
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# Roxy port proxy configuration

# Address the forwarded ports listen on
bind_address: "0.0.0.0"

# First external port handed out; later mappings count up from the highest
start_port: 10000

# Where (host, protocol) -> port mappings are kept
mappings_file: "port_mappings.yaml"

connect_timeout_ms: 5000
listen_backlog: 5
buffer_size: 4096

# Re-read mappings while serving (0 = only at startup)
rescan_interval_secs: 5

# log_file: "/var/log/roxy.log"
log_to_stderr: true
)";

    try {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}
