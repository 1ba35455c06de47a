#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>

// Non-interactive command front end. Each run_* returns a process exit code.
class RoxyCLI {
public:
    explicit RoxyCLI(std::filesystem::path config_path);

    // Write a default roxy.yaml if none exists.
    int run_init();

    // Bootstrap all mappings and serve until SIGINT/SIGTERM.
    int run_serve();

    // Resolve (host, protocol) to its external port, allocating if new.
    int run_map(const std::string& host, const std::string& protocol);

    // Delete a mapping from the store.
    int run_unmap(const std::string& host, const std::string& protocol);

    // Print the stored mappings.
    int run_show();

private:
    bool load_config();
    void print_status_table(const std::vector<ProxyStatus>& status) const;

    std::filesystem::path config_path_;
    Config config_;
};
