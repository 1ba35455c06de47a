#include "roxy_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/protocol.hpp>
#include <managers/mapping_store.hpp>
#include <managers/roxy_service.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>

#ifndef _WIN32
#  include <signal.h>
#endif

static volatile sig_atomic_t g_stop_requested = 0;

static void stop_signal_handler(int) {
    g_stop_requested = 1;
}

static void install_stop_handlers() {
#ifdef _WIN32
    std::signal(SIGINT, stop_signal_handler);
    std::signal(SIGTERM, stop_signal_handler);
#else
    struct sigaction sa;
    sa.sa_handler = stop_signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // Writes to a peer that hung up must fail with EPIPE, not kill us
    struct sigaction ignore;
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ignore.sa_flags = 0;
    sigaction(SIGPIPE, &ignore, nullptr);
#endif
}

RoxyCLI::RoxyCLI(std::filesystem::path config_path)
    : config_path_(std::move(config_path)) {}

bool RoxyCLI::load_config() {
    auto result = Config::load(config_path_);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return false;
    }
    config_ = result.value;
    roxy_log_configure(config_.server().log_file, config_.server().log_to_stderr);
    return true;
}

int RoxyCLI::run_init() {
    if (std::filesystem::exists(config_path_)) {
        std::cout << theme::info("Config already exists at " + config_path_.string());
        return 0;
    }
    auto r = create_default_config(config_path_);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + config_path_.string());
    return 0;
}

void RoxyCLI::print_status_table(const std::vector<ProxyStatus>& status) const {
    std::cout << theme::section("Active proxies");
    if (status.empty()) {
        std::cout << theme::dim("  (none)") << "\n";
        return;
    }
    std::cout << theme::bold(fmt::format("  {:<8} {:<32} {:<8} {:<6} {}",
                                         "PORT", "TARGET", "RPORT", "CONNS", "SINCE")) << "\n";
    for (const auto& s : status) {
        std::cout << fmt::format("  {:<8} {:<32} {:<8} {:<6} {}\n", s.external_port,
                                 s.remote_host, s.remote_port, s.connections, s.started_at);
    }
}

int RoxyCLI::run_serve() {
    if (!load_config()) return 1;
    install_stop_handlers();

    const auto& server = config_.server();
    RoxyService service(config_);

    std::cout << theme::section(fmt::format("Roxy {}", ROXY_VERSION));
    std::cout << theme::kv("config", config_path_.string());
    std::cout << theme::kv("mappings", config_.mappings_path().string());
    std::cout << theme::kv("listen", server.bind_address);
    std::cout << theme::kv("log", roxy_log_path());

    auto report = service.bootstrap([](const std::string& msg) {
        std::cout << theme::info(msg);
    });
    for (const auto& w : report.warnings) std::cout << theme::warn(w);
    if (!report.ok()) {
        std::cout << theme::fail(fmt::format("{} mapping(s) failed to start", report.failed));
    }
    print_status_table(service.status());

    using clock = std::chrono::steady_clock;
    auto next_scan = clock::now() + std::chrono::seconds(server.rescan_interval_secs);

    while (!g_stop_requested) {
        platform::sleep_ms(SERVE_TICK_MS);
        if (server.rescan_interval_secs <= 0 || clock::now() < next_scan) continue;

        next_scan = clock::now() + std::chrono::seconds(server.rescan_interval_secs);
        auto rescan = service.bootstrap();
        if (rescan.started > 0 || rescan.failed > 0) {
            print_status_table(service.status());
        }
    }

    std::cout << "\n" << theme::info("Shutting down");
    service.shutdown();
    std::cout << theme::ok("All proxies stopped");
    return 0;
}

int RoxyCLI::run_map(const std::string& host, const std::string& protocol) {
    if (!load_config()) return 1;

    if (!parse_protocol(protocol)) {
        std::string supported;
        for (const auto& p : supported_protocols()) {
            supported += supported.empty() ? p : ", " + p;
        }
        std::cout << theme::fail(fmt::format("Unsupported protocol '{}' (supported: {})",
                                             protocol, supported));
        return 1;
    }

    MappingStore store(config_.mappings_path(), config_.server().start_port);
    auto port = store.resolve(host, protocol);
    if (port.is_err()) {
        std::cout << theme::fail(port.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("{}://{} -> port {}", protocol, host, port.value));
    if (config_.server().rescan_interval_secs <= 0) {
        std::cout << theme::info("A running `roxy serve` picks this up on its next restart");
    }
    return 0;
}

int RoxyCLI::run_unmap(const std::string& host, const std::string& protocol) {
    if (!load_config()) return 1;

    MappingStore store(config_.mappings_path(), config_.server().start_port);
    auto removed = store.remove(host, protocol);
    if (removed.is_err()) {
        std::cout << theme::fail(removed.error);
        return 1;
    }
    if (!removed.value) {
        std::cout << theme::info(fmt::format("No mapping for {}://{}", protocol, host));
        return 0;
    }
    std::cout << theme::ok(fmt::format("Removed {}://{}", protocol, host));
    return 0;
}

int RoxyCLI::run_show() {
    if (!load_config()) return 1;

    MappingStore store(config_.mappings_path(), config_.server().start_port);
    MappingSet mappings = store.load();
    std::sort(mappings.begin(), mappings.end(), [](const MappingRecord& a, const MappingRecord& b) {
        return a.external_port < b.external_port;
    });

    std::cout << theme::section("Port mappings");
    if (mappings.empty()) {
        std::cout << theme::dim("  No port mappings found") << "\n";
        return 0;
    }

    std::cout << theme::bold(fmt::format("  {:<8} {:<32} {:<10} {}",
                                         "PORT", "HOST", "PROTOCOL", "TARGET PORT")) << "\n";
    for (const auto& m : mappings) {
        auto proto = parse_protocol(m.protocol);
        std::string target = proto ? std::to_string(internal_port(*proto)) : "unknown";
        std::cout << fmt::format("  {:<8} {:<32} {:<10} {}\n", m.external_port, m.host,
                                 m.protocol, target);
    }
    std::cout << "\n" << theme::dim(fmt::format("  {} mapping(s) in {}", mappings.size(),
                                                store.path().string())) << "\n";
    return 0;
}
