#pragma once

#include <string>
#include <vector>
#include <memory>
#include <core/config.hpp>
#include "mapping_store.hpp"
#include "proxy_registry.hpp"
#include "bootstrap.hpp"

// Headless service facade: owns the mapping store and the listener registry.
// Any front end (HTTP intake, CLI) drives the forwarder through this.
class RoxyService {
public:
    explicit RoxyService(const Config& config);
    ~RoxyService();

    // ── Forwarding ────────────────────────────────────────────

    // Resolve (host, protocol) to an external port and make sure a listener
    // is forwarding it to host:<protocol port>. Unsupported protocols are
    // rejected before any allocation or listener start.
    Result<int> request_forward(const std::string& host, const std::string& protocol);

    // Re-establish a listener for every stored mapping. Idempotent.
    BootstrapReport bootstrap(StatusCallback cb = nullptr);

    // Stop every listener. In-flight connections are left to finish.
    void shutdown();

    // ── Administration ────────────────────────────────────────

    // Stop the mapping's listener and delete it from the store.
    Result<bool> remove_mapping(const std::string& host, const std::string& protocol);

    // ── Inspection (read-only) ────────────────────────────────

    std::vector<ProxyStatus> status() const;
    MappingSet mappings();

    ProxyRegistry& registry() { return *registry_; }

private:
    std::unique_ptr<MappingStore> store_;
    std::unique_ptr<ProxyRegistry> registry_;
};
