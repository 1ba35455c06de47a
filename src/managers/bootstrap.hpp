#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include "proxy_registry.hpp"

struct BootstrapReport {
    int started = 0;      // listeners newly bound (including replacements)
    int unchanged = 0;    // already running with the same target
    int failed = 0;       // ensure() returned an error
    std::vector<std::string> warnings;   // skipped records
    std::vector<std::string> errors;     // one per failed mapping

    bool ok() const { return failed == 0; }
};

// Bring up a listener for every mapping with a known protocol. Each mapping
// is ensured on its own thread so one slow or failing bind does not hold up
// the others. Safe to re-run: mappings already being served come back as
// `unchanged`.
BootstrapReport bootstrap_proxies(const MappingSet& mappings, ProxyRegistry& registry,
                                  StatusCallback cb = nullptr);
