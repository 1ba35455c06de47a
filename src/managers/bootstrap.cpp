#include "bootstrap.hpp"
#include <core/log.hpp>
#include <core/protocol.hpp>
#include <fmt/format.h>
#include <thread>
#include <system_error>

namespace {

struct PlannedProxy {
    int port;
    ProxyTarget target;
    Result<EnsureOutcome> outcome{false, EnsureOutcome::Started, "not run"};
};

} // namespace

BootstrapReport bootstrap_proxies(const MappingSet& mappings, ProxyRegistry& registry,
                                  StatusCallback cb) {
    auto emit = [&](const std::string& msg) {
        roxy_log(fmt::format("Bootstrap: {}", msg));
        if (cb) cb(msg);
    };

    BootstrapReport report;
    std::vector<PlannedProxy> plan;

    for (const auto& m : mappings) {
        auto proto = parse_protocol(m.protocol);
        if (!proto) {
            std::string msg = fmt::format("Protocol '{}' not recognized. Skipping mapping for {}:{}",
                                          m.protocol, m.host, m.external_port);
            roxy_warn(msg);
            if (cb) cb(msg);
            report.warnings.push_back(msg);
            continue;
        }
        plan.push_back({m.external_port, ProxyTarget{m.host, internal_port(*proto)}});
    }

    // One thread per mapping; each writes only its own plan entry.
    std::vector<std::thread> workers;
    workers.reserve(plan.size());
    for (auto& p : plan) {
        try {
            workers.emplace_back([&registry, &p]() {
                p.outcome = registry.ensure(p.port, p.target);
            });
        } catch (const std::system_error&) {
            // Out of threads: do this one inline
            p.outcome = registry.ensure(p.port, p.target);
        }
    }
    for (auto& t : workers) t.join();

    for (const auto& p : plan) {
        if (p.outcome.is_err()) {
            report.failed++;
            std::string msg = fmt::format("port {} -> {}:{} failed: {}", p.port,
                                          p.target.host, p.target.port, p.outcome.error);
            report.errors.push_back(msg);
            emit(msg);
        } else if (p.outcome.value == EnsureOutcome::Unchanged) {
            report.unchanged++;
        } else {
            report.started++;
            emit(fmt::format("Restarted proxy on port {} to {}:{}", p.port,
                             p.target.host, p.target.port));
        }
    }

    return report;
}
