#include "roxy_service.hpp"
#include "port_allocator.hpp"
#include <core/log.hpp>
#include <core/protocol.hpp>
#include <fmt/format.h>

RoxyService::RoxyService(const Config& config)
    : store_(std::make_unique<MappingStore>(config.mappings_path(), config.server().start_port)),
      registry_(std::make_unique<ProxyRegistry>(config.server())) {}

RoxyService::~RoxyService() {
    shutdown();
}

Result<int> RoxyService::request_forward(const std::string& host, const std::string& protocol) {
    auto proto = parse_protocol(protocol);
    if (!proto) {
        return Result<int>::Err(fmt::format("unsupported protocol '{}'", protocol));
    }

    auto port = store_->resolve(host, protocol);
    if (port.is_err()) {
        return port;
    }

    ProxyTarget target{host, internal_port(*proto)};
    auto ensured = registry_->ensure(port.value, target);
    if (ensured.is_err()) {
        return Result<int>::Err(ensured.error);
    }

    roxy_log(fmt::format("Forward {}://{} on port {} ({})", protocol, host, port.value,
                         to_string(ensured.value)));
    return port;
}

BootstrapReport RoxyService::bootstrap(StatusCallback cb) {
    return bootstrap_proxies(store_->load(), *registry_, cb);
}

void RoxyService::shutdown() {
    registry_->shutdown(StopMode::StopAccepting);
}

Result<bool> RoxyService::remove_mapping(const std::string& host, const std::string& protocol) {
    int port = find_port(store_->load(), host, protocol);
    if (port > 0) {
        registry_->stop(port);
    }
    return store_->remove(host, protocol);
}

std::vector<ProxyStatus> RoxyService::status() const {
    return registry_->snapshot();
}

MappingSet RoxyService::mappings() {
    return store_->load();
}
