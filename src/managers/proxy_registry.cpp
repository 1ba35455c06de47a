#include "proxy_registry.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <system_error>
#include <cerrno>
#ifndef _WIN32
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <arpa/inet.h>
#endif

const char* to_string(ProxyState s) {
    switch (s) {
        case ProxyState::Absent:   return "absent";
        case ProxyState::Starting: return "starting";
        case ProxyState::Running:  return "running";
        case ProxyState::Stopping: return "stopping";
    }
    return "?";
}

const char* to_string(EnsureOutcome o) {
    switch (o) {
        case EnsureOutcome::Started:   return "started";
        case EnsureOutcome::Unchanged: return "unchanged";
        case EnsureOutcome::Replaced:  return "replaced";
    }
    return "?";
}

// ── ActiveProxy ───────────────────────────────────────────

ActiveProxy::ActiveProxy(int port, ProxyTarget target, socket_t listen_fd,
                         ForwardOptions options, int poll_ms)
    : port_(port),
      listen_fd_(listen_fd),
      poll_ms_(poll_ms),
      started_at_(now_iso()),
      connections_(std::make_shared<ConnectionSet>()),
      forwarder_(std::move(target), options, connections_) {}

ActiveProxy::~ActiveProxy() {
    stop(StopMode::StopAccepting);
}

void ActiveProxy::start() {
    alive_.store(true);
    try {
        thread_ = std::thread(&ActiveProxy::accept_loop, this);
    } catch (...) {
        alive_.store(false);
        throw;
    }
}

void ActiveProxy::stop(StopMode mode) {
    stop_.store(true);
    if (listen_fd_ != ROXY_INVALID_SOCKET) {
        platform::shutdown_socket(listen_fd_);
    }
    // Bounded: the loop rechecks stop_ at least every poll_ms_.
    if (thread_.joinable()) thread_.join();
    if (listen_fd_ != ROXY_INVALID_SOCKET) {
        platform::close_socket(listen_fd_);
        listen_fd_ = ROXY_INVALID_SOCKET;
    }
    if (mode == StopMode::CloseConnections) {
        connections_->close_all();
    }
}

static std::string describe_peer(const struct sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return fmt::format("{}:{}", ip, ntohs(addr.sin_port));
}

void ActiveProxy::accept_loop() {
    bool failed = false;

    while (!stop_.load()) {
        int revents = platform::poll_socket(listen_fd_, POLLIN, poll_ms_);
        if (stop_.load()) break;
        if (revents == 0) continue;
        if (!(revents & POLLIN)) {
            roxy_warn(fmt::format("Proxy {}: listener reported poll events {:#x}", port_, revents));
            failed = true;
            break;
        }

        struct sockaddr_in client_addr{};
        socklen_t len = sizeof(client_addr);
        socket_t client = accept(listen_fd_, reinterpret_cast<struct sockaddr*>(&client_addr), &len);
        if (client == ROXY_INVALID_SOCKET) {
            if (stop_.load()) break;
#ifndef _WIN32
            // Transient: the peer went away or we are out of descriptors for now
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK ||
                errno == ECONNABORTED || errno == EPROTO) {
                continue;
            }
            if (errno == EMFILE || errno == ENFILE) {
                roxy_log(fmt::format("Proxy {}: accept: {}", port_, platform::last_socket_error()));
                platform::sleep_ms(poll_ms_);
                continue;
            }
#endif
            roxy_warn(fmt::format("Proxy {}: accept failed: {}", port_, platform::last_socket_error()));
            failed = true;
            break;
        }

        platform::set_nonblocking(client, false);
        std::string peer = describe_peer(client_addr);
        roxy_log(fmt::format("Proxy {}: accepted connection from {}", port_, peer));

        auto r = forwarder_.dispatch(client, peer);
        if (r.is_err()) {
            roxy_log(fmt::format("Proxy {}: {}", port_, r.error));
        }
    }

    alive_.store(false);
    if (failed) {
        roxy_warn(fmt::format("Proxy on port {} exited unexpectedly", port_));
    } else {
        roxy_log(fmt::format("Proxy on port {} has been stopped", port_));
    }
}

// ── ProxyRegistry ─────────────────────────────────────────

ProxyRegistry::ProxyRegistry(const ServerConfig& config)
    : bind_address_(config.bind_address),
      backlog_(config.listen_backlog),
      poll_ms_(config.accept_poll_ms) {
    options_.connect_timeout_ms = config.connect_timeout_ms;
    options_.buffer_size = config.buffer_size;
}

ProxyRegistry::~ProxyRegistry() {
    shutdown();
}

std::shared_ptr<ProxyRegistry::PortSlot> ProxyRegistry::slot_for(int port) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = slots_[port];
    if (!slot) slot = std::make_shared<PortSlot>();
    return slot;
}

std::shared_ptr<ProxyRegistry::PortSlot> ProxyRegistry::find_slot(int port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(port);
    return it == slots_.end() ? nullptr : it->second;
}

void ProxyRegistry::set_state(PortSlot& slot, ProxyState state,
                              std::shared_ptr<ActiveProxy> proxy) {
    std::lock_guard<std::mutex> lock(mutex_);
    slot.state = state;
    slot.proxy = std::move(proxy);
}

void ProxyRegistry::stop_locked(PortSlot& slot, const std::shared_ptr<ActiveProxy>& proxy,
                                StopMode mode) {
    // Hidden from snapshot() while stopping
    set_state(slot, ProxyState::Stopping, nullptr);
    proxy->stop(mode);
    set_state(slot, ProxyState::Absent, nullptr);
}

Result<EnsureOutcome> ProxyRegistry::ensure(int port, const ProxyTarget& target) {
    auto slot = slot_for(port);
    std::lock_guard<std::mutex> transition(slot->transition);

    std::shared_ptr<ActiveProxy> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = slot->proxy;
    }

    EnsureOutcome outcome = EnsureOutcome::Started;
    if (current) {
        if (current->running() && current->target() == target) {
            return Result<EnsureOutcome>::Ok(EnsureOutcome::Unchanged);
        }
        if (current->running()) {
            roxy_log(fmt::format("Proxy {}: replacing target {}:{} with {}:{}", port,
                                 current->target().host, current->target().port,
                                 target.host, target.port));
            outcome = EnsureOutcome::Replaced;
        } else {
            roxy_log(fmt::format("Proxy {}: restarting dead listener", port));
        }
        stop_locked(*slot, current, StopMode::StopAccepting);
    }

    set_state(*slot, ProxyState::Starting, nullptr);

    auto listener = platform::open_listener(bind_address_, port, backlog_);
    if (listener.is_err()) {
        set_state(*slot, ProxyState::Absent, nullptr);
        roxy_log(fmt::format("Failed to start proxy on port {}: {}", port, listener.error));
        return Result<EnsureOutcome>::Err(listener.error);
    }
    platform::set_nonblocking(listener.value, true);

    auto proxy = std::make_shared<ActiveProxy>(port, target, listener.value, options_, poll_ms_);
    try {
        proxy->start();
    } catch (const std::system_error& e) {
        proxy.reset();  // closes the listener
        set_state(*slot, ProxyState::Absent, nullptr);
        return Result<EnsureOutcome>::Err(
            fmt::format("cannot spawn accept loop for port {}: {}", port, e.what()));
    }

    set_state(*slot, ProxyState::Running, proxy);
    roxy_log(fmt::format("Started proxy on port {} to {}:{}", port, target.host, target.port));
    return Result<EnsureOutcome>::Ok(outcome);
}

bool ProxyRegistry::stop(int port, StopMode mode) {
    auto slot = find_slot(port);
    if (!slot) return false;

    std::lock_guard<std::mutex> transition(slot->transition);
    std::shared_ptr<ActiveProxy> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current = slot->proxy;
    }
    if (!current) return false;

    // A listener whose accept loop died still needs joining, but was not running
    bool was_running = current->running();
    stop_locked(*slot, current, mode);
    if (!was_running) {
        roxy_log(fmt::format("Cleared dead proxy on port {}", port));
        return false;
    }
    roxy_log(fmt::format("Stopped proxy on port {}", port));
    return true;
}

void ProxyRegistry::shutdown(StopMode mode) {
    std::vector<int> ports;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [port, slot] : slots_) {
            if (slot->proxy) ports.push_back(port);
        }
    }
    for (int port : ports) stop(port, mode);
}

std::vector<ProxyStatus> ProxyRegistry::snapshot() const {
    std::vector<ProxyStatus> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [port, slot] : slots_) {
        if (!slot->proxy || !slot->proxy->running()) continue;
        ProxyStatus s;
        s.external_port = port;
        s.remote_host = slot->proxy->target().host;
        s.remote_port = slot->proxy->target().port;
        s.connections = slot->proxy->connection_count();
        s.started_at = slot->proxy->started_at();
        out.push_back(s);
    }
    return out;
}

ProxyState ProxyRegistry::state(int port) const {
    auto slot = find_slot(port);
    if (!slot) return ProxyState::Absent;
    std::lock_guard<std::mutex> lock(mutex_);
    // A listener whose accept loop died is not running, whatever the slot says
    if (slot->state == ProxyState::Running && !(slot->proxy && slot->proxy->running())) {
        return ProxyState::Absent;
    }
    return slot->state;
}

bool ProxyRegistry::is_running(int port) const {
    return state(port) == ProxyState::Running;
}

std::optional<ProxyTarget> ProxyRegistry::target(int port) const {
    auto slot = find_slot(port);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!slot->proxy || !slot->proxy->running()) return std::nullopt;
    return slot->proxy->target();
}
