#include "connection_forwarder.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <functional>
#include <thread>
#include <vector>
#include <system_error>

// ── ForwardedConnection ───────────────────────────────────

ForwardedConnection::ForwardedConnection(socket_t client, socket_t remote, std::string peer)
    : client_(client), remote_(remote), peer_(std::move(peer)) {}

ForwardedConnection::~ForwardedConnection() {
    close();
    platform::close_socket(client_);
    platform::close_socket(remote_);
}

void ForwardedConnection::close() {
    if (closed_.exchange(true)) return;
    platform::shutdown_socket(client_);
    platform::shutdown_socket(remote_);
}

// ── ConnectionSet ─────────────────────────────────────────

void ConnectionSet::add(const std::shared_ptr<ForwardedConnection>& conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    conns_.insert(conn);
}

void ConnectionSet::remove(const std::shared_ptr<ForwardedConnection>& conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    conns_.erase(conn);
}

size_t ConnectionSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conns_.size();
}

void ConnectionSet::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& c : conns_) c->close();
}

// ── Relay ─────────────────────────────────────────────────

// Copy one direction until EOF or error, then tear down the whole pairing.
static void pump(ForwardedConnection& conn, socket_t from, socket_t to,
                 int buffer_size, const char* direction) {
    std::vector<char> buf(static_cast<size_t>(buffer_size));

    for (;;) {
        long n = platform::recv_some(from, buf.data(), buf.size());
        if (n == 0) break;  // peer closed
        if (n < 0) {
            if (!conn.closed()) {
                roxy_log(fmt::format("Forwarder: {} read error for {}: {}",
                                     direction, conn.peer(), platform::last_socket_error()));
            }
            break;
        }
        if (!platform::send_all(to, buf.data(), static_cast<size_t>(n))) {
            if (!conn.closed()) {
                roxy_log(fmt::format("Forwarder: {} write error for {}: {}",
                                     direction, conn.peer(), platform::last_socket_error()));
            }
            break;
        }
    }

    conn.close();
}

// ── ConnectionForwarder ───────────────────────────────────

ConnectionForwarder::ConnectionForwarder(ProxyTarget target, ForwardOptions options,
                                         std::shared_ptr<ConnectionSet> tracked)
    : target_(std::move(target)), options_(options), tracked_(std::move(tracked)) {}

Result<void> ConnectionForwarder::dispatch(socket_t client, const std::string& peer) {
    // The thread owns a copy of the forwarder, not a reference to it.
    ConnectionForwarder self = *this;
    try {
        std::thread([self, client, peer]() mutable {
            auto r = self.forward(client, peer);
            (void)r;  // already logged by forward()
        }).detach();
    } catch (const std::system_error& e) {
        platform::close_socket(client);
        return Result<void>::Err(fmt::format("cannot spawn forwarder for {}: {}", peer, e.what()));
    }
    return Result<void>::Ok();
}

Result<void> ConnectionForwarder::forward(socket_t client, const std::string& peer) {
    auto remote = platform::connect_with_timeout(target_.host, target_.port,
                                                 options_.connect_timeout_ms);
    if (remote.is_err()) {
        roxy_log(fmt::format("Forwarder: {} dropped: {}", peer, remote.error));
        platform::close_socket(client);
        return Result<void>::Err(remote.error);
    }

    auto conn = std::make_shared<ForwardedConnection>(client, remote.value, peer);
    if (tracked_) tracked_->add(conn);

    const int buffer_size = options_.buffer_size;
    std::thread downstream;
    try {
        downstream = std::thread(pump, std::ref(*conn), conn->remote(), conn->client(),
                                 buffer_size, "remote->client");
    } catch (const std::system_error& e) {
        conn->close();
        if (tracked_) tracked_->remove(conn);
        return Result<void>::Err(fmt::format("cannot spawn relay for {}: {}", peer, e.what()));
    }

    pump(*conn, conn->client(), conn->remote(), buffer_size, "client->remote");
    downstream.join();

    if (tracked_) tracked_->remove(conn);
    roxy_log(fmt::format("Forwarder: {} <-> {}:{} closed", peer, target_.host, target_.port));
    return Result<void>::Ok();
}
