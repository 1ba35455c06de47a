#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <set>
#include <atomic>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// A client socket paired with its outbound socket to the remote target.
// Both descriptors are released when the last reference goes away.
class ForwardedConnection {
public:
    ForwardedConnection(socket_t client, socket_t remote, std::string peer);
    ~ForwardedConnection();

    ForwardedConnection(const ForwardedConnection&) = delete;
    ForwardedConnection& operator=(const ForwardedConnection&) = delete;

    // Shut down both sockets so both copy directions unblock. Idempotent.
    void close();
    bool closed() const { return closed_.load(); }

    socket_t client() const { return client_; }
    socket_t remote() const { return remote_; }
    const std::string& peer() const { return peer_; }

private:
    socket_t client_;
    socket_t remote_;
    std::string peer_;
    std::atomic<bool> closed_{false};
};

// Live pairings spawned by one listener. Shared with the forwarding threads
// so it outlives the listener if connections are still running.
class ConnectionSet {
public:
    void add(const std::shared_ptr<ForwardedConnection>& conn);
    void remove(const std::shared_ptr<ForwardedConnection>& conn);
    size_t size() const;

    // Tear down every tracked pairing.
    void close_all();

private:
    mutable std::mutex mutex_;
    std::set<std::shared_ptr<ForwardedConnection>> conns_;
};

struct ForwardOptions {
    int connect_timeout_ms = 5000;
    int buffer_size = 4096;
};

// Relays bytes between accepted clients and one remote target. Copyable and
// self-contained so a dispatched connection never refers back to the
// listener that accepted it.
class ConnectionForwarder {
public:
    ConnectionForwarder(ProxyTarget target, ForwardOptions options,
                        std::shared_ptr<ConnectionSet> tracked);

    // Hand off an accepted client. Returns immediately; the connect and the
    // relay run on their own threads.
    Result<void> dispatch(socket_t client, const std::string& peer);

    // Connect to the target and relay until either side closes. Blocks.
    // On connect failure the client is closed and the error returned.
    Result<void> forward(socket_t client, const std::string& peer);

    const ProxyTarget& target() const { return target_; }

private:
    ProxyTarget target_;
    ForwardOptions options_;
    std::shared_ptr<ConnectionSet> tracked_;
};
