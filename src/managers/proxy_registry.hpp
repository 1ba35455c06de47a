#pragma once

#include <string>
#include <vector>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <map>
#include <optional>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "connection_forwarder.hpp"

enum class ProxyState {
    Absent,
    Starting,
    Running,
    Stopping,
};

enum class EnsureOutcome {
    Started,     // no listener before
    Unchanged,   // already running with the same target
    Replaced,    // old listener stopped, new target running
};

enum class StopMode {
    StopAccepting,      // close the listener, let in-flight connections finish
    CloseConnections,   // also shut down every tracked connection
};

const char* to_string(ProxyState s);
const char* to_string(EnsureOutcome o);

// A bound listening socket plus the thread accepting on it.
class ActiveProxy {
public:
    ActiveProxy(int port, ProxyTarget target, socket_t listen_fd,
                ForwardOptions options, int poll_ms);
    ~ActiveProxy();

    // Non-copyable, non-movable (thread + atomic)
    ActiveProxy(const ActiveProxy&) = delete;
    ActiveProxy& operator=(const ActiveProxy&) = delete;

    void start();

    // Wake the accept loop, join it and release the listening socket.
    void stop(StopMode mode);

    // False once the accept loop has exited, for whatever reason.
    bool running() const { return alive_.load(); }

    int port() const { return port_; }
    const ProxyTarget& target() const { return forwarder_.target(); }
    size_t connection_count() const { return connections_->size(); }
    const std::string& started_at() const { return started_at_; }

private:
    void accept_loop();

    int port_;
    socket_t listen_fd_;
    int poll_ms_;
    std::string started_at_;
    std::shared_ptr<ConnectionSet> connections_;
    ConnectionForwarder forwarder_;

    std::atomic<bool> stop_{false};
    std::atomic<bool> alive_{false};
    std::thread thread_;
};

// Owns every active listener, keyed by external port.
//
// Transitions on one port are serialized by that port's own mutex, so
// ensure/stop on different ports never wait on each other. The table lock is
// only held for short bookkeeping, never across bind, accept or join.
class ProxyRegistry {
public:
    explicit ProxyRegistry(const ServerConfig& config);
    ~ProxyRegistry();

    ProxyRegistry(const ProxyRegistry&) = delete;
    ProxyRegistry& operator=(const ProxyRegistry&) = delete;

    // Make sure a listener on port forwards to target. Restarts a listener
    // whose accept loop died; replaces one with a different target.
    Result<EnsureOutcome> ensure(int port, const ProxyTarget& target);

    // Returns false if nothing was running on port. A listener whose accept
    // loop already died is cleaned up and also reports false.
    bool stop(int port, StopMode mode = StopMode::StopAccepting);

    // Stop every listener.
    void shutdown(StopMode mode = StopMode::StopAccepting);

    // Running listeners, ordered by port. Does not modify anything.
    std::vector<ProxyStatus> snapshot() const;

    ProxyState state(int port) const;
    bool is_running(int port) const;
    std::optional<ProxyTarget> target(int port) const;

private:
    struct PortSlot {
        std::mutex transition;                // serializes ensure/stop on this port
        ProxyState state = ProxyState::Absent;    // guarded by mutex_
        std::shared_ptr<ActiveProxy> proxy;       // guarded by mutex_
    };

    std::shared_ptr<PortSlot> slot_for(int port);
    std::shared_ptr<PortSlot> find_slot(int port) const;
    void set_state(PortSlot& slot, ProxyState state, std::shared_ptr<ActiveProxy> proxy);
    void stop_locked(PortSlot& slot, const std::shared_ptr<ActiveProxy>& proxy, StopMode mode);

    std::string bind_address_;
    int backlog_;
    int poll_ms_;
    ForwardOptions options_;

    mutable std::mutex mutex_;
    std::map<int, std::shared_ptr<PortSlot>> slots_;
};
