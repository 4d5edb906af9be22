#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/remote_session.hpp>

// A session handed out by ConnectionCache for one operation.
struct SessionLease {
    std::shared_ptr<RemoteSession> session;
    std::string key;
    bool cached_before = false;   // came out of the cache
    bool persisted = false;       // stored in the cache by this acquire
    bool connected_now = false;   // a new connection was established
};

// ConnectionCache: at most one live session per credential identity.
//
// Callers on one key are already serialized by OperationQueue; the mutex
// only guards the map against lanes of other keys and close_all().
class ConnectionCache {
public:
    using ConnectCallback = std::function<void()>;

    explicit ConnectionCache(SessionFactory factory);
    ~ConnectionCache();

    ConnectionCache(const ConnectionCache&) = delete;
    ConnectionCache& operator=(const ConnectionCache&) = delete;

    // Cached session if present and alive, else a new connection.
    // on_connect fires right before a new connection is attempted.
    // persist: store a new session in the cache.
    Result<SessionLease> acquire(const std::string& key, const CredentialIdentity& identity,
                                 bool persist, ConnectCallback on_connect = nullptr);

    // Tear down a lease that is not owned by the cache.
    void release(SessionLease& lease);

    // Remove and end the cached session. Returns whether one existed.
    bool close(const std::string& key);
    void close_all();

    bool is_cached(const std::string& key) const;
    std::vector<std::string> cached_keys() const;

private:
    SessionFactory factory_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<RemoteSession>> sessions_;

    static void end_quietly(RemoteSession& session, const std::string& key, const char* why);
};

// Releases a lease when the operation leaves scope, whatever the outcome.
class LeaseGuard {
public:
    LeaseGuard(ConnectionCache& cache, SessionLease& lease) : cache_(cache), lease_(lease) {}
    ~LeaseGuard() { cache_.release(lease_); }

    LeaseGuard(const LeaseGuard&) = delete;
    LeaseGuard& operator=(const LeaseGuard&) = delete;

private:
    ConnectionCache& cache_;
    SessionLease& lease_;
};
