#include "connection_cache.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ConnectionCache::ConnectionCache(SessionFactory factory)
    : factory_(std::move(factory)) {}

ConnectionCache::~ConnectionCache() {
    close_all();
}

void ConnectionCache::end_quietly(RemoteSession& session, const std::string& key, const char* why) {
    auto r = session.end();
    if (r.is_err()) {
        sftpflow_log(fmt::format("cache: teardown of {} ({}) failed: {}", key, why, r.error));
    }
}

// ── Acquire / release ───────────────────────────────────────

Result<SessionLease> ConnectionCache::acquire(const std::string& key,
                                              const CredentialIdentity& identity,
                                              bool persist, ConnectCallback on_connect) {
    std::shared_ptr<RemoteSession> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(key);
        if (it != sessions_.end()) {
            if (it->second->is_alive()) {
                SessionLease lease;
                lease.session = it->second;
                lease.key = key;
                lease.cached_before = true;
                return Result<SessionLease>::Ok(std::move(lease));
            }
            stale = it->second;
            sessions_.erase(it);
        }
    }

    if (stale) {
        sftpflow_log(fmt::format("cache: {} is dead, reconnecting", key));
        end_quietly(*stale, key, "stale");
    }

    if (!factory_) {
        return Result<SessionLease>::Err(ErrorKind::Connect, "no session factory configured");
    }

    std::shared_ptr<RemoteSession> session = factory_();
    if (!session) {
        return Result<SessionLease>::Err(ErrorKind::Connect, "session factory returned nothing");
    }

    if (on_connect) on_connect();
    auto conn = session->connect(identity);
    if (conn.is_err()) {
        end_quietly(*session, key, "connect failed");
        sftpflow_log(fmt::format("cache: connect {} failed: {}", identity.display(), conn.error));
        ErrorKind kind = conn.kind == ErrorKind::None ? ErrorKind::Connect : conn.kind;
        return Result<SessionLease>::Err(kind, conn.error);
    }

    SessionLease lease;
    lease.session = session;
    lease.key = key;
    lease.connected_now = true;

    if (persist) {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[key] = session;
        lease.persisted = true;
    }
    sftpflow_log(fmt::format("cache: connected {} (cached: {})", key, persist ? "yes" : "no"));
    return Result<SessionLease>::Ok(std::move(lease));
}

void ConnectionCache::release(SessionLease& lease) {
    if (!lease.session) return;
    if (!lease.cached_before && !lease.persisted) {
        end_quietly(*lease.session, lease.key, "uncached");
        sftpflow_log(fmt::format("cache: ended uncached session {}", lease.key));
    }
    lease.session.reset();
}

// ── Close ───────────────────────────────────────────────────

bool ConnectionCache::close(const std::string& key) {
    std::shared_ptr<RemoteSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(key);
        if (it == sessions_.end()) return false;
        session = it->second;
        sessions_.erase(it);
    }
    end_quietly(*session, key, "close");
    sftpflow_log(fmt::format("cache: closed {}", key));
    return true;
}

void ConnectionCache::close_all() {
    std::map<std::string, std::shared_ptr<RemoteSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [key, session] : sessions) {
        end_quietly(*session, key, "shutdown");
    }
    if (!sessions.empty()) {
        sftpflow_log(fmt::format("cache: closed {} session(s)", sessions.size()));
    }
}

bool ConnectionCache::is_cached(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(key) > 0;
}

std::vector<std::string> ConnectionCache::cached_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& [key, session] : sessions_) keys.push_back(key);
    return keys;
}
