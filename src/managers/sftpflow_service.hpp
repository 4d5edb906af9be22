#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <ssh/remote_session.hpp>
#include "connection_cache.hpp"
#include "operation_queue.hpp"
#include "operation_executor.hpp"
#include "status_reporter.hpp"

// Headless service facade: owns the config, credential store, session
// cache, queue and per-node status. Usable by any frontend.
class SftpFlowService {
public:
    SftpFlowService(Config config, CredentialStore store, SessionFactory factory);
    ~SftpFlowService();

    SftpFlowService(const SftpFlowService&) = delete;
    SftpFlowService& operator=(const SftpFlowService&) = delete;

    // ── Requests ──────────────────────────────────────────────

    // Queue one request for a configured node. Errors that happen before
    // queueing (unknown node, node setup error, identity) come back as a
    // ready future.
    std::future<Completion> submit(const std::string& node, const OperationRequest& request);

    // Build the queued form of a request without running it.
    Result<PendingOperation> prepare(const std::string& node, const OperationRequest& request) const;

    // ── Shutdown ──────────────────────────────────────────────

    // Drain every lane, then close all cached sessions. Runs once; concurrent
    // callers wait for it to finish.
    void shutdown();

    // ── State queries ─────────────────────────────────────────

    Status status(const std::string& node) const;
    void set_status_listener(StatusReporter::Listener listener);

    const Config& config() const { return config_; }
    ConnectionCache& cache() { return cache_; }
    std::vector<std::string> node_names() const;

private:
    Config config_;
    CredentialStore store_;
    ConnectionCache cache_;
    OperationQueue queue_;
    OperationExecutor executor_;

    mutable std::mutex reporters_mutex_;
    std::map<std::string, std::unique_ptr<StatusReporter>> reporters_;
    StatusReporter::Listener listener_;
    std::once_flag shutdown_once_;

    StatusReporter& reporter(const std::string& node);
};
