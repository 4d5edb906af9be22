#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>
#include "connection_cache.hpp"
#include "status_reporter.hpp"

enum class OperationKind { List, Get, Put, Delete, Mkdir, Rmdir, Open, Close };

std::optional<OperationKind> parse_operation(const std::string& name);
const char* operation_name(OperationKind kind);

// Everything one queued job needs, resolved when it was submitted.
struct PendingOperation {
    std::string node;
    std::string operation;
    std::string workdir;
    std::string filename;
    Payload payload;
    CredentialIdentity identity;
    std::string key;              // cache entry / queue lane
    bool reuse_session = true;
    bool payload_as_path = false;
    bool change_directory = false;
};

// Runs one PendingOperation against a session from the cache:
// resolve paths, connect or reuse, dispatch, verify uploads, release.
// Must be called from the operation's queue lane.
class OperationExecutor {
public:
    explicit OperationExecutor(ConnectionCache& cache);

    Completion execute(const PendingOperation& op, StatusReporter& status);

private:
    ConnectionCache& cache_;

    // Target paths computed before any connection is made
    struct Target {
        std::string directory;    // list / mkdir / rmdir
        std::string file;         // get / put / delete
        std::string filename;
    };

    Result<Target> resolve_target(OperationKind kind, const PendingOperation& op) const;

    Completion dispatch(OperationKind kind, const PendingOperation& op,
                        const Target& target, RemoteSession& session);

    Completion run_put(const PendingOperation& op, const Target& target, RemoteSession& session);
    void ensure_parent(RemoteSession& session, const std::string& path);
};
