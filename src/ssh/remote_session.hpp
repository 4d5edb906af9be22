#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <transfer/upload_source.hpp>

struct PutOptions {
    int concurrency = PUT_DEFAULT_CONCURRENCY;
    bool reject_on_error = true;
};

// Remote file-transfer capability. Concrete transports (libssh2, or an
// in-memory filesystem in tests) implement this; the managers only talk to
// this interface. One instance is one authenticated connection and is not
// thread-safe: callers serialize access through OperationQueue.
//
// Relative paths resolve against current_directory().
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Connect and authenticate. ErrorKind::Connect on failure.
    virtual Result<void> connect(const CredentialIdentity& identity) = 0;

    // Whether a cached instance may be handed out again.
    virtual bool is_alive() = 0;

    virtual Result<std::string> current_directory() = 0;
    virtual Result<void> change_directory(const std::string& path) = 0;

    virtual Result<std::vector<RemoteEntry>> list(const std::string& path) = 0;
    virtual Result<std::string> get(const std::string& path) = 0;
    virtual Result<void> put(const UploadSource& source, const std::string& path,
                             const PutOptions& options) = 0;
    virtual Result<void> remove(const std::string& path) = 0;
    virtual Result<void> mkdir(const std::string& path, bool recursive) = 0;
    virtual Result<void> rmdir(const std::string& path, bool recursive) = 0;
    virtual Result<RemoteEntry> stat(const std::string& path) = 0;

    // Close the connection. Idempotent.
    virtual Result<void> end() = 0;
};

using SessionFactory = std::function<std::unique_ptr<RemoteSession>()>;
