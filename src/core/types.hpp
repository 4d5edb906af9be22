#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <memory>
#include <variant>
#include <functional>
#include <istream>
#include <cstdint>

// Failure classes carried by Result. NotFound and AlreadyExists are
// refinements of Operation reported by the remote side.
enum class ErrorKind {
    None,
    Connect,            // transport unreachable or auth rejected
    Resolution,         // missing identity / unresolvable path
    Operation,          // remote call rejected
    NotFound,
    AlreadyExists,
    Verification,       // post-upload size mismatch
    UnknownOperation,
    QueueFull,
};

const char* error_kind_name(ErrorKind kind);

// Coarse category used in user-facing messages ("OperationFailure", ...).
const char* error_category(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::Operation};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::Operation};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Re-type an error result, keeping message and kind.
template <typename T, typename U>
Result<T> propagate(const Result<U>& r) {
    return Result<T>::Err(r.kind, r.error);
}

// ── Remote data ─────────────────────────────────────────────

enum class EntryType { File, Directory, Symlink, Other };

struct RemoteEntry {
    std::string name;         // base name
    EntryType type = EntryType::File;
    int64_t size = 0;
    int64_t mtime = 0;        // epoch seconds
    uint32_t mode = 0;        // POSIX bits
};

using Bytes = std::vector<uint8_t>;

// ── Credentials ─────────────────────────────────────────────

struct PrivateKey {
    std::string data;                     // PEM/OpenSSH key text
    std::optional<std::string> passphrase;
};

struct CredentialIdentity {
    std::string name;                     // credential config node
    std::string host = "localhost";
    int port = 22;
    std::string username;
    std::optional<std::string> password;
    std::optional<PrivateKey> private_key;

    // Cache entry / queue lane key: name|user@host:port, plus #<digest>
    // when a secret is set. The secret itself never appears in the key.
    std::string cache_key() const;
    std::string secret_digest() const;    // truncated sha256 hex, "" without a secret
    std::string display() const;          // user@host:port
};

// ── Request payloads ────────────────────────────────────────

struct StreamSource {
    std::shared_ptr<std::istream> stream;
};

// Old-style upload message carrying its own target name.
struct LegacyUpload {
    std::string filename;
    std::variant<std::string, Bytes> data;
};

using Payload = std::variant<std::monostate, std::string, Bytes, StreamSource, LegacyUpload>;

struct OperationRequest {
    std::optional<std::string> operation;
    std::optional<std::string> workdir;
    std::optional<std::string> filename;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> user;
    std::optional<std::string> password;
    std::optional<std::string> key;
    std::optional<bool> reuse_session;
    std::optional<bool> payload_as_path;
    std::optional<bool> change_directory;
    Payload payload;
};

// ── Operation results ───────────────────────────────────────

struct Listing {
    std::vector<RemoteEntry> entries;
};

struct FileContent {
    std::string path;
    std::string data;
};

struct TransferOutcome {
    bool ok = false;
    std::string path;
    int64_t size = -1;        // -1 when the remote size could not be read
};

struct Deleted {
    std::string name;
    std::string path;
};

struct DirectoryCreated {
    std::string path;
};

struct DirectoryRemoved {
    std::string path;
};

struct SessionOpened {
    std::string identity;
};

struct SessionClosed {
    bool closed = true;
};

using OperationResult = std::variant<Listing, FileContent, TransferOutcome, Deleted,
                                     DirectoryCreated, DirectoryRemoved,
                                     SessionOpened, SessionClosed>;

// Terminal completion signal: success with payload, or error descriptor.
using Completion = Result<OperationResult>;

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
