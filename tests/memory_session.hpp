#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <ssh/remote_session.hpp>

// Shared state of a fake SFTP server. Sessions created by factory() all see
// the same filesystem, so tests can inspect it after a session has ended.
struct MemoryRemote {
    std::mutex mutex;
    std::map<std::string, std::string> files;     // absolute path -> content
    std::set<std::string> dirs{"/", "/home", "/home/user"};
    std::string home = "/home/user";

    // Failure injection
    bool fail_connect = false;
    std::optional<std::string> accepted_password; // set: reject any other password
    bool fail_end = false;
    bool fail_stat = false;
    size_t truncate_uploads = 0;                  // bytes dropped from every put
    std::map<std::string, ErrorKind> fail_ops;    // "list" -> kind
    int op_delay_ms = 0;

    // Counters
    std::atomic<int> connect_attempts{0};
    std::atomic<int> connects{0};
    std::atomic<int> ends{0};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::vector<std::string> calls;               // "put /home/user/a.txt"

    void add_file(const std::string& abs_path, const std::string& content);
    void add_dir(const std::string& abs_path);
    bool has_file(const std::string& abs_path);
    bool has_dir(const std::string& abs_path);
    std::string content(const std::string& abs_path);
    std::vector<std::string> call_log();
};

// Factory producing MemorySessions over one shared remote
SessionFactory memory_factory(std::shared_ptr<MemoryRemote> remote);

class MemorySession : public RemoteSession {
public:
    explicit MemorySession(std::shared_ptr<MemoryRemote> remote);

    Result<void> connect(const CredentialIdentity& identity) override;
    bool is_alive() override;

    Result<std::string> current_directory() override;
    Result<void> change_directory(const std::string& path) override;

    Result<std::vector<RemoteEntry>> list(const std::string& path) override;
    Result<std::string> get(const std::string& path) override;
    Result<void> put(const UploadSource& source, const std::string& path,
                     const PutOptions& options) override;
    Result<void> remove(const std::string& path) override;
    Result<void> mkdir(const std::string& path, bool recursive) override;
    Result<void> rmdir(const std::string& path, bool recursive) override;
    Result<RemoteEntry> stat(const std::string& path) override;

    Result<void> end() override;

    // Simulate the server dropping the connection
    void kill() { alive_ = false; }

private:
    std::shared_ptr<MemoryRemote> remote_;
    bool connected_ = false;
    bool alive_ = false;
    std::string cwd_;

    std::string absolute(const std::string& path) const;
    Result<void> enter(const std::string& op, const std::string& path);
    void leave();
};
