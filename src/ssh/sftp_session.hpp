#pragma once

#include <string>
#include <vector>
#include "remote_session.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// RemoteSession over libssh2: TCP socket, SSH session and one SFTP channel.
// Blocking mode with a session timeout; the working directory is tracked
// client-side because SFTP has no server-side cwd.
class SftpSession : public RemoteSession {
public:
    explicit SftpSession(int connect_timeout_secs = 30);
    ~SftpSession() override;

    SftpSession(const SftpSession&) = delete;
    SftpSession& operator=(const SftpSession&) = delete;

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

    // Default factory for SftpFlowService.
    static SessionFactory factory(int connect_timeout_secs);

private:
    int connect_timeout_secs_;
    int sock_ = -1;
    LIBSSH2_SESSION* session_ = nullptr;
    LIBSSH2_SFTP* sftp_ = nullptr;
    bool active_ = false;
    std::string cwd_;
    std::string target_str_;

    Result<void> authenticate(const CredentialIdentity& identity);
    void teardown(const char* reason);

    // Absolute remote path for a cwd-relative one.
    std::string absolute(const std::string& path) const;

    // Map the last libssh2/SFTP error to a Result error.
    template <typename T>
    Result<T> sftp_error(const std::string& what, const std::string& path);

    Result<void> write_stream(std::istream& in, const std::string& path, const PutOptions& options);
    Result<void> mkdir_one(const std::string& abs_path);
    Result<void> rmdir_tree(const std::string& abs_path);
};
