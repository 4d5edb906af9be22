#include "sftp_session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <transfer/path_resolver.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <cstring>
#include <fstream>
#include <mutex>
#include <sstream>

// Global libssh2 initialization (once per process)
static Result<void> init_libssh2() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    if (rc != 0) return Result<void>::Err(ErrorKind::Connect, "Failed to initialize libssh2");
    return Result<void>::Ok();
}

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round = 0;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    auto* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

static EntryType entry_type(const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    if (!(attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)) return EntryType::File;
    if (LIBSSH2_SFTP_S_ISDIR(attrs.permissions)) return EntryType::Directory;
    if (LIBSSH2_SFTP_S_ISLNK(attrs.permissions)) return EntryType::Symlink;
    if (LIBSSH2_SFTP_S_ISREG(attrs.permissions)) return EntryType::File;
    return EntryType::Other;
}

static RemoteEntry to_entry(const std::string& name, const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    RemoteEntry e;
    e.name = name;
    e.type = entry_type(attrs);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) e.size = static_cast<int64_t>(attrs.filesize);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) e.mtime = static_cast<int64_t>(attrs.mtime);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) e.mode = static_cast<uint32_t>(attrs.permissions);
    return e;
}

// ── Lifecycle ──────────────────────────────────────────────────

SftpSession::SftpSession(int connect_timeout_secs)
    : connect_timeout_secs_(connect_timeout_secs) {}

SftpSession::~SftpSession() {
    teardown("Normal disconnection");
}

SessionFactory SftpSession::factory(int connect_timeout_secs) {
    return [connect_timeout_secs]() -> std::unique_ptr<RemoteSession> {
        return std::make_unique<SftpSession>(connect_timeout_secs);
    };
}

Result<void> SftpSession::connect(const CredentialIdentity& identity) {
    if (active_) return Result<void>::Ok();

    auto init = init_libssh2();
    if (init.is_err()) return init;

    target_str_ = identity.display();
    sftpflow_log(fmt::format("sftp: connecting to {}", target_str_));

    std::string err;
    sock_ = platform::connect_tcp(identity.host, identity.port,
                                  connect_timeout_secs_ * 1000, err);
    if (sock_ < 0) {
        return Result<void>::Err(ErrorKind::Connect, err);
    }
    platform::enable_keepalive(sock_);

    session_ = libssh2_session_init();
    if (!session_) {
        teardown("init failed");
        return Result<void>::Err(ErrorKind::Connect, "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(connect_timeout_secs_) * 1000);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        teardown("Handshake failed");
        return Result<void>::Err(ErrorKind::Connect,
            fmt::format("SSH handshake with {} failed", identity.host));
    }

    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    auto auth = authenticate(identity);
    if (auth.is_err()) {
        teardown("Authentication failed");
        return auth;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        teardown("SFTP init failed");
        return Result<void>::Err(ErrorKind::Connect, "Failed to start SFTP subsystem");
    }

    // Login directory becomes the initial cwd
    char buf[1024];
    int n = libssh2_sftp_realpath(sftp_, ".", buf, sizeof(buf) - 1);
    cwd_ = n > 0 ? std::string(buf, static_cast<size_t>(n)) : "/";

    active_ = true;
    sftpflow_log(fmt::format("sftp: connected to {} (cwd {})", target_str_, cwd_));
    return Result<void>::Ok();
}

Result<void> SftpSession::authenticate(const CredentialIdentity& identity) {
    const std::string& user = identity.username;

    char* auth_list = libssh2_userauth_list(session_, user.c_str(),
                                            static_cast<unsigned int>(user.length()));
    if (!auth_list && libssh2_userauth_authenticated(session_)) {
        return Result<void>::Ok();   // "none" auth accepted
    }
    std::string methods = auth_list ? auth_list : "";
    sftpflow_log(fmt::format("sftp: auth methods for {}: {}", target_str_, methods));

    if (identity.private_key && methods.find("publickey") != std::string::npos) {
        const auto& key = *identity.private_key;
        const char* passphrase = key.passphrase ? key.passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_frommemory(
            session_, user.c_str(), user.length(),
            nullptr, 0,
            key.data.c_str(), key.data.length(),
            passphrase);
        if (rc == 0) return Result<void>::Ok();
        sftpflow_log(fmt::format("sftp: publickey auth failed for {} (rc={})", target_str_, rc));
    }

    if (identity.password) {
        if (methods.empty() || methods.find("password") != std::string::npos) {
            int rc = libssh2_userauth_password(session_, user.c_str(), identity.password->c_str());
            if (rc == 0) return Result<void>::Ok();
        }

        if (methods.find("keyboard-interactive") != std::string::npos) {
            KbdAuthData kbd_data;
            kbd_data.password = *identity.password;
            *libssh2_session_abstract(session_) = &kbd_data;
            int rc = libssh2_userauth_keyboard_interactive(session_, user.c_str(), kbd_callback);
            *libssh2_session_abstract(session_) = nullptr;
            if (rc == 0) return Result<void>::Ok();
        }
    }

    if (!identity.password && !identity.private_key) {
        return Result<void>::Err(ErrorKind::Connect,
            fmt::format("No password or private key for {}", target_str_));
    }
    return Result<void>::Err(ErrorKind::Connect,
        fmt::format("Authentication failed for {}", target_str_));
}

void SftpSession::teardown(const char* reason) {
    active_ = false;
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

Result<void> SftpSession::end() {
    if (session_ || sock_ >= 0) {
        sftpflow_log(fmt::format("sftp: closing {}", target_str_));
    }
    teardown("Normal disconnection");
    return Result<void>::Ok();
}

bool SftpSession::is_alive() {
    if (!active_ || !session_ || sock_ < 0) return false;

    int seconds_to_next = 0;
    if (libssh2_keepalive_send(session_, &seconds_to_next) != 0) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }
    return true;
}

// ── Helpers ────────────────────────────────────────────────────

std::string SftpSession::absolute(const std::string& path) const {
    if (!path.empty() && path[0] == '/') return path_resolver::normalize(path);
    return path_resolver::posix_join(cwd_, path.empty() ? "." : path);
}

template <typename T>
Result<T> SftpSession::sftp_error(const std::string& what, const std::string& path) {
    int last = session_ ? libssh2_session_last_errno(session_) : 0;
    if (last == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        unsigned long code = libssh2_sftp_last_error(sftp_);
        switch (code) {
            case LIBSSH2_FX_NO_SUCH_FILE:
            case LIBSSH2_FX_NO_SUCH_PATH:
                return Result<T>::Err(ErrorKind::NotFound,
                    fmt::format("{} {}: no such file", what, path));
            case LIBSSH2_FX_FILE_ALREADY_EXISTS:
                return Result<T>::Err(ErrorKind::AlreadyExists,
                    fmt::format("{} {}: already exists", what, path));
            case LIBSSH2_FX_PERMISSION_DENIED:
                return Result<T>::Err(ErrorKind::Operation,
                    fmt::format("{} {}: permission denied", what, path));
            default:
                return Result<T>::Err(ErrorKind::Operation,
                    fmt::format("{} {}: sftp status {}", what, path, code));
        }
    }

    char* msg = nullptr;
    int msg_len = 0;
    if (session_) libssh2_session_last_error(session_, &msg, &msg_len, 0);
    std::string detail = (msg && msg_len > 0) ? std::string(msg, static_cast<size_t>(msg_len)) : "unknown error";
    if (last == LIBSSH2_ERROR_SOCKET_DISCONNECT || last == LIBSSH2_ERROR_SOCKET_SEND ||
        last == LIBSSH2_ERROR_SOCKET_RECV || last == LIBSSH2_ERROR_TIMEOUT) {
        active_ = false;
    }
    return Result<T>::Err(ErrorKind::Operation, fmt::format("{} {}: {}", what, path, detail));
}

// ── Directory state ────────────────────────────────────────────

Result<std::string> SftpSession::current_directory() {
    if (!active_) return Result<std::string>::Err("Not connected");
    return Result<std::string>::Ok(cwd_);
}

Result<void> SftpSession::change_directory(const std::string& path) {
    auto st = stat(path);
    if (st.is_err()) return propagate<void>(st);
    if (st.value.type != EntryType::Directory) {
        return Result<void>::Err(ErrorKind::Operation, path + " is not a directory");
    }
    cwd_ = absolute(path);
    return Result<void>::Ok();
}

// ── File operations ────────────────────────────────────────────

Result<std::vector<RemoteEntry>> SftpSession::list(const std::string& path) {
    if (!active_) return Result<std::vector<RemoteEntry>>::Err("Not connected");
    std::string abs = absolute(path);

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, abs.c_str());
    if (!dir) return sftp_error<std::vector<RemoteEntry>>("list", path);

    std::vector<RemoteEntry> out;
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    for (;;) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            std::string name(filename, static_cast<size_t>(rc));
            if (name == "." || name == "..") continue;
            out.push_back(to_entry(name, attrs));
        } else if (rc == 0) {
            break;
        } else {
            libssh2_sftp_closedir(dir);
            return sftp_error<std::vector<RemoteEntry>>("list", path);
        }
    }

    libssh2_sftp_closedir(dir);
    return Result<std::vector<RemoteEntry>>::Ok(std::move(out));
}

Result<std::string> SftpSession::get(const std::string& path) {
    if (!active_) return Result<std::string>::Err("Not connected");
    std::string abs = absolute(path);

    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open(sftp_, abs.c_str(), LIBSSH2_FXF_READ, 0);
    if (!fh) return sftp_error<std::string>("get", path);

    std::string content;
    std::vector<char> buf(SFTP_CHUNK_SIZE);
    for (;;) {
        ssize_t n = libssh2_sftp_read(fh, buf.data(), buf.size());
        if (n > 0) {
            content.append(buf.data(), static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else {
            libssh2_sftp_close(fh);
            return sftp_error<std::string>("get", path);
        }
    }
    libssh2_sftp_close(fh);
    return Result<std::string>::Ok(std::move(content));
}

Result<void> SftpSession::write_stream(std::istream& in, const std::string& path,
                                       const PutOptions& options) {
    std::string abs = absolute(path);
    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open(
        sftp_, abs.c_str(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        FILE_CREATE_MODE);
    if (!fh) return sftp_error<void>("put", path);

    // libssh2 pipelines writes internally; options.concurrency has no knob here.
    std::vector<char> buf(SFTP_CHUNK_SIZE);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) break;

        const char* p = buf.data();
        size_t left = static_cast<size_t>(got);
        while (left > 0) {
            ssize_t w = libssh2_sftp_write(fh, p, left);
            if (w < 0) {
                auto err = sftp_error<void>("put", path);
                libssh2_sftp_close(fh);
                if (options.reject_on_error) return err;
                sftpflow_log("sftp: write error ignored: " + err.error);
                return Result<void>::Ok();
            }
            p += w;
            left -= static_cast<size_t>(w);
        }
    }

    if (in.bad()) {
        libssh2_sftp_close(fh);
        return Result<void>::Err(ErrorKind::Operation, "put " + path + ": error reading upload source");
    }

    libssh2_sftp_close(fh);
    return Result<void>::Ok();
}

Result<void> SftpSession::put(const UploadSource& source, const std::string& path,
                              const PutOptions& options) {
    if (!active_) return Result<void>::Err("Not connected");

    if (const auto* buffer = std::get_if<BufferSource>(&source)) {
        std::istringstream in(buffer->data);
        return write_stream(in, path, options);
    }
    if (const auto* file = std::get_if<LocalFileSource>(&source)) {
        std::ifstream in(file->path, std::ios::binary);
        if (!in) {
            return Result<void>::Err(ErrorKind::Operation, "cannot open local file " + file->path);
        }
        return write_stream(in, path, options);
    }
    const auto& stream = std::get<StreamSource>(source);
    if (!stream.stream) return Result<void>::Err(ErrorKind::Operation, "put " + path + ": no stream");
    return write_stream(*stream.stream, path, options);
}

Result<void> SftpSession::remove(const std::string& path) {
    if (!active_) return Result<void>::Err("Not connected");
    std::string abs = absolute(path);
    if (libssh2_sftp_unlink(sftp_, abs.c_str()) != 0) return sftp_error<void>("delete", path);
    return Result<void>::Ok();
}

Result<void> SftpSession::mkdir_one(const std::string& abs_path) {
    if (libssh2_sftp_mkdir(sftp_, abs_path.c_str(), DIR_CREATE_MODE) == 0) {
        return Result<void>::Ok();
    }
    auto err = sftp_error<void>("mkdir", abs_path);
    if (err.kind == ErrorKind::Operation) {
        // Many servers answer SSH_FX_FAILURE for an existing directory
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        if (libssh2_sftp_stat(sftp_, abs_path.c_str(), &attrs) == 0 &&
            entry_type(attrs) == EntryType::Directory) {
            return Result<void>::Err(ErrorKind::AlreadyExists, "mkdir " + abs_path + ": already exists");
        }
    }
    return err;
}

Result<void> SftpSession::mkdir(const std::string& path, bool recursive) {
    if (!active_) return Result<void>::Err("Not connected");
    std::string abs = absolute(path);
    if (!recursive) return mkdir_one(abs);

    // Create each missing component; existing ones are fine
    std::string prefix;
    std::stringstream ss(abs);
    std::string part;
    Result<void> last = Result<void>::Ok();
    bool created_any = false;
    while (std::getline(ss, part, '/')) {
        if (part.empty()) continue;
        prefix += "/" + part;
        last = mkdir_one(prefix);
        if (last.is_ok()) {
            created_any = true;
        } else if (last.kind != ErrorKind::AlreadyExists) {
            return last;
        }
    }
    if (!created_any) {
        return Result<void>::Err(ErrorKind::AlreadyExists, "mkdir " + path + ": already exists");
    }
    return Result<void>::Ok();
}

Result<void> SftpSession::rmdir_tree(const std::string& abs_path) {
    auto entries = list(abs_path);
    if (entries.is_err()) return propagate<void>(entries);

    for (const auto& e : entries.value) {
        std::string child = abs_path + "/" + e.name;
        Result<void> r = (e.type == EntryType::Directory) ? rmdir_tree(child) : remove(child);
        if (r.is_err()) return r;
    }
    if (libssh2_sftp_rmdir(sftp_, abs_path.c_str()) != 0) return sftp_error<void>("rmdir", abs_path);
    return Result<void>::Ok();
}

Result<void> SftpSession::rmdir(const std::string& path, bool recursive) {
    if (!active_) return Result<void>::Err("Not connected");
    std::string abs = absolute(path);
    if (recursive) return rmdir_tree(abs);
    if (libssh2_sftp_rmdir(sftp_, abs.c_str()) != 0) return sftp_error<void>("rmdir", path);
    return Result<void>::Ok();
}

Result<RemoteEntry> SftpSession::stat(const std::string& path) {
    if (!active_) return Result<RemoteEntry>::Err("Not connected");
    std::string abs = absolute(path);

    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    if (libssh2_sftp_stat(sftp_, abs.c_str(), &attrs) != 0) {
        return sftp_error<RemoteEntry>("stat", path);
    }
    return Result<RemoteEntry>::Ok(to_entry(path_resolver::base_name(abs), attrs));
}
