#include "../credentials.hpp"
#include "../constants.hpp"
#include "../log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

// Credentials stored as simple key=value lines in ~/.sftpflow/credentials.
// The file should be chmod 600.

static fs::path default_creds_path() {
    return platform::home_dir() / SFTPFLOW_DIR / CREDENTIALS_FILE;
}

// Read all key=value pairs from the credentials file
static std::map<std::string, std::string> read_all(const fs::path& path) {
    std::map<std::string, std::string> m;
    std::ifstream f(path);
    if (!f) return m;

    struct stat st;
    if (::stat(path.c_str(), &st) == 0 && (st.st_mode & 0077) != 0) {
        sftpflow_log(fmt::format("credentials: {} is readable by others (chmod 600)", path.string()));
    }

    std::string line;
    while (std::getline(f, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            m[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return m;
}

CredentialStore::CredentialStore()
    : CredentialStore(default_creds_path()) {}

CredentialStore::CredentialStore(fs::path path)
    : path_(std::move(path)), values_(read_all(path_)) {}

Result<std::string> CredentialStore::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return Result<std::string>::Err(ErrorKind::Resolution, "Credential not found: " + key);
    }
    return Result<std::string>::Ok(it->second);
}
