#pragma once

#include <string>
#include <map>
#include <filesystem>
#include "types.hpp"

// Read-only credential store: key=value lines in ~/.sftpflow/credentials.
// Keys are "<credential name>.<field>" with fields username, password,
// keydata and passphrase. sftpflow never writes this file.
class CredentialStore {
public:
    CredentialStore();
    explicit CredentialStore(std::filesystem::path path);

    // Get credential by key
    Result<std::string> get(const std::string& key) const;

    // Get "<name>.<field>"
    Result<std::string> get(const std::string& name, const std::string& field) const;

private:
    std::filesystem::path path_;
    std::map<std::string, std::string> values_;
};
