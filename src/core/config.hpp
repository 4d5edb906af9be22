#pragma once

#include <string>
#include <optional>
#include <map>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Connection settings for one named credential identity.
struct CredentialConfig {
    std::string name;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> key;          // inline private key data
    std::optional<std::string> passphrase;
};

// One configured operation endpoint ("node").
struct NodeConfig {
    std::string name;
    std::string operation = "list";
    std::string workdir = ".";
    std::string filename;
    std::string credentials;                 // name of a CredentialConfig
    bool reuse_session = true;               // keep the session cached after use
    bool payload_as_path = false;            // string payload overrides the target path
    bool change_directory = false;           // put: cd into the target dir instead of joining
    std::string setup_error;                 // non-empty: node refuses requests
};

struct Settings {
    std::string log_file;                    // empty: default debug log
    int connect_timeout = 30;
    size_t queue_limit = 0;                  // 0 = unbounded
};

class Config {
public:
    // Load ~/.sftpflow/config.yaml
    static Result<Config> load_default();

    // Load from an explicit path
    static Result<Config> load(const fs::path& path);

    // Parse YAML text (used by load and by tests)
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const Settings& settings() const { return settings_; }
    const std::map<std::string, CredentialConfig>& credentials() const { return credentials_; }
    const std::map<std::string, NodeConfig>& nodes() const { return nodes_; }

    const CredentialConfig* find_credentials(const std::string& name) const;
    const NodeConfig* find_node(const std::string& name) const;

    // Programmatic setup (CLI one-offs and tests)
    void add_credentials(CredentialConfig cred);
    void add_node(NodeConfig node);

public:
    Config() = default;

private:
    Settings settings_;
    std::map<std::string, CredentialConfig> credentials_;
    std::map<std::string, NodeConfig> nodes_;

    // Mark nodes whose credential reference cannot be resolved.
    void validate_nodes();
};

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Create a commented default config if none exists
Result<void> create_default_config();
