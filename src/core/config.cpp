#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

fs::path get_config_dir() {
    return platform::home_dir() / SFTPFLOW_DIR;
}

fs::path get_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# sftpflow configuration

settings:
  # log_file: /tmp/sftpflow_debug.log
  connect_timeout: 30
  queue_limit: 0                   # 0 = unbounded per-session queue

# Named credential identities. Secrets may be left out here and kept in
# ~/.sftpflow/credentials as <name>.password / <name>.keydata / <name>.passphrase
credentials:
  example:
    host: "sftp.example.com"
    port: 22
    username: ""

# Operation nodes: list | get | put | delete | mkdir | rmdir | open | close
nodes:
  example-list:
    operation: list
    workdir: "."
    credentials: example
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

template <typename T>
static std::optional<T> optional_scalar(const YAML::Node& node, const char* key) {
    if (node[key] && node[key].IsScalar()) {
        return node[key].as<T>();
    }
    return std::nullopt;
}

static CredentialConfig parse_credentials(const std::string& name, const YAML::Node& node) {
    CredentialConfig cred;
    cred.name = name;
    cred.host = optional_scalar<std::string>(node, "host");
    cred.port = optional_scalar<int>(node, "port");
    cred.username = optional_scalar<std::string>(node, "username");
    if (!cred.username) cred.username = optional_scalar<std::string>(node, "user");
    cred.password = optional_scalar<std::string>(node, "password");
    cred.key = optional_scalar<std::string>(node, "key");
    cred.passphrase = optional_scalar<std::string>(node, "passphrase");

    // key_file: read the key data once at load time
    if (!cred.key) {
        auto key_file = optional_scalar<std::string>(node, "key_file");
        if (key_file) {
            std::ifstream in(*key_file);
            if (!in) {
                throw std::runtime_error(fmt::format(
                    "credentials '{}': cannot read key_file {}", name, *key_file));
            }
            std::ostringstream ss;
            ss << in.rdbuf();
            cred.key = ss.str();
        }
    }
    return cred;
}

static NodeConfig parse_node(const std::string& name, const YAML::Node& node) {
    NodeConfig n;
    n.name = name;
    n.operation = node["operation"].as<std::string>(DEFAULT_OPERATION);
    n.workdir = node["workdir"].as<std::string>(DEFAULT_WORKDIR);
    if (n.workdir.empty()) n.workdir = DEFAULT_WORKDIR;
    n.filename = node["filename"].as<std::string>("");
    n.credentials = node["credentials"].as<std::string>(node["sftp"].as<std::string>(""));
    n.reuse_session = node["reuse_session"].as<bool>(true);
    n.payload_as_path = node["payload_as_path"].as<bool>(false);
    n.change_directory = node["change_directory"].as<bool>(false);
    return n;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;

        if (root["settings"] && root["settings"].IsMap()) {
            const auto& s = root["settings"];
            config.settings_.log_file = s["log_file"].as<std::string>("");
            config.settings_.connect_timeout = s["connect_timeout"].as<int>(CONNECT_TIMEOUT_SECS);
            int limit = s["queue_limit"].as<int>(0);
            config.settings_.queue_limit = limit > 0 ? static_cast<size_t>(limit) : 0;
        }

        if (root["credentials"] && root["credentials"].IsMap()) {
            for (const auto& kv : root["credentials"]) {
                std::string name = kv.first.as<std::string>();
                config.credentials_[name] = parse_credentials(name, kv.second);
            }
        }

        if (root["nodes"] && root["nodes"].IsMap()) {
            for (const auto& kv : root["nodes"]) {
                std::string name = kv.first.as<std::string>();
                config.nodes_[name] = parse_node(name, kv.second);
            }
        }

        config.validate_nodes();
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config at " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    auto result = parse(ss.str());
    if (result.is_err()) {
        result.error += " (" + path.string() + ")";
    }
    return result;
}

Result<Config> Config::load_default() {
    return load(get_config_path());
}

const CredentialConfig* Config::find_credentials(const std::string& name) const {
    auto it = credentials_.find(name);
    return it == credentials_.end() ? nullptr : &it->second;
}

const NodeConfig* Config::find_node(const std::string& name) const {
    auto it = nodes_.find(name);
    return it == nodes_.end() ? nullptr : &it->second;
}

void Config::add_credentials(CredentialConfig cred) {
    std::string name = cred.name;
    credentials_[name] = std::move(cred);
    validate_nodes();
}

void Config::add_node(NodeConfig node) {
    std::string name = node.name;
    nodes_[name] = std::move(node);
    validate_nodes();
}

void Config::validate_nodes() {
    for (auto& [name, node] : nodes_) {
        if (node.credentials.empty()) {
            node.setup_error = "configuration node missing";
        } else if (!find_credentials(node.credentials)) {
            node.setup_error = fmt::format("configuration node '{}' missing", node.credentials);
        } else {
            node.setup_error.clear();
            continue;
        }
        sftpflow_log(fmt::format("config: node '{}' disabled: {}", name, node.setup_error));
    }
}
