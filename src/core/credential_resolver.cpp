#include "credential_resolver.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <fmt/format.h>

static std::optional<std::string> from_store(const CredentialStore& store,
                                             const std::string& name,
                                             const char* field) {
    auto r = store.get(name, field);
    if (r.is_ok()) return r.value;
    return std::nullopt;
}

template <typename T>
static std::optional<T> first_of(const std::optional<T>& a, const std::optional<T>& b) {
    return a ? a : b;
}

Result<CredentialIdentity> resolve_identity(const CredentialConfig& config,
                                            const OperationRequest& request,
                                            const CredentialStore& store) {
    CredentialIdentity id;
    id.name = config.name;
    id.host = first_of(request.host, config.host).value_or(DEFAULT_HOST);
    if (id.host.empty()) id.host = DEFAULT_HOST;
    id.port = first_of(request.port, config.port).value_or(DEFAULT_PORT);
    if (id.port <= 0 || id.port > 65535) {
        return Result<CredentialIdentity>::Err(ErrorKind::Resolution,
            fmt::format("invalid port {} for {}", id.port, config.name));
    }

    auto user = first_of(request.user, config.username);
    if (!user) user = from_store(store, config.name, "username");
    id.username = user.value_or("");

    id.password = first_of(request.password, config.password);
    if (!id.password) id.password = from_store(store, config.name, "password");

    auto key = first_of(request.key, config.key);
    if (!key) key = from_store(store, config.name, "keydata");
    if (key && !key->empty()) {
        PrivateKey pk;
        pk.data = *key;
        pk.passphrase = config.passphrase;
        if (!pk.passphrase) pk.passphrase = from_store(store, config.name, "passphrase");
        id.private_key = std::move(pk);
    }

    if (id.username.empty()) {
        return Result<CredentialIdentity>::Err(ErrorKind::Resolution,
            fmt::format("no username for credentials '{}'", config.name));
    }

    sftpflow_log(fmt::format("identity {}: {} (password: {}, key: {})",
                             config.name, id.display(),
                             id.password ? "yes" : "no",
                             id.private_key ? "yes" : "no"));
    return Result<CredentialIdentity>::Ok(std::move(id));
}
