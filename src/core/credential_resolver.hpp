#pragma once

#include "types.hpp"
#include "config.hpp"
#include "credentials.hpp"

// Build the identity for one request. Each field comes from the request
// when set, else the credential config node, else the credential store
// (<name>.username / .password / .keydata / .passphrase).
// host defaults to localhost and port to 22.
Result<CredentialIdentity> resolve_identity(const CredentialConfig& config,
                                            const OperationRequest& request,
                                            const CredentialStore& store);
