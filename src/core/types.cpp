#include "types.hpp"
#include <fmt/format.h>
#include <openssl/evp.h>
#include <stdexcept>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "none";
        case ErrorKind::Connect:          return "connect";
        case ErrorKind::Resolution:       return "resolution";
        case ErrorKind::Operation:        return "operation";
        case ErrorKind::NotFound:         return "not-found";
        case ErrorKind::AlreadyExists:    return "already-exists";
        case ErrorKind::Verification:     return "verification";
        case ErrorKind::UnknownOperation: return "unknown-operation";
        case ErrorKind::QueueFull:        return "queue-full";
    }
    return "unknown";
}

const char* error_category(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "";
        case ErrorKind::Connect:          return "ConnectFailure";
        case ErrorKind::Resolution:       return "ResolutionFailure";
        case ErrorKind::Operation:
        case ErrorKind::NotFound:
        case ErrorKind::AlreadyExists:
        case ErrorKind::QueueFull:        return "OperationFailure";
        case ErrorKind::Verification:     return "VerificationFailure";
        case ErrorKind::UnknownOperation: return "UnknownOperation";
    }
    return "OperationFailure";
}

// Tagged, length-prefixed fields so "ab"+"c" and "a"+"bc" differ
static void add_field(std::string& material, char tag, const std::optional<std::string>& value) {
    if (!value) return;
    material += fmt::format("{}{}:", tag, value->size());
    material += *value;
}

std::string CredentialIdentity::secret_digest() const {
    std::string material;
    add_field(material, 'p', password);
    if (private_key) {
        add_field(material, 'k', private_key->data);
        add_field(material, 'f', private_key->passphrase);
    }
    if (material.empty()) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(material.data(), material.size(), hash, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("sha256 digest failed");
    }

    // first 8 bytes
    std::string hex;
    for (unsigned int i = 0; i < length && i < 8; ++i) {
        hex += fmt::format("{:02x}", hash[i]);
    }
    return hex;
}

std::string CredentialIdentity::cache_key() const {
    std::string digest = secret_digest();
    if (digest.empty()) {
        return fmt::format("{}|{}@{}:{}", name, username, host, port);
    }
    return fmt::format("{}|{}@{}:{}#{}", name, username, host, port, digest);
}

std::string CredentialIdentity::display() const {
    return fmt::format("{}@{}:{}", username, host, port);
}
