#include "credentials.hpp"

Result<std::string> CredentialStore::get(const std::string& name, const std::string& field) const {
    return get(name + "." + field);
}
