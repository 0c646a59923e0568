#include "UserCredentials.hpp"
#include "jsonapi/profiles/CredentialProfiles.hpp"
#include "Log.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace Tuner {

UserCredentials loadUserCredentials(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("UserCredentials: failed to open credentials file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error(std::string("UserCredentials: failed to parse JSON from credentials file: ") + ex.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("UserCredentials: credentials file must contain a JSON object");
    }

    UserCredentials creds;
    try {
        creds.username = j.value("username", "");
        creds.password = j.value("password", "");
        creds.profile = j.value("profile", creds.profile);
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error(std::string("UserCredentials: ") + ex.what());
    }

    if (creds.username.empty()) {
        throw std::runtime_error("UserCredentials: missing 'username' field in credentials file");
    }
    if (creds.password.empty()) {
        throw std::runtime_error("UserCredentials: missing 'password' field in credentials file");
    }
    if (!findProfile(creds.profile)) {
        throw std::runtime_error("UserCredentials: unknown profile '" + creds.profile + "'");
    }

    LOG_I("config", "loaded credentials for '{}' (profile {}) from {}", creds.username, creds.profile, path);
    return creds;
}

} // namespace Tuner
