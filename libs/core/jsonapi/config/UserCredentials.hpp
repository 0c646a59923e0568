/*
Tuner - UserCredentials
Role: Loads the account holder's login from a JSON file for tools and manual testing.
Inputs/Outputs: Reads {"username", "password", "profile"?}; returns a UserCredentials record.
Threading: Calling thread only.
Related: UserCredentials.cpp, CredentialProfiles.hpp, apps/tuner_login.
Assumptions: The file is owned by the user running the tool; nothing is ever written back.
*/
#pragma once
#include <string>

namespace Tuner {

struct UserCredentials {
    std::string username;
    std::string password;
    std::string profile = "android";
};

/// Throws std::runtime_error on a missing file, malformed JSON, empty fields or an unknown profile.
UserCredentials loadUserCredentials(const std::string& path);

} // namespace Tuner
