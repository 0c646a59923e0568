/*
Tuner - CredentialProfiles
Role: Static catalog of partner identities (device personas) used to bootstrap a session.
Inputs/Outputs: Looks profiles up by name; beginSession() yields fresh SessionTokens plus the endpoint.
Threading: Catalog is immutable; safe from any thread.
Integration: ApiClient and the login CLI select a profile here; AuthMethods turns one into a partner login.
Related: CredentialProfiles.cpp, SessionTokens.hpp, AuthMethods.hpp.
*/
#pragma once
#include <span>
#include <string_view>
#include "jsonapi/request/Endpoint.hpp"
#include "jsonapi/session/SessionTokens.hpp"

namespace Tuner {

struct CredentialProfile {
    std::string_view name;
    std::string_view username;      // partner login, not the account holder
    std::string_view password;
    std::string_view deviceModel;
    std::string_view version;
    std::string_view encryptKey;
    std::string_view decryptKey;
    std::string_view endpointHost;  // bare host name

    Endpoint endpoint() const { return Endpoint::forHost(std::string(endpointHost)); }
};

struct SessionBootstrap {
    SessionTokens tokens;
    Endpoint endpoint;
};

[[nodiscard]] std::span<const CredentialProfile> allProfiles() noexcept;

/// The android profile.
[[nodiscard]] const CredentialProfile& defaultProfile() noexcept;

/// nullptr when no profile has that name.
[[nodiscard]] const CredentialProfile* findProfile(std::string_view name) noexcept;

/// Key pair and endpoint for a new session. No network I/O.
[[nodiscard]] SessionBootstrap beginSession(const CredentialProfile& profile);

} // namespace Tuner
