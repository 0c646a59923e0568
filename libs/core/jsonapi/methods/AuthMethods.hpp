/*
Tuner - AuthMethods
Role: The calls that drive the two-phase handshake (auth.partnerLogin, auth.userLogin) and the licensing probe.
Inputs/Outputs: Each request produces an ApiCall via toCall(); its nested Response decodes with from_json.
Integration: ApiClient::partnerLogin()/userLogin() send these and merge the tokens they return.
Related: AuthMethods.cpp, ApiClient.hpp, CredentialProfiles.hpp.
*/
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "jsonapi/profiles/CredentialProfiles.hpp"
#include "jsonapi/request/ApiCall.hpp"
#include "jsonapi/session/SessionTokens.hpp"

namespace Tuner {

// ── auth.partnerLogin ─────────────────────────────────────────

struct PartnerLoginResponse {
    std::string partnerId;
    std::string partnerAuthToken;
    std::string syncTime;               // hex ciphertext; SessionTokens decrypts it
    std::string stationSkipUnit;
    std::uint32_t stationSkipLimit = 0;
    std::optional<std::map<std::string, std::string>> urls;

    PartnerTokens toPartnerTokens() const;
};

void from_json(const nlohmann::json& j, PartnerLoginResponse& r);

/// Sent in clear text; also validates the protocol version and yields the server time.
struct PartnerLogin {
    using Response = PartnerLoginResponse;

    std::string username;
    std::string password;
    std::string deviceModel;
    std::string version = "5";
    nlohmann::ordered_json options = nlohmann::ordered_json::object();

    PartnerLogin& option(const std::string& name, nlohmann::ordered_json value);
    PartnerLogin& includeUrls(bool value) { return option("includeUrls", value); }
    PartnerLogin& returnDeviceType(bool value) { return option("returnDeviceType", value); }
    PartnerLogin& returnUpdatePromptVersions(bool value) { return option("returnUpdatePromptVersions", value); }

    ApiCall toCall() const;
};

/// Partner login for a catalog profile, with all optional flags off.
PartnerLogin toPartnerLogin(const CredentialProfile& profile);

// ── auth.userLogin ────────────────────────────────────────────

struct UserLoginResponse {
    std::string userId;
    std::string userAuthToken;
    std::string username;
    bool canListen = false;
    bool hasAudioAds = false;
    std::uint32_t maxStationsAllowed = 0;
    std::uint32_t minimumAdRefreshInterval = 0;
    std::string listeningTimeoutMinutes;
    std::string userProfileUrl;

    UserTokens toUserTokens() const;
};

void from_json(const nlohmann::json& j, UserLoginResponse& r);

/// Encrypted; needs an active partner session.
struct UserLogin {
    using Response = UserLoginResponse;

    std::string loginType = "user";
    std::string username;
    std::string password;
    nlohmann::ordered_json options = nlohmann::ordered_json::object();

    UserLogin(std::string user, std::string pass)
        : username(std::move(user)), password(std::move(pass)) {}

    UserLogin& option(const std::string& name, nlohmann::ordered_json value);
    UserLogin& returnStationList(bool value) { return option("returnStationList", value); }
    UserLogin& returnGenreStations(bool value) { return option("returnGenreStations", value); }
    UserLogin& returnIsSubscriber(bool value) { return option("returnIsSubscriber", value); }
    UserLogin& includePandoraOneInfo(bool value) { return option("includePandoraOneInfo", value); }
    UserLogin& includeSubscriptionExpiration(bool value) { return option("includeSubscriptionExpiration", value); }
    UserLogin& includeStationArtUrl(bool value) { return option("includeStationArtUrl", value); }
    UserLogin& stationArtSize(const std::string& value) { return option("stationArtSize", value); }

    ApiCall toCall() const;
};

// ── test.checkLicensing ───────────────────────────────────────

struct CheckLicensingResponse {
    bool isAllowed = false;
};

void from_json(const nlohmann::json& j, CheckLicensingResponse& r);

/// Geo-IP availability check. Needs no session at all.
struct CheckLicensing {
    using Response = CheckLicensingResponse;

    ApiCall toCall() const { return ApiCall{"test.checkLicensing", nlohmann::ordered_json::object(), false}; }
};

} // namespace Tuner
