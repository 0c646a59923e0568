#include "AuthMethods.hpp"

namespace Tuner {

namespace {

// Optional flags never replace the fixed fields of a request.
void mergeOptions(nlohmann::ordered_json& params, const nlohmann::ordered_json& options) {
    for (const auto& [key, value] : options.items()) {
        if (!params.contains(key)) params[key] = value;
    }
}

} // namespace

PartnerTokens PartnerLoginResponse::toPartnerTokens() const {
    return PartnerTokens{partnerId, partnerAuthToken, syncTime};
}

void from_json(const nlohmann::json& j, PartnerLoginResponse& r) {
    j.at("partnerId").get_to(r.partnerId);
    j.at("partnerAuthToken").get_to(r.partnerAuthToken);
    j.at("syncTime").get_to(r.syncTime);
    r.stationSkipUnit = j.value("stationSkipUnit", "");
    r.stationSkipLimit = j.value("stationSkipLimit", 0u);
    if (auto urls = j.find("urls"); urls != j.end() && !urls->is_null()) {
        r.urls = urls->get<std::map<std::string, std::string>>();
    }
}

PartnerLogin& PartnerLogin::option(const std::string& name, nlohmann::ordered_json value) {
    options[name] = std::move(value);
    return *this;
}

ApiCall PartnerLogin::toCall() const {
    nlohmann::ordered_json params = {
        {"username", username},
        {"password", password},
        {"deviceModel", deviceModel},
        {"version", version},
    };
    mergeOptions(params, options);
    return ApiCall{"auth.partnerLogin", std::move(params), false};
}

PartnerLogin toPartnerLogin(const CredentialProfile& profile) {
    PartnerLogin login;
    login.username = std::string(profile.username);
    login.password = std::string(profile.password);
    login.deviceModel = std::string(profile.deviceModel);
    login.version = std::string(profile.version);
    login.includeUrls(false)
         .returnDeviceType(false)
         .returnUpdatePromptVersions(false);
    return login;
}

UserTokens UserLoginResponse::toUserTokens() const {
    return UserTokens{userId, userAuthToken};
}

void from_json(const nlohmann::json& j, UserLoginResponse& r) {
    j.at("userId").get_to(r.userId);
    j.at("userAuthToken").get_to(r.userAuthToken);
    r.username = j.value("username", "");
    r.canListen = j.value("canListen", false);
    r.hasAudioAds = j.value("hasAudioAds", false);
    r.maxStationsAllowed = j.value("maxStationsAllowed", 0u);
    r.minimumAdRefreshInterval = j.value("minimumAdRefreshInterval", 0u);
    r.listeningTimeoutMinutes = j.value("listeningTimeoutMinutes", "");
    r.userProfileUrl = j.value("userProfileUrl", "");
}

UserLogin& UserLogin::option(const std::string& name, nlohmann::ordered_json value) {
    options[name] = std::move(value);
    return *this;
}

ApiCall UserLogin::toCall() const {
    nlohmann::ordered_json params = {
        {"loginType", loginType},
        {"username", username},
        {"password", password},
    };
    mergeOptions(params, options);
    return ApiCall{"auth.userLogin", std::move(params), true};
}

void from_json(const nlohmann::json& j, CheckLicensingResponse& r) {
    j.at("isAllowed").get_to(r.isAllowed);
}

} // namespace Tuner
