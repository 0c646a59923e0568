#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "jsonapi/crypto/BlockCipherCodec.hpp"

/// Golden JSON API response envelopes
namespace ApiResponses {

// android profile key pair
inline constexpr const char* kAndroidEncryptKey = "6#26FRL$ZWD";
inline constexpr const char* kAndroidDecryptKey = "R=U!LH$O2B#";

inline std::string ok(const nlohmann::json& result) {
    return nlohmann::json{{"stat", "ok"}, {"result", result}}.dump();
}

inline std::string okEmpty() {
    return R"({"stat":"ok"})";
}

inline std::string fail(std::uint32_t code, const std::string& message) {
    return nlohmann::json{{"stat", "fail"}, {"code", code}, {"message", message}}.dump();
}

/// syncTime field as the server sends it: 4 salt bytes + decimal seconds, encrypted with the decrypt key.
inline std::string encryptedSyncTime(std::uint64_t serverTime, const char* decryptKey = kAndroidDecryptKey) {
    return Tuner::BlockCipherCodec::encrypt(decryptKey, "abcd" + std::to_string(serverTime));
}

inline nlohmann::json partnerLoginResult(std::uint64_t serverTime = 1477631903) {
    return {
        {"partnerId", "42"},
        {"partnerAuthToken", "VAzrFQTtsy3BQ3K+3iqFi0WF5HA63B1nFA"},
        {"syncTime", encryptedSyncTime(serverTime)},
        {"stationSkipUnit", "hour"},
        {"stationSkipLimit", 6},
    };
}

inline nlohmann::json userLoginResult() {
    return {
        {"userId", "123456789"},
        {"userAuthToken", "XXA+ZOstzpSB1Nmd8AH3xHaXprWWGzCBw4FgQo5XhHV0NGn5SlhK2aQ"},
        {"username", "listener@example.com"},
        {"canListen", true},
        {"hasAudioAds", true},
        {"maxStationsAllowed", 100},
        {"listeningTimeoutMinutes", "180"},
    };
}

} // namespace ApiResponses
