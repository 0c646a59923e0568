#include "CredentialProfiles.hpp"
#include "Log.hpp"

#include <array>

namespace Tuner {

namespace {

constexpr std::array<CredentialProfile, 6> kProfiles{{
    {"android", "android", "AC7IBG09A3DTSYM4R41UJWL07VLN8JI7", "android-generic", "5",
     "6#26FRL$ZWD", "R=U!LH$O2B#", "tuner.pandora.com"},
    {"ios", "iphone", "P2E4FC0EAD3*878N92B2CDp34I0B1@388137C", "IP01", "5",
     "721^26xE22776", "20zE1E47BE57$51", "tuner.pandora.com"},
    {"palm", "palm", "IUC7IBG09A3JTSYM4N11UJWL07VLH8JP0", "pre", "5",
     "%526CBL$ZU3", "E#U$MY$O2B=", "tuner.pandora.com"},
    {"windows_mobile", "winmo", "ED227E10a628EB0E8Pm825Dw7114AC39", "VERIZON_MOTOQ9C", "5",
     "v93C8C2s12E0EBD", "7D671jt0C5E5d251", "tuner.pandora.com"},
    {"desktop_air", "pandora one", "TVCKIBGS9AO9TSYLNNFUML0743LH82D", "D01", "5",
     "2%3WCL*JU$MP]4", "U#IO$RZPAB%VX2", "internal-tuner.pandora.com"},
    {"vista_widget", "windowsgadget", "EVCCIBGS9AOJTSYMNNFUML07VLH8JYP0", "WG01", "5",
     "%22CML*ZU$8YXP[1", "E#IO$MYZOAB%FVR2", "internal-tuner.pandora.com"},
}};

} // namespace

std::span<const CredentialProfile> allProfiles() noexcept {
    return kProfiles;
}

const CredentialProfile& defaultProfile() noexcept {
    return kProfiles.front();
}

const CredentialProfile* findProfile(std::string_view name) noexcept {
    for (const auto& profile : kProfiles) {
        if (profile.name == name) return &profile;
    }
    return nullptr;
}

SessionBootstrap beginSession(const CredentialProfile& profile) {
    LOG_I("session", "starting session for profile '{}' ({})", profile.name, profile.endpointHost);
    return SessionBootstrap{
        SessionTokens(std::string(profile.encryptKey), std::string(profile.decryptKey)),
        profile.endpoint()
    };
}

} // namespace Tuner
