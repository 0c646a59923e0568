/*
Tuner - CredentialProfiles Tests
Role: Verify the partner profile catalog and session bootstrap
Coverage: Lookup, defaults, key pairs, endpoints, bootstrap state
*/
#include <gtest/gtest.h>
#include "jsonapi/profiles/CredentialProfiles.hpp"
#include <set>
#include <string>

using namespace Tuner;

TEST(CredentialProfiles, CatalogHasSixUniquelyNamedProfiles) {
    auto profiles = allProfiles();
    ASSERT_EQ(profiles.size(), 6u);

    std::set<std::string_view> names;
    for (const auto& p : profiles) {
        names.insert(p.name);
        EXPECT_EQ(p.version, "5") << p.name;
        EXPECT_GE(p.encryptKey.size(), 4u) << p.name;
        EXPECT_GE(p.decryptKey.size(), 4u) << p.name;
    }
    EXPECT_EQ(names.size(), 6u);
}

TEST(CredentialProfiles, DefaultIsAndroid) {
    const auto& p = defaultProfile();
    EXPECT_EQ(p.name, "android");
    EXPECT_EQ(p.username, "android");
    EXPECT_EQ(p.deviceModel, "android-generic");
    EXPECT_EQ(p.encryptKey, "6#26FRL$ZWD");
    EXPECT_EQ(p.decryptKey, "R=U!LH$O2B#");
}

TEST(CredentialProfiles, FindsByName) {
    const auto* ios = findProfile("ios");
    ASSERT_NE(ios, nullptr);
    EXPECT_EQ(ios->username, "iphone");
    EXPECT_EQ(ios->deviceModel, "IP01");

    EXPECT_EQ(findProfile("blackberry"), nullptr);
    EXPECT_EQ(findProfile(""), nullptr);
}

TEST(CredentialProfiles, DesktopProfilesUseInternalHost) {
    const auto* air = findProfile("desktop_air");
    ASSERT_NE(air, nullptr);
    EXPECT_EQ(air->endpoint().url(), "https://internal-tuner.pandora.com/services/json");

    EXPECT_EQ(defaultProfile().endpoint().url(), "https://tuner.pandora.com/services/json");
}

TEST(CredentialProfiles, BeginSessionYieldsKeysOnly) {
    const auto* palm = findProfile("palm");
    ASSERT_NE(palm, nullptr);

    auto session = beginSession(*palm);
    EXPECT_EQ(session.tokens.encryptKey(), "%526CBL$ZU3");
    EXPECT_EQ(session.tokens.decryptKey(), "E#U$MY$O2B=");
    EXPECT_FALSE(session.tokens.hasPartnerSession());
    EXPECT_FALSE(session.tokens.hasUserSession());
    EXPECT_FALSE(session.tokens.getSyncTime());
    EXPECT_EQ(session.endpoint.host, "tuner.pandora.com");
    EXPECT_EQ(session.endpoint.port, "443");
    EXPECT_EQ(session.endpoint.path, "/services/json");
}
