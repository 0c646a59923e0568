/*
Tuner - RequestEnvelopeBuilder Tests
Role: Verify how session state is merged into the query string and body of each call
Testing Strategy: Tokens in known states → build → assert query args and (decrypted) body
Coverage: Token precedence, reserved-key collisions, encryption, URL encoding, invalid params
*/
#include <gtest/gtest.h>
#include "jsonapi/request/RequestEnvelopeBuilder.hpp"
#include "jsonapi/profiles/CredentialProfiles.hpp"
#include "fixtures/api_responses.hpp"
#include <nlohmann/json.hpp>

using namespace Tuner;
using namespace std::chrono_literals;

namespace {

struct BuilderTest : ::testing::Test {
    SessionTokens tokens{ApiResponses::kAndroidEncryptKey, ApiResponses::kAndroidDecryptKey};
    RequestEnvelopeBuilder builder{Endpoint::forHost("tuner.pandora.com")};
    SessionTokens::Clock::time_point t0 = SessionTokens::Clock::now();

    void loginBoth() {
        tokens.updatePartner(PartnerTokens{"42", "partner-token", std::nullopt});
        tokens.setSyncTime(1477631903, t0);
        tokens.updateUser(UserTokens{"7", "user-token"});
    }

    nlohmann::json decryptedBody(const RequestEnvelope& env) {
        auto plain = BlockCipherCodec::decrypt(ApiResponses::kAndroidEncryptKey, env.body);
        return nlohmann::json::parse(std::string(plain.begin(), plain.end()));
    }
};

} // namespace

// =============================================================================
// Query Arguments
// =============================================================================

TEST_F(BuilderTest, NoSessionOnlyCarriesMethod) {
    auto env = builder.build(ApiCall{"test.checkLicensing"}, tokens, t0);
    ASSERT_TRUE(env.ok());

    EXPECT_EQ(env.value().query.size(), 1u);
    EXPECT_EQ(env.value().query.at("method"), "test.checkLicensing");
    EXPECT_EQ(env.value().body, "{}");
    EXPECT_EQ(env.value().target(), "/services/json?method=test.checkLicensing");
}

TEST_F(BuilderTest, PartnerSessionUsesPartnerToken) {
    tokens.updatePartner(PartnerTokens{"42", "partner-token", std::nullopt});

    auto env = builder.build(ApiCall{"auth.userLogin"}, tokens, t0);
    ASSERT_TRUE(env.ok());
    EXPECT_EQ(env.value().query.at("auth_token"), "partner-token");
    EXPECT_EQ(env.value().query.at("partner_id"), "42");
    EXPECT_EQ(env.value().query.count("user_id"), 0u);
}

TEST_F(BuilderTest, UserTokenTakesPrecedence) {
    loginBoth();

    auto env = builder.build(ApiCall{"user.getStationList"}, tokens, t0 + 5s);
    ASSERT_TRUE(env.ok());
    EXPECT_EQ(env.value().query.at("auth_token"), "user-token");
    EXPECT_EQ(env.value().query.at("partner_id"), "42");
    EXPECT_EQ(env.value().query.at("user_id"), "7");

    auto body = nlohmann::json::parse(env.value().body);
    EXPECT_EQ(body["partnerAuthToken"], "partner-token");
    EXPECT_EQ(body["userAuthToken"], "user-token");
    EXPECT_EQ(body["syncTime"], 1477631908u);
}

TEST_F(BuilderTest, QueryIsSortedAndUrlEncoded) {
    tokens.updatePartner(PartnerTokens{"42", "VAzr+QT/sy3=", std::nullopt});

    auto env = builder.build(ApiCall{"auth.userLogin"}, tokens, t0);
    ASSERT_TRUE(env.ok());
    EXPECT_EQ(env.value().target(),
              "/services/json?auth_token=VAzr%2BQT%2Fsy3%3D&method=auth.userLogin&partner_id=42");
    EXPECT_EQ(env.value().url(),
              "https://tuner.pandora.com/services/json?auth_token=VAzr%2BQT%2Fsy3%3D&method=auth.userLogin&partner_id=42");
}

// =============================================================================
// Body
// =============================================================================

TEST_F(BuilderTest, KeepsCallerParameterOrder) {
    nlohmann::ordered_json params;
    params["zeta"] = 1;
    params["alpha"] = "two";

    auto env = builder.build(ApiCall{"station.search", params}, tokens, t0);
    ASSERT_TRUE(env.ok());
    EXPECT_EQ(env.value().body, R"({"zeta":1,"alpha":"two"})");
}

TEST_F(BuilderTest, CallerValueWinsOnReservedKeyCollision) {
    loginBoth();
    nlohmann::ordered_json params;
    params["syncTime"] = 1;

    auto env = builder.build(ApiCall{"user.canSubscribe", params}, tokens, t0);
    ASSERT_TRUE(env.ok());
    auto body = nlohmann::json::parse(env.value().body);
    EXPECT_EQ(body["syncTime"], 1);
    EXPECT_EQ(body["userAuthToken"], "user-token");
}

TEST_F(BuilderTest, NullParamsAreAnEmptyObject) {
    auto env = builder.build(ApiCall{"test.checkLicensing", nullptr}, tokens, t0);
    ASSERT_TRUE(env.ok());
    EXPECT_EQ(env.value().body, "{}");
}

TEST_F(BuilderTest, RejectsNonObjectParams) {
    auto env = builder.build(ApiCall{"station.search", nlohmann::ordered_json::array({1, 2})}, tokens, t0);
    ASSERT_FALSE(env.ok());
    EXPECT_TRUE(env.holds<SerializationError>());
}

TEST_F(BuilderTest, RejectsEmptyMethod) {
    auto env = builder.build(ApiCall{""}, tokens, t0);
    EXPECT_TRUE(env.holds<SerializationError>());
}

TEST_F(BuilderTest, BuildDoesNotMutateTokens) {
    loginBoth();
    auto before = tokens.getSyncTime(t0);
    (void)builder.build(ApiCall{"user.getStationList"}, tokens, t0);
    EXPECT_EQ(tokens.userAuthToken(), "user-token");
    EXPECT_EQ(tokens.getSyncTime(t0), before);
}

// =============================================================================
// Encryption
// =============================================================================

TEST_F(BuilderTest, EncryptedBodyDecryptsWithEncryptKey) {
    loginBoth();
    nlohmann::ordered_json params = {{"loginType", "user"}, {"username", "someone"}, {"password", "secret"}};

    auto env = builder.build(ApiCall{"auth.userLogin", params, true}, tokens, t0);
    ASSERT_TRUE(env.ok());
    EXPECT_TRUE(env.value().encrypted);
    EXPECT_EQ(env.value().body.find("secret"), std::string::npos);

    auto body = decryptedBody(env.value());
    EXPECT_EQ(body["username"], "someone");
    EXPECT_EQ(body["partnerAuthToken"], "partner-token");
    EXPECT_EQ(body["syncTime"], 1477631903u);
}

TEST_F(BuilderTest, SetsPlainTextContentType) {
    auto env = builder.build(ApiCall{"test.checkLicensing"}, tokens, t0);
    ASSERT_TRUE(env.ok());
    ASSERT_EQ(env.value().headers.size(), 1u);
    EXPECT_EQ(env.value().headers[0].first, "Content-Type");
    EXPECT_EQ(env.value().headers[0].second, "text/plain");
}

TEST(FormUrlEncode, EncodesReservedCharacters) {
    EXPECT_EQ(formUrlEncode("a b+c/d=e&f"), "a+b%2Bc%2Fd%3De%26f");
    EXPECT_EQ(formUrlEncode("safe-._*"), "safe-._*");
    EXPECT_EQ(formUrlEncode("\xC3\xA8"), "%C3%A8");
}
