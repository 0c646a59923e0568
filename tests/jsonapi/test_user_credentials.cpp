/*
Tuner - UserCredentials Tests
Role: Verify the credentials file loader used by the login tool
Testing Strategy: Write temporary JSON files → load → assert fields or the thrown error
*/
#include <gtest/gtest.h>
#include "jsonapi/config/UserCredentials.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace Tuner;
namespace fs = std::filesystem;

namespace {

class UserCredentialsTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("tuner_creds_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string& contents) {
        const fs::path file = dir_ / "credentials.json";
        std::ofstream(file) << contents;
        return file.string();
    }
};

} // namespace

TEST_F(UserCredentialsTest, LoadsAllFields) {
    auto creds = loadUserCredentials(write(R"({"username":"me@example.com","password":"pw","profile":"ios"})"));
    EXPECT_EQ(creds.username, "me@example.com");
    EXPECT_EQ(creds.password, "pw");
    EXPECT_EQ(creds.profile, "ios");
}

TEST_F(UserCredentialsTest, ProfileDefaultsToAndroid) {
    auto creds = loadUserCredentials(write(R"({"username":"me@example.com","password":"pw"})"));
    EXPECT_EQ(creds.profile, "android");
}

TEST_F(UserCredentialsTest, MissingFileThrows) {
    EXPECT_THROW(loadUserCredentials((dir_ / "absent.json").string()), std::runtime_error);
}

TEST_F(UserCredentialsTest, MalformedJsonThrows) {
    EXPECT_THROW(loadUserCredentials(write("{username:")), std::runtime_error);
    EXPECT_THROW(loadUserCredentials(write("[]")), std::runtime_error);
}

TEST_F(UserCredentialsTest, MissingFieldsThrow) {
    EXPECT_THROW(loadUserCredentials(write(R"({"password":"pw"})")), std::runtime_error);
    EXPECT_THROW(loadUserCredentials(write(R"({"username":"me"})")), std::runtime_error);
    EXPECT_THROW(loadUserCredentials(write(R"({"username":"me","password":42})")), std::runtime_error);
}

TEST_F(UserCredentialsTest, UnknownProfileThrows) {
    EXPECT_THROW(loadUserCredentials(write(R"({"username":"me","password":"pw","profile":"amiga"})")),
                 std::runtime_error);
}
