/*
Tuner - ApiError Tests
Role: Verify the server error-code table and error display text
Coverage: Known codes, the 1027 collision, unknown/missing codes, describe() for each category
*/
#include <gtest/gtest.h>
#include "jsonapi/errors/Result.hpp"

using namespace Tuner;

// =============================================================================
// Code Table
// =============================================================================

TEST(ApiErrorCodes, MapsKnownCodes) {
    EXPECT_EQ(errorKindFromCode(0), ApiErrorKind::InternalError);
    EXPECT_EQ(errorKindFromCode(1), ApiErrorKind::MaintenanceMode);
    EXPECT_EQ(errorKindFromCode(12), ApiErrorKind::LicensingRestrictions);
    EXPECT_EQ(errorKindFromCode(1001), ApiErrorKind::InvalidAuthToken);
    EXPECT_EQ(errorKindFromCode(1002), ApiErrorKind::InvalidPartnerLogin);
    EXPECT_EQ(errorKindFromCode(1039), ApiErrorKind::PlaylistExceeded);
}

TEST(ApiErrorCodes, Code1027IsInvalidCountryCode) {
    EXPECT_EQ(errorKindFromCode(1027), ApiErrorKind::InvalidCountryCode);
}

TEST(ApiErrorCodes, UnlistedCodesAreUnknown) {
    EXPECT_EQ(errorKindFromCode(16), ApiErrorKind::UnknownErrorCode);
    EXPECT_EQ(errorKindFromCode(1016), ApiErrorKind::UnknownErrorCode);
    EXPECT_EQ(errorKindFromCode(9999), ApiErrorKind::UnknownErrorCode);
}

TEST(ApiErrorCodes, UnknownCodeKeepsRawValue) {
    auto err = ApiError::fromEnvelope(9999u, std::string("SOMETHING_NEW"));
    EXPECT_EQ(err.kind, ApiErrorKind::UnknownErrorCode);
    EXPECT_EQ(err.code, 9999u);
    EXPECT_EQ(err.describe(), "API call error (Unrecognized Error Code (9999) Error): SOMETHING_NEW");
}

TEST(ApiErrorCodes, MissingCode) {
    auto err = ApiError::fromEnvelope(std::nullopt, std::nullopt);
    EXPECT_EQ(err.kind, ApiErrorKind::MissingErrorCode);
    EXPECT_FALSE(err.code);
    EXPECT_EQ(err.describe(), "API call error (Missing Error Code Error)");
}

// =============================================================================
// Display
// =============================================================================

TEST(ApiErrorDisplay, DescribesEachCategory) {
    EXPECT_EQ(describe(Error{ApiError::fromEnvelope(1001u, std::string("INVALID_AUTH_TOKEN"))}),
              "API call error (Invalid Auth Token Error): INVALID_AUTH_TOKEN");
    EXPECT_EQ(describe(Error{TransportError{"connection refused"}}), "HTTP I/O error: connection refused");
    EXPECT_EQ(describe(Error{TransportError{"HTTP status 503", 503}}),
              "HTTP I/O error (status 503): HTTP status 503");
    EXPECT_EQ(describe(Error{SerializationError{"bad"}}), "JSON serialization error: bad");
    EXPECT_EQ(describe(Error{FormatError{"audio format", "HTTP_1_OGG"}}),
              "Invalid/unsupported audio format: HTTP_1_OGG");
}

// =============================================================================
// Result
// =============================================================================

TEST(Result, SuccessAndFailureAccessors) {
    auto good = Result<int>::success(7);
    EXPECT_TRUE(good.ok());
    EXPECT_EQ(good.value(), 7);
    EXPECT_EQ(good.apiError(), nullptr);

    auto bad = Result<int>::failure(ApiError::fromEnvelope(1001u, std::nullopt));
    EXPECT_FALSE(bad);
    ASSERT_NE(bad.apiError(), nullptr);
    EXPECT_EQ(bad.apiError()->kind, ApiErrorKind::InvalidAuthToken);
    EXPECT_TRUE(bad.holds<ApiError>());
    EXPECT_FALSE(bad.holds<TransportError>());

    auto forwarded = bad.forward<std::string>();
    ASSERT_NE(forwarded.apiError(), nullptr);
    EXPECT_EQ(forwarded.apiError()->kind, ApiErrorKind::InvalidAuthToken);
}

TEST(Result, TransportFailureHasNoApiError) {
    auto r = Result<int>::failure(TransportError{"timeout"});
    EXPECT_EQ(r.apiError(), nullptr);
    EXPECT_TRUE(r.holds<TransportError>());
}
