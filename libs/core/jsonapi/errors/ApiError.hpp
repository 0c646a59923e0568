/*
Tuner - ApiError
Role: Error taxonomy for the JSON API binding and the server error-code table.
Inputs/Outputs: Maps numeric `code` values from failure envelopes to ApiErrorKind; renders display text.
Threading: Plain value types; the code table is immutable.
Integration: Produced by ResponseInterpreter, RequestEnvelopeBuilder, transports and format parsers; carried by Result<T>.
Related: ApiError.cpp, Result.hpp, ResponseInterpreter.hpp.
*/
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace Tuner {

enum class ApiErrorKind {
    InternalError,                    // 0, also seen when getPlaylist is called too often
    MaintenanceMode,                  // 1
    UrlParamMissingMethod,            // 2
    UrlParamMissingAuthToken,         // 3
    UrlParamMissingPartnerId,         // 4
    UrlParamMissingUserId,            // 5
    SecureProtocolRequired,           // 6
    CertificateRequired,              // 7
    ParameterTypeMismatch,            // 8
    ParameterMissing,                 // 9
    ParameterValueInvalid,            // 10
    ApiVersionNotSupported,           // 11
    LicensingRestrictions,            // 12
    InsufficientConnectivity,         // 13, usually a bad syncTime
    UnknownMethodName,                // 14
    WrongProtocol,                    // 15
    ReadOnlyMode,                     // 1000
    InvalidAuthToken,                 // 1001
    InvalidPartnerLogin,              // 1002
    ListenerNotAuthorized,            // 1003
    UserNotAuthorized,                // 1004
    MaxStationsReached,               // 1005
    StationDoesNotExist,              // 1006
    ComplimentaryPeriodAlreadyInUse,  // 1007
    CallNotAllowed,                   // 1008
    DeviceNotFound,                   // 1009
    PartnerNotAuthorized,             // 1010
    InvalidUsername,                  // 1011
    InvalidPassword,                  // 1012
    UsernameAlreadyExists,            // 1013
    DeviceAlreadyAssociatedToAccount, // 1014
    UpgradeDeviceModelInvalid,        // 1015
    ExplicitPinIncorrect,             // 1018
    ExplicitPinMalformed,             // 1020
    DeviceModelInvalid,               // 1023
    ZipCodeInvalid,                   // 1024
    BirthYearInvalid,                 // 1025
    BirthYearTooYoung,                // 1026
    InvalidCountryCode,               // 1027
    InvalidGender,                    // documented as 1027 too; never produced by the table
    DeviceDisabled,                   // 1034
    DailyTrialLimitReached,           // 1035
    InvalidSponsor,                   // 1036
    UserAlreadyUsedTrial,             // 1037
    PlaylistExceeded,                 // 1039
    UnknownErrorCode,                 // raw code kept in ApiError::code
    MissingErrorCode,                 // failure envelope without a code
    InvalidContent                    // "ok" envelope whose empty result does not decode
};

/// Maps a server error code to its kind. Unlisted codes map to UnknownErrorCode.
[[nodiscard]] ApiErrorKind errorKindFromCode(std::uint32_t code) noexcept;

/// Human-readable name of a kind, e.g. "Invalid Auth Token".
[[nodiscard]] std::string toString(ApiErrorKind kind);

struct ApiError {
    ApiErrorKind kind = ApiErrorKind::MissingErrorCode;
    std::optional<std::uint32_t> code;     // raw value as sent by the server
    std::optional<std::string> message;

    /// Builds an error from an optional code and message, the way failure envelopes carry them.
    static ApiError fromEnvelope(std::optional<std::uint32_t> code, std::optional<std::string> message);

    [[nodiscard]] std::string describe() const;
};

// Connection or I/O failure reported by an HttpTransport, or a non-2xx status.
struct TransportError {
    std::string message;
    unsigned httpStatus = 0;    // 0 when no HTTP response was received
};

// Malformed JSON in either direction, or a response that does not match its declared shape.
struct SerializationError {
    std::string message;
};

// Caller supplied a value that fails local validation (audio format, gender).
struct FormatError {
    std::string what;
    std::string value;
};

using Error = std::variant<TransportError, SerializationError, ApiError, FormatError>;

[[nodiscard]] std::string describe(const Error& error);

} // namespace Tuner
