#include "ApiError.hpp"
#include <fmt/format.h>
#include <type_traits>

namespace Tuner {

ApiErrorKind errorKindFromCode(std::uint32_t code) noexcept {
    switch (code) {
        case 0:    return ApiErrorKind::InternalError;
        case 1:    return ApiErrorKind::MaintenanceMode;
        case 2:    return ApiErrorKind::UrlParamMissingMethod;
        case 3:    return ApiErrorKind::UrlParamMissingAuthToken;
        case 4:    return ApiErrorKind::UrlParamMissingPartnerId;
        case 5:    return ApiErrorKind::UrlParamMissingUserId;
        case 6:    return ApiErrorKind::SecureProtocolRequired;
        case 7:    return ApiErrorKind::CertificateRequired;
        case 8:    return ApiErrorKind::ParameterTypeMismatch;
        case 9:    return ApiErrorKind::ParameterMissing;
        case 10:   return ApiErrorKind::ParameterValueInvalid;
        case 11:   return ApiErrorKind::ApiVersionNotSupported;
        case 12:   return ApiErrorKind::LicensingRestrictions;
        case 13:   return ApiErrorKind::InsufficientConnectivity;
        case 14:   return ApiErrorKind::UnknownMethodName;
        case 15:   return ApiErrorKind::WrongProtocol;
        case 1000: return ApiErrorKind::ReadOnlyMode;
        case 1001: return ApiErrorKind::InvalidAuthToken;
        case 1002: return ApiErrorKind::InvalidPartnerLogin;
        case 1003: return ApiErrorKind::ListenerNotAuthorized;
        case 1004: return ApiErrorKind::UserNotAuthorized;
        case 1005: return ApiErrorKind::MaxStationsReached;
        case 1006: return ApiErrorKind::StationDoesNotExist;
        case 1007: return ApiErrorKind::ComplimentaryPeriodAlreadyInUse;
        case 1008: return ApiErrorKind::CallNotAllowed;
        case 1009: return ApiErrorKind::DeviceNotFound;
        case 1010: return ApiErrorKind::PartnerNotAuthorized;
        case 1011: return ApiErrorKind::InvalidUsername;
        case 1012: return ApiErrorKind::InvalidPassword;
        case 1013: return ApiErrorKind::UsernameAlreadyExists;
        case 1014: return ApiErrorKind::DeviceAlreadyAssociatedToAccount;
        case 1015: return ApiErrorKind::UpgradeDeviceModelInvalid;
        case 1018: return ApiErrorKind::ExplicitPinIncorrect;
        case 1020: return ApiErrorKind::ExplicitPinMalformed;
        case 1023: return ApiErrorKind::DeviceModelInvalid;
        case 1024: return ApiErrorKind::ZipCodeInvalid;
        case 1025: return ApiErrorKind::BirthYearInvalid;
        case 1026: return ApiErrorKind::BirthYearTooYoung;
        // INVALID_GENDER is documented with the same value; country code wins
        case 1027: return ApiErrorKind::InvalidCountryCode;
        case 1034: return ApiErrorKind::DeviceDisabled;
        case 1035: return ApiErrorKind::DailyTrialLimitReached;
        case 1036: return ApiErrorKind::InvalidSponsor;
        case 1037: return ApiErrorKind::UserAlreadyUsedTrial;
        case 1039: return ApiErrorKind::PlaylistExceeded;
        default:   return ApiErrorKind::UnknownErrorCode;
    }
}

std::string toString(ApiErrorKind kind) {
    switch (kind) {
        case ApiErrorKind::InternalError:                    return "Internal";
        case ApiErrorKind::MaintenanceMode:                  return "Maintenance Mode";
        case ApiErrorKind::UrlParamMissingMethod:            return "Url Param Missing Method";
        case ApiErrorKind::UrlParamMissingAuthToken:         return "Url Param Missing Auth Token";
        case ApiErrorKind::UrlParamMissingPartnerId:         return "Url Param Missing Partner ID";
        case ApiErrorKind::UrlParamMissingUserId:            return "Url Param Missing User ID";
        case ApiErrorKind::SecureProtocolRequired:           return "Secure Protocol Required";
        case ApiErrorKind::CertificateRequired:              return "Certificate Required";
        case ApiErrorKind::ParameterTypeMismatch:            return "Parameter Type Mismatch";
        case ApiErrorKind::ParameterMissing:                 return "Parameter Missing";
        case ApiErrorKind::ParameterValueInvalid:            return "Parameter Value Invalid";
        case ApiErrorKind::ApiVersionNotSupported:           return "API Version Not Supported";
        case ApiErrorKind::LicensingRestrictions:            return "Licensing Restriction";
        case ApiErrorKind::InsufficientConnectivity:         return "Insufficient Connectivity";
        case ApiErrorKind::UnknownMethodName:                return "Unknown Method Name";
        case ApiErrorKind::WrongProtocol:                    return "Incorrect Protocol";
        case ApiErrorKind::ReadOnlyMode:                     return "Read Only Mode";
        case ApiErrorKind::InvalidAuthToken:                 return "Invalid Auth Token";
        case ApiErrorKind::InvalidPartnerLogin:              return "Invalid Partner Login";
        case ApiErrorKind::ListenerNotAuthorized:            return "Listener Not Authorized";
        case ApiErrorKind::UserNotAuthorized:                return "User Not Authorized";
        case ApiErrorKind::MaxStationsReached:               return "Max Stations Reached";
        case ApiErrorKind::StationDoesNotExist:              return "Station Does Not Exist";
        case ApiErrorKind::ComplimentaryPeriodAlreadyInUse:  return "Complimentary Period Already In Use";
        case ApiErrorKind::CallNotAllowed:                   return "Call Not Allowed";
        case ApiErrorKind::DeviceNotFound:                   return "Device Not Found";
        case ApiErrorKind::PartnerNotAuthorized:             return "Partner Not Authorized";
        case ApiErrorKind::InvalidUsername:                  return "Invalid Username";
        case ApiErrorKind::InvalidPassword:                  return "Invalid Password";
        case ApiErrorKind::UsernameAlreadyExists:            return "Username Already Exists";
        case ApiErrorKind::DeviceAlreadyAssociatedToAccount: return "Device Already Associated to Account";
        case ApiErrorKind::UpgradeDeviceModelInvalid:        return "Upgrade Device Model Invalid";
        case ApiErrorKind::ExplicitPinIncorrect:             return "Explicit Pin Incorrect";
        case ApiErrorKind::ExplicitPinMalformed:             return "Explicit Pin Malformed";
        case ApiErrorKind::DeviceModelInvalid:               return "Device Model Invalid";
        case ApiErrorKind::ZipCodeInvalid:                   return "Zip Code Invalid";
        case ApiErrorKind::BirthYearInvalid:                 return "Birth Year Invalid";
        case ApiErrorKind::BirthYearTooYoung:                return "Birth Year Too Young";
        case ApiErrorKind::InvalidCountryCode:               return "Invalid Country Code";
        case ApiErrorKind::InvalidGender:                    return "Invalid Gender";
        case ApiErrorKind::DeviceDisabled:                   return "Device Disabled";
        case ApiErrorKind::DailyTrialLimitReached:           return "Daily Trial Limit Reached";
        case ApiErrorKind::InvalidSponsor:                   return "Invalid Sponsor";
        case ApiErrorKind::UserAlreadyUsedTrial:             return "User Already Used Trial";
        case ApiErrorKind::PlaylistExceeded:                 return "Playlist Exceeded. Too many requests for a new playlist.";
        case ApiErrorKind::UnknownErrorCode:                 return "Unrecognized Error Code";
        case ApiErrorKind::MissingErrorCode:                 return "Missing Error Code";
        case ApiErrorKind::InvalidContent:                   return "Invalid Content";
    }
    return "Unrecognized Error Code";
}

ApiError ApiError::fromEnvelope(std::optional<std::uint32_t> code, std::optional<std::string> message) {
    ApiError err;
    err.kind = code ? errorKindFromCode(*code) : ApiErrorKind::MissingErrorCode;
    err.code = code;
    err.message = std::move(message);
    return err;
}

std::string ApiError::describe() const {
    std::string kindText = toString(kind);
    if (kind == ApiErrorKind::UnknownErrorCode && code) {
        kindText = fmt::format("{} ({})", kindText, *code);
    }
    std::string out = fmt::format("API call error ({} Error)", kindText);
    if (message) {
        out += ": " + *message;
    }
    return out;
}

std::string describe(const Error& error) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TransportError>) {
            if (e.httpStatus != 0) {
                return fmt::format("HTTP I/O error (status {}): {}", e.httpStatus, e.message);
            }
            return "HTTP I/O error: " + e.message;
        } else if constexpr (std::is_same_v<T, SerializationError>) {
            return "JSON serialization error: " + e.message;
        } else if constexpr (std::is_same_v<T, ApiError>) {
            return e.describe();
        } else {
            return fmt::format("Invalid/unsupported {}: {}", e.what, e.value);
        }
    }, error);
}

} // namespace Tuner
