/*
Tuner - ResponseInterpreter
Role: Decodes the generic {stat, result, message, code} envelope into a typed value or a structured error.
Inputs/Outputs: Raw HTTP body + the live SessionTokens in; Result<T> out.
Threading: Mutates the tokens on auth-token errors; callers serialize access (ApiClient holds its mutex).
Integration: Called by ApiClient after the transport returns a 2xx response.
Related: ResponseInterpreter.cpp, ApiError.hpp, SessionTokens.hpp.
Assumptions: Response types are decodable with nlohmann::json `from_json`.
*/
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "jsonapi/errors/Result.hpp"
#include "jsonapi/session/SessionTokens.hpp"

namespace Tuner {

enum class ApiStatus { Ok, Fail };

struct ApiEnvelopeResponse {
    ApiStatus stat = ApiStatus::Fail;
    std::optional<nlohmann::json> result;
    std::optional<std::string> message;
    std::optional<std::uint32_t> code;
};

/// Response type for methods that return no data.
struct EmptyResponse {};
inline void from_json(const nlohmann::json&, EmptyResponse&) {}

namespace ResponseInterpreter {

/// Parses and shape-checks the envelope. Malformed JSON or fields of the wrong type give a SerializationError.
[[nodiscard]] Result<ApiEnvelopeResponse> parseEnvelope(std::string_view body);

/// ApiError for a non-success envelope. An InvalidAuthToken error clears both
/// partner and user tokens so the next call re-authenticates.
[[nodiscard]] ApiError failureFor(const ApiEnvelopeResponse& envelope, SessionTokens& tokens);

template <class T>
Result<T> decodeAs(const nlohmann::json& j) {
    try {
        return Result<T>::success(j.get<T>());
    } catch (const nlohmann::json::exception& ex) {
        return Result<T>::failure(SerializationError{ex.what()});
    }
}

template <class T>
Result<T> interpret(std::string_view body, SessionTokens& tokens) {
    auto parsed = parseEnvelope(body);
    if (!parsed) return parsed.template forward<T>();

    const ApiEnvelopeResponse& envelope = parsed.value();
    if (envelope.stat == ApiStatus::Ok) {
        if (envelope.result) {
            return decodeAs<T>(*envelope.result);
        }
        // endpoints without return data answer with a bare {"stat":"ok"}
        auto empty = decodeAs<T>(nlohmann::json::object());
        if (!empty) {
            ApiError err;
            err.kind = ApiErrorKind::InvalidContent;
            err.message = "Invalid JSON content.";
            return Result<T>::failure(std::move(err));
        }
        return empty;
    }
    return Result<T>::failure(failureFor(envelope, tokens));
}

/// Untyped form: the result object, or {} for an ok envelope without one.
[[nodiscard]] inline Result<nlohmann::json> interpretEnvelope(std::string_view body, SessionTokens& tokens) {
    return interpret<nlohmann::json>(body, tokens);
}

} // namespace ResponseInterpreter
} // namespace Tuner
