#include "ResponseInterpreter.hpp"
#include "jsonapi/request/WireNames.hpp"
#include "Log.hpp"

#include <limits>

namespace Tuner::ResponseInterpreter {

namespace {

Result<ApiEnvelopeResponse> malformed(std::string message) {
    return Result<ApiEnvelopeResponse>::failure(SerializationError{std::move(message)});
}

} // namespace

Result<ApiEnvelopeResponse> parseEnvelope(std::string_view body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return malformed("response body is not valid JSON");
    }
    if (!j.is_object()) {
        return malformed(std::string("response envelope must be an object, got ") + j.type_name());
    }

    ApiEnvelopeResponse envelope;

    auto stat = j.find(wire::kStat);
    if (stat == j.end() || !stat->is_string()) {
        return malformed("response envelope has no 'stat' string");
    }
    const std::string& statText = stat->get_ref<const std::string&>();
    if (statText == "ok") {
        envelope.stat = ApiStatus::Ok;
    } else if (statText == "fail") {
        envelope.stat = ApiStatus::Fail;
    } else {
        return malformed("unknown response status '" + statText + "'");
    }

    if (auto result = j.find(wire::kResult); result != j.end() && !result->is_null()) {
        envelope.result = std::move(*result);
    }

    if (auto message = j.find(wire::kMessage); message != j.end() && !message->is_null()) {
        if (!message->is_string()) {
            return malformed("response 'message' must be a string");
        }
        envelope.message = message->get<std::string>();
    }

    if (auto code = j.find(wire::kCode); code != j.end() && !code->is_null()) {
        if (!code->is_number_unsigned() || code->get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
            return malformed("response 'code' must be an unsigned 32-bit integer");
        }
        envelope.code = static_cast<std::uint32_t>(code->get<std::uint64_t>());
    }

    return Result<ApiEnvelopeResponse>::success(std::move(envelope));
}

ApiError failureFor(const ApiEnvelopeResponse& envelope, SessionTokens& tokens) {
    ApiError err = ApiError::fromEnvelope(envelope.code, envelope.message);
    if (err.kind == ApiErrorKind::InvalidAuthToken) {
        LOG_W("response", "server rejected the auth token, clearing partner and user session");
        tokens.clearPartner();
        tokens.clearUser();
    } else {
        LOG_D("response", "{}", err.describe());
    }
    return err;
}

} // namespace Tuner::ResponseInterpreter
