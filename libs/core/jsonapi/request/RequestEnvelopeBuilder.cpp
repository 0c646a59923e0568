#include "RequestEnvelopeBuilder.hpp"
#include "jsonapi/request/WireNames.hpp"
#include "Log.hpp"

namespace Tuner {

namespace {

// Adds key only when the caller did not already supply it.
template <class Value>
void injectReserved(const std::string& method, nlohmann::ordered_json& body, const char* key, Value&& value) {
    if (body.contains(key)) {
        LOG_W("request", "{}: parameters already contain reserved key '{}', keeping caller value", method, key);
        return;
    }
    body[key] = std::forward<Value>(value);
}

} // namespace

Result<RequestEnvelope> RequestEnvelopeBuilder::build(const ApiCall& call,
                                                      const SessionTokens& tokens,
                                                      SessionTokens::Clock::time_point now) const {
    if (call.method.empty()) {
        return Result<RequestEnvelope>::failure(SerializationError{"API call has no method name"});
    }

    nlohmann::ordered_json body = call.params.is_null() ? nlohmann::ordered_json::object() : call.params;
    if (!body.is_object()) {
        return Result<RequestEnvelope>::failure(SerializationError{
            call.method + ": request parameters must be a JSON object, got " + body.type_name()});
    }

    RequestEnvelope envelope;
    envelope.endpoint = m_endpoint;
    envelope.method = call.method;
    envelope.encrypted = call.encrypt;
    envelope.query[wire::kMethod] = call.method;
    addQueryTokens(envelope, tokens);
    addBodyTokens(call.method, body, tokens, now);

    try {
        envelope.body = body.dump();
    } catch (const nlohmann::json::exception& ex) {
        return Result<RequestEnvelope>::failure(SerializationError{call.method + ": " + ex.what()});
    }

    if (call.encrypt) {
        envelope.body = tokens.encrypt(envelope.body);
    }
    envelope.headers.emplace_back("Content-Type", "text/plain");

    LOG_T("request", "built {} (encrypted={}, {} query args, {} body bytes)",
          call.method, call.encrypt, envelope.query.size(), envelope.body.size());
    return Result<RequestEnvelope>::success(std::move(envelope));
}

void RequestEnvelopeBuilder::addQueryTokens(RequestEnvelope& envelope, const SessionTokens& tokens) {
    // user token wins over partner token
    if (tokens.userAuthToken()) {
        envelope.query[wire::kAuthToken] = *tokens.userAuthToken();
    } else if (tokens.partnerAuthToken()) {
        envelope.query[wire::kAuthToken] = *tokens.partnerAuthToken();
    }
    if (tokens.partnerId()) {
        envelope.query[wire::kPartnerId] = *tokens.partnerId();
    }
    if (tokens.userId()) {
        envelope.query[wire::kUserId] = *tokens.userId();
    }
}

void RequestEnvelopeBuilder::addBodyTokens(const std::string& method, nlohmann::ordered_json& body,
                                           const SessionTokens& tokens, SessionTokens::Clock::time_point now) {
    if (tokens.partnerAuthToken()) {
        injectReserved(method, body, wire::kPartnerAuthToken, *tokens.partnerAuthToken());
    }
    if (tokens.userAuthToken()) {
        injectReserved(method, body, wire::kUserAuthToken, *tokens.userAuthToken());
    }
    if (auto syncTime = tokens.getSyncTime(now)) {
        injectReserved(method, body, wire::kSyncTime, *syncTime);
    }
}

} // namespace Tuner
