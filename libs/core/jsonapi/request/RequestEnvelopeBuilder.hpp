/*
Tuner - RequestEnvelopeBuilder
Role: Turns an ApiCall plus the current session state into an authenticated, optionally encrypted RequestEnvelope.
Inputs/Outputs: ApiCall + const SessionTokens& in; Result<RequestEnvelope> out.
Threading: Stateless apart from the endpoint; never mutates the tokens it reads.
Integration: Called by ApiClient once per call, before the transport.
Related: RequestEnvelopeBuilder.cpp, RequestEnvelope.hpp, WireNames.hpp, BlockCipherCodec.hpp.
Assumptions: Callers do not put partnerAuthToken, userAuthToken or syncTime in their parameters.
*/
#pragma once
#include "jsonapi/errors/Result.hpp"
#include "jsonapi/request/ApiCall.hpp"
#include "jsonapi/request/Endpoint.hpp"
#include "jsonapi/request/RequestEnvelope.hpp"
#include "jsonapi/session/SessionTokens.hpp"

namespace Tuner {

class RequestEnvelopeBuilder {
public:
    explicit RequestEnvelopeBuilder(Endpoint endpoint) : m_endpoint(std::move(endpoint)) {}

    const Endpoint& endpoint() const { return m_endpoint; }

    [[nodiscard]] Result<RequestEnvelope> build(const ApiCall& call,
                                                const SessionTokens& tokens,
                                                SessionTokens::Clock::time_point now = SessionTokens::Clock::now()) const;

private:
    Endpoint m_endpoint;

    static void addQueryTokens(RequestEnvelope& envelope, const SessionTokens& tokens);
    static void addBodyTokens(const std::string& method, nlohmann::ordered_json& body,
                              const SessionTokens& tokens, SessionTokens::Clock::time_point now);
};

} // namespace Tuner
