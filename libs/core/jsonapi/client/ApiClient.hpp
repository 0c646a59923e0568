/*
Tuner - ApiClient
Role: One API session: owns the SessionTokens and endpoint, runs builder -> transport -> interpreter per call.
Inputs/Outputs: Typed requests (PartnerLogin, UserLogin, ...) or raw ApiCalls in; Result<Response> out.
Threading: Every call holds an internal mutex for its whole duration, so one client can be shared.
Integration: The login CLI and any caller-defined endpoint go through call<Req>() or execute().
Related: ApiClient.cpp, RequestEnvelopeBuilder.hpp, ResponseInterpreter.hpp, HttpTransport.hpp, AuthMethods.hpp.
Assumptions: The HttpTransport outlives the client.
*/
#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "jsonapi/errors/Result.hpp"
#include "jsonapi/methods/AuthMethods.hpp"
#include "jsonapi/profiles/CredentialProfiles.hpp"
#include "jsonapi/request/RequestEnvelopeBuilder.hpp"
#include "jsonapi/response/ResponseInterpreter.hpp"
#include "jsonapi/transport/HttpTransport.hpp"

namespace Tuner {

class ApiClient {
public:
    ApiClient(const CredentialProfile& profile, HttpTransport& transport);
    ApiClient(SessionTokens tokens, Endpoint endpoint, HttpTransport& transport);

    template <class Req>
    Result<typename Req::Response> call(const Req& request) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return callLocked<typename Req::Response>(request.toCall());
    }

    /// Caller-supplied method; returns the raw result object.
    Result<nlohmann::json> execute(const ApiCall& call);

    /// Partner handshake with the profile's partner credentials; merges the tokens on success.
    /// Throws std::logic_error if the client was not created from a profile.
    Result<PartnerLoginResponse> partnerLogin();
    Result<PartnerLoginResponse> partnerLogin(const PartnerLogin& request);

    /// User handshake on top of the partner session; merges the tokens on success.
    Result<UserLoginResponse> userLogin(const std::string& username, const std::string& password);
    Result<UserLoginResponse> userLogin(const UserLogin& request);

    Result<CheckLicensingResponse> checkLicensing();

    /// Copy of the session state at this instant.
    SessionTokens tokens() const;
    const Endpoint& endpoint() const { return m_builder.endpoint(); }

    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

private:
    template <class T>
    Result<T> callLocked(const ApiCall& call) {
        auto response = send(call);
        if (!response) return response.template forward<T>();
        return ResponseInterpreter::interpret<T>(response.value().body, m_tokens);
    }

    // Builds and posts one call; non-2xx statuses become TransportError. Caller holds m_mutex.
    Result<HttpResponse> send(const ApiCall& call);

    mutable std::mutex             m_mutex;
    SessionTokens                  m_tokens;
    RequestEnvelopeBuilder         m_builder;
    HttpTransport&                 m_transport;
    std::optional<PartnerLogin>    m_partnerLogin;
};

} // namespace Tuner
