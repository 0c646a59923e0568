#include "ApiClient.hpp"
#include "Log.hpp"
#include <stdexcept>

namespace Tuner {

ApiClient::ApiClient(const CredentialProfile& profile, HttpTransport& transport)
    : ApiClient(beginSession(profile).tokens, profile.endpoint(), transport)
{
    m_partnerLogin = toPartnerLogin(profile);
}

ApiClient::ApiClient(SessionTokens tokens, Endpoint endpoint, HttpTransport& transport)
    : m_tokens(std::move(tokens))
    , m_builder(std::move(endpoint))
    , m_transport(transport)
{
}

Result<nlohmann::json> ApiClient::execute(const ApiCall& call) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return callLocked<nlohmann::json>(call);
}

Result<PartnerLoginResponse> ApiClient::partnerLogin() {
    if (!m_partnerLogin) {
        throw std::logic_error("ApiClient: partnerLogin() needs a client created from a credential profile");
    }
    return partnerLogin(*m_partnerLogin);
}

Result<PartnerLoginResponse> ApiClient::partnerLogin(const PartnerLogin& request) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto result = callLocked<PartnerLoginResponse>(request.toCall());
    if (result) {
        m_tokens.updatePartner(result.value().toPartnerTokens());
        LOG_I("session", "partner session established (partnerId={})", result.value().partnerId);
    }
    return result;
}

Result<UserLoginResponse> ApiClient::userLogin(const std::string& username, const std::string& password) {
    return userLogin(UserLogin(username, password));
}

Result<UserLoginResponse> ApiClient::userLogin(const UserLogin& request) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_tokens.hasPartnerSession()) {
        LOG_W("session", "user login without a partner session; the server will reject it");
    }
    auto result = callLocked<UserLoginResponse>(request.toCall());
    if (result) {
        m_tokens.updateUser(result.value().toUserTokens());
        LOG_I("session", "user session established (userId={})", result.value().userId);
    }
    return result;
}

Result<CheckLicensingResponse> ApiClient::checkLicensing() {
    return call(CheckLicensing{});
}

SessionTokens ApiClient::tokens() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tokens;
}

Result<HttpResponse> ApiClient::send(const ApiCall& call) {
    auto envelope = m_builder.build(call, m_tokens);
    if (!envelope) {
        LOG_E("client", "{}: {}", call.method, describe(envelope.error()));
        return envelope.forward<HttpResponse>();
    }

    const RequestEnvelope& env = envelope.value();
    HttpRequest request;
    request.scheme = env.endpoint.scheme;
    request.host = env.endpoint.host;
    request.port = env.endpoint.port;
    request.target = env.target();
    request.body = env.body;
    request.headers = env.headers;

    auto response = m_transport.post(request);
    if (!response) {
        return response;
    }
    const unsigned status = response.value().status;
    if (status < 200 || status >= 300) {
        LOG_W("client", "{}: HTTP status {}", call.method, status);
        return Result<HttpResponse>::failure(TransportError{"HTTP status " + std::to_string(status), status});
    }
    return response;
}

} // namespace Tuner
