#include "jsonapi/client/ApiClient.hpp"
#include "jsonapi/config/UserCredentials.hpp"
#include "jsonapi/transport/BeastHttpTransport.hpp"
#include "Log.hpp"
#include <exception>
#include <iostream>
#include <string>

using namespace Tuner;

int main(int argc, char** argv) {
    const std::string path = argc > 1 ? argv[1] : "credentials.json";
    std::cout << "[Tuner login check starting...]" << std::endl;

    try {
        const UserCredentials creds = loadUserCredentials(path);
        const CredentialProfile* profile = findProfile(creds.profile);

        BeastHttpTransport transport;
        ApiClient client(*profile, transport);

        auto licensing = client.checkLicensing();
        if (!licensing) {
            LOG_E("cli", "licensing check failed: {}", describe(licensing.error()));
            return 1;
        }
        if (!licensing.value().isAllowed) {
            LOG_W("cli", "service reports it is not licensed in this region");
        }

        auto partner = client.partnerLogin();
        if (!partner) {
            LOG_E("cli", "partner login failed: {}", describe(partner.error()));
            return 1;
        }

        auto user = client.userLogin(creds.username, creds.password);
        if (!user) {
            LOG_E("cli", "user login failed: {}", describe(user.error()));
            return 1;
        }

        const SessionTokens session = client.tokens();
        std::cout << "logged in as " << user.value().username
                  << " (userId " << user.value().userId << ") via " << client.endpoint().url() << std::endl;
        if (auto syncTime = session.getSyncTime()) {
            std::cout << "server time: " << *syncTime << std::endl;
        }
        std::cout << "can listen: " << (user.value().canListen ? "yes" : "no") << std::endl;
        return 0;
    } catch (const std::exception& ex) {
        LOG_E("cli", "{}", ex.what());
        return 1;
    }
}
