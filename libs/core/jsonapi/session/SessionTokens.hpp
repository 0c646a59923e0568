/*
Tuner - SessionTokens
Role: Mutable state of one API session: key pair, partner and user credentials, server clock offset.
Inputs/Outputs: Updated from login responses (PartnerTokens / UserTokens); read by RequestEnvelopeBuilder.
Threading: Not synchronized. ApiClient owns one instance and serializes access to it.
Integration: Created by CredentialProfiles::beginSession(); cleared by ResponseInterpreter on auth-token errors.
Related: SessionTokens.cpp, BlockCipherCodec.hpp, ApiClient.hpp.
Assumptions: The key pair never changes for the lifetime of the object.
*/
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Tuner {

/// Server time captured at a local steady-clock instant. Base and instant only exist together.
struct SyncTime {
    std::uint64_t base = 0;
    std::chrono::steady_clock::time_point capturedAt{};
};

/// base + whole seconds elapsed between capture and `now`. A `now` earlier than the capture counts as zero.
[[nodiscard]] std::uint64_t projectSyncTime(const SyncTime& snapshot,
                                            std::chrono::steady_clock::time_point now) noexcept;

/// Decrypts an encrypted syncTime field, drops the 4-byte salt prefix and
/// parses the rest as a decimal number. Returns 0 if it does not parse.
[[nodiscard]] std::uint64_t decodeSyncTime(std::string_view decryptKey, std::string_view hexSyncTime);

// Values merged from a partner login response. syncTime is still encrypted.
struct PartnerTokens {
    std::optional<std::string> partnerId;
    std::optional<std::string> partnerAuthToken;
    std::optional<std::string> syncTime;
};

struct UserTokens {
    std::optional<std::string> userId;
    std::optional<std::string> userAuthToken;
};

class SessionTokens {
public:
    using Clock = std::chrono::steady_clock;

    SessionTokens(std::string encryptKey, std::string decryptKey);

    const std::string& encryptKey() const { return m_encryptKey; }
    const std::string& decryptKey() const { return m_decryptKey; }

    const std::optional<std::string>& partnerId() const { return m_partnerId; }
    const std::optional<std::string>& partnerAuthToken() const { return m_partnerAuthToken; }
    const std::optional<std::string>& userId() const { return m_userId; }
    const std::optional<std::string>& userAuthToken() const { return m_userAuthToken; }

    bool hasPartnerSession() const { return m_partnerAuthToken.has_value(); }
    bool hasUserSession() const { return m_userAuthToken.has_value(); }

    /// Stores partner id and token; decrypts and applies syncTime when present.
    void updatePartner(const PartnerTokens& tokens, Clock::time_point now = Clock::now());
    void updateUser(const UserTokens& tokens);

    void setSyncTime(std::uint64_t serverTime, Clock::time_point now = Clock::now());
    void clearSyncTime();
    /// Current server time, or nullopt if no partner login has set it.
    [[nodiscard]] std::optional<std::uint64_t> getSyncTime(Clock::time_point now = Clock::now()) const;

    /// Clears partner id, partner token and sync time.
    void clearPartner();
    void clearUser();

    [[nodiscard]] std::string encrypt(std::string_view plaintext) const;
    [[nodiscard]] std::vector<std::uint8_t> decrypt(std::string_view hexCiphertext) const;

private:
    std::string m_encryptKey;
    std::string m_decryptKey;

    std::optional<std::string> m_partnerId;
    std::optional<std::string> m_partnerAuthToken;
    std::optional<SyncTime> m_syncTime;

    std::optional<std::string> m_userId;
    std::optional<std::string> m_userAuthToken;
};

} // namespace Tuner
