#include "SessionTokens.hpp"
#include "jsonapi/crypto/BlockCipherCodec.hpp"
#include "Log.hpp"

#include <charconv>
#include <limits>

namespace Tuner {

namespace {
// Leading bytes of the decrypted syncTime that carry no time information.
constexpr std::size_t kSyncTimeSaltLength = 4;
}

std::uint64_t projectSyncTime(const SyncTime& snapshot, std::chrono::steady_clock::time_point now) noexcept {
    if (now <= snapshot.capturedAt) return snapshot.base;
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - snapshot.capturedAt);
    const auto seconds = static_cast<std::uint64_t>(elapsed.count());
    constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
    if (seconds > kMax - snapshot.base) return kMax;
    return snapshot.base + seconds;
}

std::uint64_t decodeSyncTime(std::string_view decryptKey, std::string_view hexSyncTime) {
    const std::vector<std::uint8_t> plain = BlockCipherCodec::decrypt(decryptKey, hexSyncTime);
    if (plain.size() <= kSyncTimeSaltLength) {
        LOG_W("session", "syncTime decrypted to {} bytes, using 0", plain.size());
        return 0;
    }

    const char* begin = reinterpret_cast<const char*>(plain.data()) + kSyncTimeSaltLength;
    const char* end = reinterpret_cast<const char*>(plain.data()) + plain.size();
    // a single leading '+' is allowed
    if (*begin == '+' && end - begin > 1) ++begin;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value, 10);
    if (ec != std::errc() || ptr != end) {
        LOG_W("session", "syncTime is not a decimal timestamp, using 0");
        return 0;
    }
    return value;
}

SessionTokens::SessionTokens(std::string encryptKey, std::string decryptKey)
    : m_encryptKey(std::move(encryptKey))
    , m_decryptKey(std::move(decryptKey))
{}

void SessionTokens::updatePartner(const PartnerTokens& tokens, Clock::time_point now) {
    m_partnerId = tokens.partnerId;
    m_partnerAuthToken = tokens.partnerAuthToken;
    if (tokens.syncTime) {
        setSyncTime(decodeSyncTime(m_decryptKey, *tokens.syncTime), now);
    }
    LOG_D("session", "partner tokens updated (partner_id={}, token={}, syncTime={})",
          m_partnerId.value_or("<none>"),
          m_partnerAuthToken ? "set" : "absent",
          m_syncTime ? m_syncTime->base : 0);
}

void SessionTokens::updateUser(const UserTokens& tokens) {
    m_userId = tokens.userId;
    m_userAuthToken = tokens.userAuthToken;
    LOG_D("session", "user tokens updated (user_id={}, token={})",
          m_userId.value_or("<none>"), m_userAuthToken ? "set" : "absent");
}

void SessionTokens::setSyncTime(std::uint64_t serverTime, Clock::time_point now) {
    m_syncTime = SyncTime{serverTime, now};
}

void SessionTokens::clearSyncTime() {
    m_syncTime.reset();
}

std::optional<std::uint64_t> SessionTokens::getSyncTime(Clock::time_point now) const {
    if (!m_syncTime) return std::nullopt;
    return projectSyncTime(*m_syncTime, now);
}

void SessionTokens::clearPartner() {
    m_partnerId.reset();
    m_partnerAuthToken.reset();
    clearSyncTime();
}

void SessionTokens::clearUser() {
    m_userId.reset();
    m_userAuthToken.reset();
}

std::string SessionTokens::encrypt(std::string_view plaintext) const {
    return BlockCipherCodec::encrypt(m_encryptKey, plaintext);
}

std::vector<std::uint8_t> SessionTokens::decrypt(std::string_view hexCiphertext) const {
    return BlockCipherCodec::decrypt(m_decryptKey, hexCiphertext);
}

} // namespace Tuner
