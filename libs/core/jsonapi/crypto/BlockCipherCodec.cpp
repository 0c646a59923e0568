#include "BlockCipherCodec.hpp"
#include "Log.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <fmt/format.h>

// Blowfish only exists as a low-level API; the EVP cipher needs the legacy provider on OpenSSL 3.
#define OPENSSL_SUPPRESS_DEPRECATED
#include <openssl/blowfish.h>
#include <openssl/crypto.h>

namespace Tuner::BlockCipherCodec {

namespace {

class KeySchedule {
public:
    explicit KeySchedule(std::string_view key) {
        if (key.size() < kMinKeyLength || key.size() > kMaxKeyLength) {
            throw std::invalid_argument(fmt::format(
                "BlockCipherCodec: unsupported key length {} (expected {}..{} bytes)",
                key.size(), kMinKeyLength, kMaxKeyLength));
        }
        BF_set_key(&m_key, static_cast<int>(key.size()),
                   reinterpret_cast<const unsigned char*>(key.data()));
    }
    ~KeySchedule() { OPENSSL_cleanse(&m_key, sizeof(m_key)); }

    KeySchedule(const KeySchedule&) = delete;
    KeySchedule& operator=(const KeySchedule&) = delete;

    void apply(std::vector<std::uint8_t>& buffer, int direction) const {
        for (std::size_t off = 0; off + kBlockSize <= buffer.size(); off += kBlockSize) {
            BF_ecb_encrypt(buffer.data() + off, buffer.data() + off, &m_key, direction);
        }
    }

private:
    BF_KEY m_key{};
};

} // namespace

std::string encrypt(std::string_view key, std::string_view plaintext) {
    KeySchedule schedule(key);

    std::vector<std::uint8_t> buffer(plaintext.begin(), plaintext.end());
    const std::size_t remainder = buffer.size() % kBlockSize;
    if (remainder != 0) {
        buffer.resize(buffer.size() + kBlockSize - remainder, kPaddingByte);
    }

    schedule.apply(buffer, BF_ENCRYPT);
    return hexEncode(buffer);
}

std::vector<std::uint8_t> decrypt(std::string_view key, std::string_view hexCiphertext) {
    KeySchedule schedule(key);

    std::vector<std::uint8_t> buffer = hexDecode(hexCiphertext);
    if (const std::size_t tail = buffer.size() % kBlockSize; tail != 0) {
        LOG_FIRST_N(WARN, 5, "crypto", "ciphertext is {} bytes, ignoring trailing partial block of {} bytes",
                    buffer.size(), tail);
        buffer.resize(buffer.size() - tail);
    }

    schedule.apply(buffer, BF_DECRYPT);

    auto pad = std::find(buffer.begin(), buffer.end(), kPaddingByte);
    buffer.erase(pad, buffer.end());
    return buffer;
}

std::string hexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t byte : bytes) {
        out.push_back(kHex[(byte >> 4) & 0x0F]);
        out.push_back(kHex[byte & 0x0F]);
    }
    return out;
}

std::vector<std::uint8_t> hexDecode(std::string_view hex) {
    std::vector<std::uint8_t> out;
    out.reserve(hex.size() / 2 + 1);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        std::string_view pair = hex.substr(i, 2);
        if (pair.size() == 2 && pair.front() == '+') pair.remove_prefix(1);
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(pair.data(), pair.data() + pair.size(), value, 16);
        if (ec != std::errc() || ptr != pair.data() + pair.size()) {
            value = 0;
        }
        out.push_back(static_cast<std::uint8_t>(value));
    }
    return out;
}

} // namespace Tuner::BlockCipherCodec
