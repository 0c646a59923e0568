/*
Tuner - BlockCipherCodec
Role: Blowfish-ECB framing for encrypted request bodies and encrypted response fields.
Inputs/Outputs: encrypt() takes a key and plaintext and returns lowercase hex; decrypt() takes hex and returns raw bytes.
Threading: Stateless; a key schedule is built per call.
Integration: Used by SessionTokens (syncTime) and RequestEnvelopeBuilder (encrypted bodies).
Related: BlockCipherCodec.cpp, SessionTokens.hpp.
Assumptions: Keys are 4..56 bytes. Anything else is a programming error and throws std::invalid_argument.
*/
#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Tuner::BlockCipherCodec {

inline constexpr std::uint8_t kPaddingByte  = 2;
inline constexpr std::size_t  kBlockSize    = 8;
inline constexpr std::size_t  kMinKeyLength = 4;
inline constexpr std::size_t  kMaxKeyLength = 56;

/// Pads with kPaddingByte to a whole number of blocks, encrypts each block
/// independently and returns the ciphertext as lowercase hex.
[[nodiscard]] std::string encrypt(std::string_view key, std::string_view plaintext);

/// Hex-decodes, decrypts each block and truncates at the first kPaddingByte.
/// A payload byte equal to kPaddingByte also truncates; the wire format
/// depends on this exact behavior.
[[nodiscard]] std::vector<std::uint8_t> decrypt(std::string_view key, std::string_view hexCiphertext);

[[nodiscard]] std::string hexEncode(std::span<const std::uint8_t> bytes);

/// Two characters per byte; a pair that is not valid hex decodes to 0.
/// A trailing single character is read as one hex digit.
[[nodiscard]] std::vector<std::uint8_t> hexDecode(std::string_view hex);

} // namespace Tuner::BlockCipherCodec
