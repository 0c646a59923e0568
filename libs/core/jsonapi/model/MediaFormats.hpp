#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include "jsonapi/errors/Result.hpp"

namespace Tuner {

enum class AudioFormat {
    AacMono40,
    Aac64,
    AacPlus32,
    AacPlus64,
    AacPlusAdts24,
    AacPlusAdts32,
    AacPlusAdts64,
    Mp3128,
    Wma32,
};

/// Wire name, e.g. "HTTP_64_AACPLUS_ADTS".
[[nodiscard]] std::string_view toString(AudioFormat format) noexcept;
[[nodiscard]] Result<AudioFormat> parseAudioFormat(std::string_view text);

/// Container file extension: "m4a", "aac", "mp3" or "wma".
[[nodiscard]] std::string_view extension(AudioFormat format) noexcept;
[[nodiscard]] std::uint32_t bitrateKbps(AudioFormat format) noexcept;

/// Relative preference; higher is better.
[[nodiscard]] int qualityRank(AudioFormat format) noexcept;
[[nodiscard]] inline bool betterThan(AudioFormat a, AudioFormat b) noexcept {
    return qualityRank(a) > qualityRank(b);
}

/// Maps an audioUrlMap entry (encoding, bitrate) to a format. Only the
/// combinations the service actually sends are recognised.
[[nodiscard]] std::optional<AudioFormat> fromAudioUrlMap(std::string_view encoding, std::string_view bitrate) noexcept;

enum class Gender { Male, Female };

[[nodiscard]] std::string_view toString(Gender gender) noexcept;
[[nodiscard]] Result<Gender> parseGender(std::string_view text);

} // namespace Tuner
