#include "MediaFormats.hpp"
#include <array>
#include <string>

namespace Tuner {

namespace {

struct FormatInfo {
    AudioFormat format;
    std::string_view wire;
    std::string_view extension;
    std::uint32_t bitrate;
    int rank;
};

constexpr std::array<FormatInfo, 9> kFormats{{
    {AudioFormat::AacMono40,     "HTTP_40_AAC_MONO",     "m4a", 40,  2},
    {AudioFormat::Aac64,         "HTTP_64_AAC",          "m4a", 64,  7},
    {AudioFormat::AacPlus32,     "HTTP_32_AACPLUS",      "m4a", 32,  5},
    {AudioFormat::AacPlus64,     "HTTP_64_AACPLUS",      "m4a", 64,  9},
    {AudioFormat::AacPlusAdts24, "HTTP_24_AACPLUS_ADTS", "aac", 24,  4},
    {AudioFormat::AacPlusAdts32, "HTTP_32_AACPLUS_ADTS", "aac", 32,  6},
    {AudioFormat::AacPlusAdts64, "HTTP_64_AACPLUS_ADTS", "aac", 64, 10},
    {AudioFormat::Mp3128,        "HTTP_128_MP3",         "mp3", 128, 8},
    {AudioFormat::Wma32,         "HTTP_32_WMA",          "wma", 32,  1},
}};

const FormatInfo& info(AudioFormat format) noexcept {
    return kFormats[static_cast<std::size_t>(format)];
}

} // namespace

std::string_view toString(AudioFormat format) noexcept { return info(format).wire; }
std::string_view extension(AudioFormat format) noexcept { return info(format).extension; }
std::uint32_t bitrateKbps(AudioFormat format) noexcept { return info(format).bitrate; }
int qualityRank(AudioFormat format) noexcept { return info(format).rank; }

Result<AudioFormat> parseAudioFormat(std::string_view text) {
    for (const auto& f : kFormats) {
        if (f.wire == text) return Result<AudioFormat>::success(f.format);
    }
    return Result<AudioFormat>::failure(FormatError{"audio format", std::string(text)});
}

std::optional<AudioFormat> fromAudioUrlMap(std::string_view encoding, std::string_view bitrate) noexcept {
    if (encoding == "aac" && bitrate == "64") return AudioFormat::AacPlus64;
    if (encoding == "aacplus" && bitrate == "32") return AudioFormat::AacPlus32;
    if (encoding == "aacplus" && bitrate == "64") return AudioFormat::AacPlus64;
    return std::nullopt;
}

std::string_view toString(Gender gender) noexcept {
    return gender == Gender::Male ? "Male" : "Female";
}

Result<Gender> parseGender(std::string_view text) {
    if (text == "Male") return Result<Gender>::success(Gender::Male);
    if (text == "Female") return Result<Gender>::success(Gender::Female);
    return Result<Gender>::failure(FormatError{"gender", std::string(text)});
}

} // namespace Tuner
