#include "RequestEnvelope.hpp"

namespace Tuner {

std::string formUrlEncode(std::string_view text) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        const bool unreserved = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
                             || c == '*' || c == '-' || c == '.' || c == '_';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string RequestEnvelope::target() const {
    std::string out = endpoint.path;
    char sep = '?';
    for (const auto& [key, value] : query) {
        out.push_back(sep);
        out += formUrlEncode(key);
        out.push_back('=');
        out += formUrlEncode(value);
        sep = '&';
    }
    return out;
}

std::string RequestEnvelope::url() const {
    const std::string base = endpoint.url();
    return base.substr(0, base.size() - endpoint.path.size()) + target();
}

} // namespace Tuner
