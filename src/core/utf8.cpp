#include "core/utf8.hpp"

namespace redactkit::utf8 {

namespace {

constexpr bool is_continuation(unsigned char b) noexcept {
    return (b & 0xC0) == 0x80;
}

} // anonymous namespace

size_t sequence_length(std::string_view s, size_t pos) noexcept {
    const auto b0 = static_cast<unsigned char>(s[pos]);
    if (b0 < 0x80) return 1;

    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        if (b0 == 0xE0) lo = 0xA0;   // overlong
        if (b0 == 0xED) hi = 0x9F;   // surrogates
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        if (b0 == 0xF0) lo = 0x90;   // overlong
        if (b0 == 0xF4) hi = 0x8F;   // > U+10FFFF
    } else {
        return 1;
    }

    if (pos + len > s.size()) return 1;

    const auto b1 = static_cast<unsigned char>(s[pos + 1]);
    if (b1 < lo || b1 > hi) return 1;
    for (size_t i = 2; i < len; ++i) {
        if (!is_continuation(static_cast<unsigned char>(s[pos + i]))) return 1;
    }
    return len;
}

size_t scalar_count(std::string_view s) noexcept {
    size_t count = 0;
    for (size_t pos = 0; pos < s.size(); pos += sequence_length(s, pos)) {
        ++count;
    }
    return count;
}

size_t byte_offset(std::string_view s, size_t index) noexcept {
    size_t pos = 0;
    for (size_t i = 0; i < index && pos < s.size(); ++i) {
        pos += sequence_length(s, pos);
    }
    return pos;
}

size_t encoded_length(char32_t codepoint) noexcept {
    if (codepoint <= 0x7F) return 1;
    if (codepoint <= 0x7FF) return 2;
    if (codepoint <= 0xFFFF) return 3;
    if (codepoint <= 0x10FFFF) return 4;
    return 3;   // replacement character
}

void append(std::string& out, char32_t codepoint) {
    auto append_replacement = [&]() { out.append("\xEF\xBF\xBD"); };
    if (codepoint <= 0x7F) {
        out.push_back(static_cast<char>(codepoint));
        return;
    }
    if (codepoint <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        return;
    }
    if (codepoint <= 0xFFFF) {
        if (codepoint >= 0xD800 && codepoint <= 0xDFFF) {
            append_replacement();
            return;
        }
        out.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        return;
    }
    if (codepoint <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        return;
    }
    append_replacement();
}

bool decode_single(std::string_view s, char32_t& codepoint) noexcept {
    if (s.empty()) return false;
    const size_t len = sequence_length(s, 0);
    if (len != s.size()) return false;

    const auto b0 = static_cast<unsigned char>(s[0]);
    if (len == 1) {
        if (b0 >= 0x80) return false;
        codepoint = b0;
        return true;
    }

    char32_t cp = 0;
    switch (len) {
        case 2: cp = b0 & 0x1F; break;
        case 3: cp = b0 & 0x0F; break;
        default: cp = b0 & 0x07; break;
    }
    for (size_t i = 1; i < len; ++i) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[i]) & 0x3F);
    }
    codepoint = cp;
    return true;
}

} // namespace redactkit::utf8
