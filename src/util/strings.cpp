#include "util/strings.hpp"

#include <cmath>
#include <system_error>

namespace util {

namespace {

bool ascii_space(unsigned char c) noexcept {
    return c == ' ' || (c >= '\t' && c <= '\r');
}

// Byte length of the whitespace code point starting at s[i], 0 when s[i] does
// not start one. Covers the Unicode White_Space set in UTF-8.
std::size_t space_width(std::string_view s, std::size_t i) noexcept {
    const auto byte = [&s](std::size_t k) { return static_cast<unsigned char>(s[k]); };
    const unsigned char c = byte(i);
    if (ascii_space(c)) {
        return 1;
    }
    const std::size_t left = s.size() - i;
    if (c == 0xC2 && left >= 2) {
        const unsigned char c1 = byte(i + 1);
        return (c1 == 0x85 || c1 == 0xA0) ? 2 : 0;
    }
    if (left < 3) {
        return 0;
    }
    const unsigned char c1 = byte(i + 1);
    const unsigned char c2 = byte(i + 2);
    switch (c) {
    case 0xE1: // U+1680
        return (c1 == 0x9A && c2 == 0x80) ? 3 : 0;
    case 0xE2: // U+2000..U+200A, U+2028, U+2029, U+202F, U+205F
        if (c1 == 0x80) {
            return ((c2 >= 0x80 && c2 <= 0x8A) || c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF) ? 3 : 0;
        }
        return (c1 == 0x81 && c2 == 0x9F) ? 3 : 0;
    case 0xE3: // U+3000
        return (c1 == 0x80 && c2 == 0x80) ? 3 : 0;
    default:
        return 0;
    }
}

// Byte length of the whitespace code point ending just before s[end].
std::size_t trailing_space_width(std::string_view s, std::size_t begin, std::size_t end) noexcept {
    for (std::size_t w = 1; w <= 3 && w <= end - begin; ++w) {
        if (space_width(s.substr(0, end), end - w) == w) {
            return w;
        }
    }
    return 0;
}

} // namespace

std::string_view trim_space(std::string_view s) noexcept {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end) {
        const std::size_t w = space_width(s.substr(0, end), begin);
        if (w == 0) {
            break;
        }
        begin += w;
    }
    while (end > begin) {
        const std::size_t w = trailing_space_width(s, begin, end);
        if (w == 0) {
            break;
        }
        end -= w;
    }
    return s.substr(begin, end - begin);
}

std::string_view trim_cutset(std::string_view s, std::string_view cutset) noexcept {
    if (cutset.empty()) {
        return s;
    }
    const auto begin = s.find_first_not_of(cutset);
    if (begin == std::string_view::npos) {
        return s.substr(s.size());
    }
    const auto end = s.find_last_not_of(cutset);
    return s.substr(begin, end - begin + 1);
}

std::size_t count_template_slots(std::string_view tmpl) noexcept {
    std::size_t slots = 0;
    for (std::size_t i = 0; i + 1 < tmpl.size(); ++i) {
        if (tmpl[i] != '%') {
            continue;
        }
        const char next = tmpl[i + 1];
        if (next == 's' || next == 'v') {
            ++slots;
        }
        ++i; // skip the conversion character, including "%%"
    }
    return slots;
}

std::string format_template(std::string_view tmpl,
                            std::string_view first,
                            std::string_view second,
                            std::string_view third) {
    const std::string_view args[3] = {first, second, third};
    std::size_t next_arg = 0;
    std::string out;
    out.reserve(tmpl.size() + first.size() + second.size() + third.size());
    for (std::size_t i = 0; i < tmpl.size(); ++i) {
        const char c = tmpl[i];
        if (c != '%' || i + 1 >= tmpl.size()) {
            out.push_back(c);
            continue;
        }
        const char next = tmpl[i + 1];
        if (next == '%') {
            out.push_back('%');
            ++i;
        } else if ((next == 's' || next == 'v') && next_arg < 3) {
            out.append(args[next_arg++]);
            ++i;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string format_double(double v) {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v < 0 ? "-Inf" : "+Inf";
    }
    char buf[64];
    const auto res = std::to_chars(buf, buf + sizeof(buf), v);
    if (res.ec != std::errc()) {
        return "?";
    }
    return std::string(buf, res.ptr);
}

} // namespace util
