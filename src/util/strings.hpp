#pragma once

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>

namespace util {

// Strips leading and trailing Unicode whitespace from UTF-8 text.
std::string_view trim_space(std::string_view s) noexcept;

// Strips leading and trailing characters contained in cutset.
std::string_view trim_cutset(std::string_view s, std::string_view cutset) noexcept;

// Diff templates carry positional slots written as %s or %v; %% is a literal percent.
std::size_t count_template_slots(std::string_view tmpl) noexcept;

// Substitutes the three slots in order. Slots beyond the third are left as written.
std::string format_template(std::string_view tmpl,
                            std::string_view first,
                            std::string_view second,
                            std::string_view third);

// Shortest round-trip representation.
std::string format_double(double v);

template <typename Int>
std::string format_integer(Int v) {
    static_assert(std::is_integral_v<Int>, "format_integer requires an integral type");
    char buf[32];
    const auto res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}

} // namespace util
