#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "util/strings.hpp"

namespace core {

inline constexpr std::string_view kRootMarker = "$";
inline constexpr std::string_view kLengthSuffix = "[Length]";
inline constexpr std::string_view kComparatorSuffix = ".$[customized]";
inline constexpr std::string_view kNullMarker = "<nil>";
inline constexpr std::string_view kNotNullMarker = "<not nil>";

inline std::string field_segment(const std::string& path, std::string_view field) {
    std::string out;
    out.reserve(path.size() + field.size() + 1);
    out += path;
    out += '.';
    out += field;
    return out;
}

inline std::string index_segment(const std::string& path, std::size_t index) {
    std::string out = path;
    out += '[';
    out += util::format_integer(index);
    out += ']';
    return out;
}

inline std::string key_segment(const std::string& path, std::string_view key) {
    std::string out;
    out.reserve(path.size() + key.size() + 2);
    out += path;
    out += '[';
    out += key;
    out += ']';
    return out;
}

inline std::string root_segment(std::string_view declared_name) {
    if (util::trim_space(declared_name).empty()) {
        return std::string(kRootMarker);
    }
    return std::string(declared_name);
}

} // namespace core
