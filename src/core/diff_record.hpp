#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace core {

// One disagreement between A and B. a and b hold renderings, not values.
struct DiffRecord {
    std::string path;
    std::string a;
    std::string b;

    std::string to_string(std::string_view tmpl) const;

    bool operator==(const DiffRecord& other) const {
        return path == other.path && a == other.a && b == other.b;
    }
    bool operator!=(const DiffRecord& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const DiffRecord& rec);

} // namespace core
