#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "util/strings.hpp"

namespace core {

inline constexpr int kDefaultMaxDepth = 30;
inline constexpr std::string_view kDefaultDiffTemplate = "Field: %s, A: %s, B: %s";

// Session-level settings that survive reset().
struct DiffConfig {
    // Traversal aborts once record nesting (plus dynamic object nesting) passes this depth.
    int max_depth{kDefaultMaxDepth};

    // Line template for rendering: exactly three %s (or %v) slots for path, A and B.
    std::string diff_template{kDefaultDiffTemplate};
};

[[nodiscard]] inline DiffConfig default_diff_config() {
    return DiffConfig{};
}

// Throws std::invalid_argument on a negative depth or a template without exactly three slots.
inline void validate_diff_config(const DiffConfig& config) {
    if (config.max_depth < 0) {
        throw std::invalid_argument("DiffConfig max_depth must be >= 0");
    }
    if (util::count_template_slots(config.diff_template) != 3) {
        throw std::invalid_argument("DiffConfig diff_template must contain exactly 3 slots: " +
                                    config.diff_template);
    }
}

} // namespace core
