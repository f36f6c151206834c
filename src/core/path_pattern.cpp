#include "core/path_pattern.hpp"

namespace core {

PathPattern::PathPattern(std::string_view expr)
    : source_(expr), regex_(source_, std::regex::ECMAScript) {}

bool PathPattern::matches(std::string_view path) const {
    return std::regex_search(path.begin(), path.end(), regex_);
}

std::vector<PathPattern> compile_patterns(const std::vector<std::string>& exprs) {
    std::vector<PathPattern> out;
    out.reserve(exprs.size());
    for (const auto& expr : exprs) {
        out.emplace_back(expr);
    }
    return out;
}

bool any_matches(const std::vector<PathPattern>& patterns, std::string_view path) {
    for (const auto& p : patterns) {
        if (p.matches(path)) {
            return true;
        }
    }
    return false;
}

} // namespace core
