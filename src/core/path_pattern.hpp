#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// ECMAScript regular expression matched anywhere inside a field path; anchor
// with ^ and $ for whole-path matches.
class PathPattern {
public:
    // Throws std::regex_error on a malformed expression.
    explicit PathPattern(std::string_view expr);

    bool matches(std::string_view path) const;
    const std::string& source() const noexcept { return source_; }

private:
    std::string source_;
    std::regex regex_;
};

std::vector<PathPattern> compile_patterns(const std::vector<std::string>& exprs);

bool any_matches(const std::vector<PathPattern>& patterns, std::string_view path);

} // namespace core
