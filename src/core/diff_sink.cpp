#include "core/diff_sink.hpp"

#include <regex>
#include <utility>

#include "util/log.hpp"

namespace core {

const char* filter_mode_name(FilterMode mode) noexcept {
    switch (mode) {
    case FilterMode::Unrestricted: return "unrestricted";
    case FilterMode::Include: return "include";
    case FilterMode::Exclude: return "exclude";
    }
    return "unknown";
}

void DiffSink::set_includes(std::vector<PathPattern> patterns) {
    includes_ = std::move(patterns);
}

bool DiffSink::set_excludes(std::vector<PathPattern> patterns) {
    if (!includes_.empty()) {
        STRUCTDIFF_LOG_DEBUG("DiffSink: exclude patterns ignored while %zu include patterns are set",
                             includes_.size());
        return false;
    }
    excludes_ = std::move(patterns);
    return true;
}

FilterMode DiffSink::mode() const noexcept {
    if (!includes_.empty()) {
        return FilterMode::Include;
    }
    if (!excludes_.empty()) {
        return FilterMode::Exclude;
    }
    return FilterMode::Unrestricted;
}

bool DiffSink::admits(std::string_view path) const {
    switch (mode()) {
    case FilterMode::Include:
        return any_matches(includes_, path);
    case FilterMode::Exclude:
        return !any_matches(excludes_, path);
    case FilterMode::Unrestricted:
        return true;
    }
    return true;
}

bool DiffSink::record(std::string path, std::string a, std::string b) {
    if (!admits(path)) {
        ++filtered_;
        return false;
    }
    ++accepted_;
    const auto it = index_.find(path);
    if (it != index_.end()) {
        auto& existing = records_[it->second];
        existing.a = std::move(a);
        existing.b = std::move(b);
        return true;
    }
    index_.emplace(path, records_.size());
    records_.push_back(DiffRecord{std::move(path), std::move(a), std::move(b)});
    return true;
}

const DiffRecord* DiffSink::find(std::string_view path) const {
    const auto it = index_.find(std::string(path));
    if (it == index_.end()) {
        return nullptr;
    }
    return &records_[it->second];
}

std::vector<DiffRecord> DiffSink::find_matching(std::string_view expr) const {
    std::vector<DiffRecord> out;
    try {
        const PathPattern pattern(expr);
        for (const auto& rec : records_) {
            if (pattern.matches(rec.path)) {
                out.push_back(rec);
            }
        }
    } catch (const std::regex_error& e) {
        STRUCTDIFF_LOG_WARN("DiffSink: unusable lookup pattern '%.*s': %s",
                            static_cast<int>(expr.size()), expr.data(), e.what());
        out.clear();
    }
    return out;
}

std::string DiffSink::render(std::string_view tmpl) const {
    std::string out;
    for (const auto& rec : records_) {
        out += rec.to_string(tmpl);
        out += '\n';
    }
    return out;
}

void DiffSink::clear() noexcept {
    records_.clear();
    index_.clear();
    accepted_ = 0;
    filtered_ = 0;
}

void DiffSink::clear_filters() noexcept {
    includes_.clear();
    excludes_.clear();
}

} // namespace core
