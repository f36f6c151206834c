#include "core/diff_session.hpp"

#include <stdexcept>
#include <utility>

#include "core/field_path.hpp"
#include "util/log.hpp"

namespace core {

DiffSession::DiffSession() : DiffSession(default_diff_config()) {}

DiffSession::DiffSession(DiffConfig config) : config_(std::move(config)) {
    validate_diff_config(config_);
    rules_.max_depth = config_.max_depth;
}

DiffSession& DiffSession::with_max_depth(int depth) {
    if (depth < 0) {
        throw std::invalid_argument("DiffSession max depth must be >= 0");
    }
    config_.max_depth = depth;
    rules_.max_depth = depth;
    return *this;
}

DiffSession& DiffSession::with_template(std::string tmpl) {
    if (util::count_template_slots(tmpl) != 3) {
        throw std::invalid_argument("DiffSession template must contain exactly 3 slots: " + tmpl);
    }
    config_.diff_template = std::move(tmpl);
    return *this;
}

DiffSession& DiffSession::exclude(const std::vector<std::string>& patterns) {
    sink_.set_excludes(compile_patterns(patterns));
    return *this;
}

DiffSession& DiffSession::include(const std::vector<std::string>& patterns) {
    sink_.set_includes(compile_patterns(patterns));
    return *this;
}

DiffSession& DiffSession::with_comparator(std::shared_ptr<Comparator> comparator) {
    if (!comparator) {
        throw std::invalid_argument("DiffSession comparator must not be null");
    }
    rules_.comparators.push_back(std::move(comparator));
    return *this;
}

DiffSession& DiffSession::with_sorter(std::shared_ptr<Sorter> sorter) {
    if (!sorter) {
        throw std::invalid_argument("DiffSession sorter must not be null");
    }
    rules_.sorters.push_back(std::move(sorter));
    return *this;
}

DiffSession& DiffSession::with_trim(std::string_view pattern, std::string cutset) {
    rules_.trims.push_back(TrimRule{PathPattern(pattern), std::move(cutset)});
    return *this;
}

DiffSession& DiffSession::with_trim_space(const std::vector<std::string>& patterns) {
    for (auto& p : compile_patterns(patterns)) {
        rules_.trim_spaces.push_back(std::move(p));
    }
    return *this;
}

DiffSession& DiffSession::compare_values(const model::Value& a, const model::Value& b) {
    ++stats_.comparisons;
    if (!a.valid() || !b.valid()) {
        throw DiffError(ErrorCode::InvalidValue, std::string(kRootMarker),
                        std::string(!a.valid() ? "A" : "B") + " side is absent");
    }
    if (!a.same_type(b)) {
        throw DiffError(ErrorCode::TypeMismatch, std::string(kRootMarker),
                        "A is " + a.type_label() + ", B is " + b.type_label());
    }
    const std::string root = root_path(a);
    STRUCTDIFF_LOG_DEBUG("DiffSession: compare root=%s max_depth=%d filter=%s",
                         root.c_str(), rules_.max_depth, filter_mode_name(sink_.mode()));
    try {
        walk(a, b, root, 0, rules_, sink_, stats_);
    } catch (const DiffError& e) {
        STRUCTDIFF_LOG_ERROR("DiffSession: comparison aborted: %s", e.what());
        throw;
    }
    STRUCTDIFF_LOG_DEBUG("DiffSession: compare root=%s done, %zu differences",
                         root.c_str(), sink_.size());
    return *this;
}

DiffStats DiffSession::stats() const noexcept {
    DiffStats out = stats_;
    out.differences_recorded = sink_.accepted();
    out.differences_filtered = sink_.filtered();
    return out;
}

DiffSession& DiffSession::reset() {
    sink_.clear();
    sink_.clear_filters();
    rules_.clear_overrides();
    stats_ = {};
    return *this;
}

} // namespace core
