#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/diff_config.hpp"
#include "core/diff_record.hpp"
#include "core/diff_sink.hpp"
#include "core/diff_stats.hpp"
#include "core/errors.hpp"
#include "core/rules.hpp"
#include "core/traversal.hpp"
#include "model/adapters.hpp"

namespace core {

// One configured comparison engine. Configure with the chained setters, run
// compare(), then query. Results accumulate across compare() calls until
// reset(). compare() throws DiffError on any structural anomaly (see
// core/errors.hpp); configuration setters throw std::invalid_argument or
// std::regex_error on unusable input.
//
//   core::DiffSession session;
//   session.exclude({R"(\.UpdatedAt$)"})
//          .with_trim_space({R"(\.Comment$)"})
//          .compare(expected, actual);
//   if (!session.empty()) std::cerr << session.render();
//
// Not thread-safe; use one session per thread.
class DiffSession {
public:
    DiffSession();
    explicit DiffSession(DiffConfig config);

    DiffSession& with_max_depth(int depth);
    DiffSession& with_template(std::string tmpl);

    // Replaces the exclude list. Has no effect once include patterns are set.
    DiffSession& exclude(const std::vector<std::string>& patterns);
    // Replaces the include list; only matching paths are recorded afterwards.
    DiffSession& include(const std::vector<std::string>& patterns);

    DiffSession& with_comparator(std::shared_ptr<Comparator> comparator);
    DiffSession& with_sorter(std::shared_ptr<Sorter> sorter);
    DiffSession& with_trim(std::string_view pattern, std::string cutset);
    DiffSession& with_trim_space(const std::vector<std::string>& patterns);

    template <typename A, typename B>
    DiffSession& compare(const A& a, const B& b) {
        return compare_values(model::Value::of(a), model::Value::of(b));
    }

    DiffSession& compare_values(const model::Value& a, const model::Value& b);

    const DiffRecord* find(std::string_view path) const { return sink_.find(path); }
    std::vector<DiffRecord> find_matching(std::string_view pattern) const {
        return sink_.find_matching(pattern);
    }
    const std::vector<DiffRecord>& records() const noexcept { return sink_.records(); }

    std::string render() const { return sink_.render(config_.diff_template); }
    std::string render(std::string_view tmpl) const { return sink_.render(tmpl); }

    bool empty() const noexcept { return sink_.empty(); }
    std::size_t size() const noexcept { return sink_.size(); }
    FilterMode filter_mode() const noexcept { return sink_.mode(); }
    DiffStats stats() const noexcept;

    const DiffConfig& config() const noexcept { return config_; }

    // Clears results, statistics, filters, comparators, sorters and trim
    // rules. Depth limit and template are kept.
    DiffSession& reset();

private:
    DiffConfig config_;
    TraversalRules rules_;
    DiffSink sink_;
    DiffStats stats_;
};

} // namespace core
