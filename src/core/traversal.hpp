#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/diff_config.hpp"
#include "core/diff_sink.hpp"
#include "core/diff_stats.hpp"
#include "core/path_pattern.hpp"
#include "core/rules.hpp"
#include "model/value.hpp"

namespace core {

// Overrides consulted during descent. First match wins within each list.
struct TraversalRules {
    int max_depth{kDefaultMaxDepth};
    std::vector<std::shared_ptr<Comparator>> comparators;
    std::vector<std::shared_ptr<Sorter>> sorters;
    std::vector<TrimRule> trims;            // trim by cutset, consulted first
    std::vector<PathPattern> trim_spaces;   // trim whitespace

    void clear_overrides() noexcept {
        comparators.clear();
        sorters.clear();
        trims.clear();
        trim_spaces.clear();
    }
};

// Root field path: the declared name of the value (of the referent for
// nullable roots), or "$" for anonymous types.
std::string root_path(const model::Value& v);

// Walks a and b in lockstep from path at the given depth, writing every
// disagreement into sink. Throws DiffError on any structural anomaly; the sink
// may then hold a partial result.
void walk(const model::Value& a,
          const model::Value& b,
          const std::string& path,
          int depth,
          const TraversalRules& rules,
          DiffSink& sink,
          DiffStats& stats);

} // namespace core
