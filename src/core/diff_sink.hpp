#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/diff_record.hpp"
#include "core/path_pattern.hpp"

namespace core {

enum class FilterMode : std::uint8_t {
    Unrestricted, // every difference is kept
    Include,      // only paths matching an include pattern are kept
    Exclude       // paths matching an exclude pattern are dropped
};

const char* filter_mode_name(FilterMode mode) noexcept;

// Accumulates difference records keyed by field path, in insertion order.
// Recording at a path that is already present replaces that record in place.
// Not thread-safe.
class DiffSink {
public:
    // Replaces the include list. A non-empty list makes exclude patterns inert.
    void set_includes(std::vector<PathPattern> patterns);

    // Replaces the exclude list. Ignored (returns false) while includes are set.
    bool set_excludes(std::vector<PathPattern> patterns);

    // Mode is derived from the configured lists, never stored.
    FilterMode mode() const noexcept;

    // Returns false when the active filter drops the path.
    bool record(std::string path, std::string a, std::string b);

    const DiffRecord* find(std::string_view path) const;

    // Invalid expressions yield no records.
    std::vector<DiffRecord> find_matching(std::string_view expr) const;

    const std::vector<DiffRecord>& records() const noexcept { return records_; }

    // One line per record, each terminated by '\n'.
    std::string render(std::string_view tmpl) const;

    std::size_t size() const noexcept { return records_.size(); }
    bool empty() const noexcept { return records_.empty(); }

    std::uint64_t accepted() const noexcept { return accepted_; }
    std::uint64_t filtered() const noexcept { return filtered_; }

    // Drops records and counters, keeps filters.
    void clear() noexcept;
    void clear_filters() noexcept;

private:
    bool admits(std::string_view path) const;

    std::vector<PathPattern> includes_;
    std::vector<PathPattern> excludes_;
    std::vector<DiffRecord> records_;
    std::unordered_map<std::string, std::size_t> index_;
    std::uint64_t accepted_{0};
    std::uint64_t filtered_{0};
};

} // namespace core
