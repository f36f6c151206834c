#include "core/traversal.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

#include "core/errors.hpp"
#include "core/field_path.hpp"
#include "util/strings.hpp"

namespace core {
namespace {

using model::Kind;
using model::Value;

void record_presence(const std::string& path, const Value& a, const Value& b, DiffSink& sink) {
    sink.record(path,
                std::string(a.is_null() ? kNullMarker : kNotNullMarker),
                std::string(b.is_null() ? kNullMarker : kNotNullMarker));
}

void record_length(const std::string& path, const Value& a, const Value& b, DiffSink& sink) {
    sink.record(path + std::string(kLengthSuffix),
                util::format_integer(a.size()),
                util::format_integer(b.size()));
}

const Sorter* find_sorter(const TraversalRules& rules, const std::string& path) {
    for (const auto& s : rules.sorters) {
        if (s->match(path)) {
            return s.get();
        }
    }
    return nullptr;
}

// Errors raised by user rules without a position get the current path.
[[noreturn]] void rethrow_at(const DiffError& e, const std::string& path) {
    if (!e.path().empty()) {
        throw;
    }
    throw DiffError(e.code(), path, e.detail());
}

// Reordered working copy of a sequence's elements; the sequence itself is untouched.
std::vector<Value> sorted_elements(const Value& seq, const Sorter& sorter, const std::string& path) {
    std::vector<Value> out;
    const std::size_t n = seq.size();
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(seq.element(i));
    }
    try {
        std::stable_sort(out.begin(), out.end(), [&sorter](const Value& x, const Value& y) {
            return sorter.less(x, y);
        });
    } catch (const DiffError& e) {
        rethrow_at(e, path);
    }
    return out;
}

CompareOutcome invoke_comparator(const Comparator& c, const Value& a, const Value& b, const std::string& path) {
    try {
        return c.equals(a, b);
    } catch (const DiffError& e) {
        rethrow_at(e, path);
    }
}

// Returns true when a comparator claimed the position.
bool apply_comparator(const Value& a,
                      const Value& b,
                      const std::string& path,
                      const TraversalRules& rules,
                      DiffSink& sink) {
    for (const auto& c : rules.comparators) {
        if (!c->match(path)) {
            continue;
        }
        const std::string custom_path = path + std::string(kComparatorSuffix);
        CompareOutcome outcome = invoke_comparator(*c, a, b, path);
        switch (outcome.kind) {
        case DiffKind::NoDiff:
            break;
        case DiffKind::LengthDiff:
            if (!a.sized()) {
                throw DiffError(ErrorCode::ProtocolViolation, custom_path,
                                std::string("LengthDiff returned for a ") + model::kind_name(a.kind()) +
                                    " value without length");
            }
            record_length(custom_path, a, b, sink);
            break;
        case DiffKind::NilDiff:
            if (!a.nullable()) {
                throw DiffError(ErrorCode::ProtocolViolation, custom_path,
                                std::string("NilDiff returned for a ") + model::kind_name(a.kind()) +
                                    " value that cannot be absent");
            }
            record_presence(custom_path, a, b, sink);
            break;
        case DiffKind::ElemDiff:
            sink.record(custom_path, std::move(outcome.a), std::move(outcome.b));
            break;
        default:
            throw DiffError(ErrorCode::ProtocolViolation, custom_path,
                            "unexpected outcome code " +
                                util::format_integer(static_cast<int>(outcome.kind)));
        }
        return true;
    }
    return false;
}

void walk_fixed_array(const Value& a, const Value& b, const std::string& path, int depth,
                      const TraversalRules& rules, DiffSink& sink, DiffStats& stats) {
    const std::size_t n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        walk(a.element(i), b.element(i), index_segment(path, i), depth, rules, sink, stats);
    }
}

void walk_sequence(const Value& a, const Value& b, const std::string& path, int depth,
                   const TraversalRules& rules, DiffSink& sink, DiffStats& stats) {
    if (a.is_null() != b.is_null()) {
        record_presence(path, a, b, sink);
        return;
    }
    const std::size_t len_a = a.size();
    const std::size_t len_b = b.size();
    if (len_a != len_b) {
        record_length(path, a, b, sink);
    }
    if (a.storage() == b.storage()) {
        return;
    }
    const std::size_t n = std::min(len_a, len_b);
    const Sorter* sorter = find_sorter(rules, path);
    if (sorter == nullptr) {
        for (std::size_t i = 0; i < n; ++i) {
            walk(a.element(i), b.element(i), index_segment(path, i), depth, rules, sink, stats);
        }
        return;
    }
    const auto sorted_a = sorted_elements(a, *sorter, path);
    const auto sorted_b = sorted_elements(b, *sorter, path);
    for (std::size_t i = 0; i < n; ++i) {
        walk(sorted_a[i], sorted_b[i], index_segment(path, i), depth, rules, sink, stats);
    }
}

void walk_dynamic(const Value& a, const Value& b, const std::string& path, int depth,
                  const TraversalRules& rules, DiffSink& sink, DiffStats& stats) {
    const bool a_null = a.is_null();
    const bool b_null = b.is_null();
    if (a_null != b_null) {
        record_presence(path, a, b, sink);
        return;
    }
    if (a_null) {
        return;
    }
    const Value pa = a.payload();
    if (!pa.valid()) {
        throw DiffError(ErrorCode::UnsupportedValue, path, "A holds " + a.render());
    }
    const Value pb = b.payload();
    if (!pb.valid()) {
        throw DiffError(ErrorCode::UnsupportedValue, path, "B holds " + b.render());
    }
    // Objects behind a dynamic node cost one extra level.
    const int next_depth = pa.kind() == Kind::Map ? depth + 1 : depth;
    walk(pa, pb, path, next_depth, rules, sink, stats);
}

void walk_nullable(const Value& a, const Value& b, const std::string& path, int depth,
                   const TraversalRules& rules, DiffSink& sink, DiffStats& stats) {
    if (a.is_null() != b.is_null()) {
        record_presence(path, a, b, sink);
        return;
    }
    if (a.storage() == b.storage()) {
        return;
    }
    walk(a.deref(), b.deref(), path, depth, rules, sink, stats);
}

void walk_record(const Value& a, const Value& b, const std::string& path, int depth,
                 const TraversalRules& rules, DiffSink& sink, DiffStats& stats) {
    const auto fields_a = a.fields();
    const auto fields_b = b.fields();
    if (fields_a.size() != fields_b.size()) {
        throw DiffError(ErrorCode::InvalidValue, path,
                        "introspection produced " + util::format_integer(fields_a.size()) + " and " +
                            util::format_integer(fields_b.size()) + " fields");
    }
    for (std::size_t i = 0; i < fields_a.size(); ++i) {
        walk(fields_a[i].value, fields_b[i].value, field_segment(path, fields_a[i].name), depth + 1,
             rules, sink, stats);
    }
}

void walk_map(const Value& a, const Value& b, const std::string& path, int depth,
              const TraversalRules& rules, DiffSink& sink, DiffStats& stats) {
    if (a.is_null() != b.is_null()) {
        record_presence(path, a, b, sink);
        return;
    }
    if (a.size() != b.size()) {
        record_length(path, a, b, sink);
    }
    for (const auto& key : a.keys()) {
        walk(a.lookup(key), b.lookup(key), key_segment(path, key.render()), depth, rules, sink, stats);
    }
}

void compare_scalar(const Value& a, const Value& b, const std::string& path,
                    const TraversalRules& rules, DiffSink& sink, DiffStats& stats) {
    ++stats.leaves_compared;
    if (a.textual()) {
        for (const auto& t : rules.trims) {
            if (t.pattern.matches(path)) {
                if (util::trim_cutset(a.text(), t.cutset) != util::trim_cutset(b.text(), t.cutset)) {
                    sink.record(path, a.render(), b.render());
                }
                return;
            }
        }
        for (const auto& p : rules.trim_spaces) {
            if (p.matches(path)) {
                if (util::trim_space(a.text()) != util::trim_space(b.text())) {
                    sink.record(path, a.render(), b.render());
                }
                return;
            }
        }
    }
    if (!a.equals(b)) {
        sink.record(path, a.render(), b.render());
    }
}

} // namespace

std::string root_path(const model::Value& v) {
    if (!v.valid()) {
        return std::string(kRootMarker);
    }
    std::string_view name = v.type_name();
    if (v.kind() == Kind::Nullable) {
        const auto* target = v.adapter().target();
        name = target != nullptr ? target->name() : std::string_view{};
    }
    return root_segment(name);
}

void walk(const model::Value& a,
          const model::Value& b,
          const std::string& path,
          int depth,
          const TraversalRules& rules,
          DiffSink& sink,
          DiffStats& stats) {
    if (depth > rules.max_depth) {
        throw DiffError(ErrorCode::DepthExceeded, path,
                        "depth " + util::format_integer(depth) + " exceeds limit " +
                            util::format_integer(rules.max_depth));
    }
    if (!a.valid() || !b.valid()) {
        throw DiffError(ErrorCode::InvalidValue, path,
                        std::string(!a.valid() ? "A" : "B") + " side is absent");
    }
    if (!a.same_type(b)) {
        throw DiffError(ErrorCode::TypeMismatch, path,
                        "A is " + a.type_label() + ", B is " + b.type_label());
    }
    ++stats.positions_visited;

    if (apply_comparator(a, b, path, rules, sink)) {
        return;
    }

    switch (a.kind()) {
    case Kind::FixedArray:
        walk_fixed_array(a, b, path, depth, rules, sink, stats);
        return;
    case Kind::Sequence:
        walk_sequence(a, b, path, depth, rules, sink, stats);
        return;
    case Kind::Dynamic:
        walk_dynamic(a, b, path, depth, rules, sink, stats);
        return;
    case Kind::Nullable:
        walk_nullable(a, b, path, depth, rules, sink, stats);
        return;
    case Kind::Record:
        walk_record(a, b, path, depth, rules, sink, stats);
        return;
    case Kind::Map:
        walk_map(a, b, path, depth, rules, sink, stats);
        return;
    case Kind::Scalar:
        compare_scalar(a, b, path, rules, sink, stats);
        return;
    }
}

} // namespace core
