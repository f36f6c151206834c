#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "core/errors.hpp"
#include "core/path_pattern.hpp"
#include "model/adapters.hpp"
#include "model/value.hpp"

namespace core {

// Outcome contract for custom comparators.
enum class DiffKind : std::uint8_t {
    NoDiff,     // values agree; nothing recorded
    LengthDiff, // record both lengths under <path>[Length]
    NilDiff,    // record both presence markers
    ElemDiff    // record the renderings supplied in CompareOutcome
};

const char* diff_kind_name(DiffKind kind) noexcept;

struct CompareOutcome {
    DiffKind kind{DiffKind::NoDiff};
    std::string a{};
    std::string b{};
};

// Replaces structural descent for every path it matches.
class Comparator {
public:
    virtual ~Comparator() = default;
    virtual bool match(std::string_view path) const = 0;
    virtual CompareOutcome equals(const model::Value& a, const model::Value& b) const = 0;
};

// Orders sequence elements before index-by-index descent at matched paths.
class Sorter {
public:
    virtual ~Sorter() = default;
    virtual bool match(std::string_view path) const = 0;
    // Strict weak ordering over elements of the matched sequence.
    virtual bool less(const model::Value& a, const model::Value& b) const = 0;
};

struct TrimRule {
    PathPattern pattern;
    std::string cutset;
};

using CompareFn = std::function<CompareOutcome(const model::Value&, const model::Value&)>;
using LessFn = std::function<bool(const model::Value&, const model::Value&)>;

class PatternComparator final : public Comparator {
public:
    PatternComparator(std::string_view expr, CompareFn fn);

    bool match(std::string_view path) const override { return pattern_.matches(path); }
    CompareOutcome equals(const model::Value& a, const model::Value& b) const override;

private:
    PathPattern pattern_;
    CompareFn fn_;
};

class PatternSorter final : public Sorter {
public:
    PatternSorter(std::string_view expr, LessFn fn);

    bool match(std::string_view path) const override { return pattern_.matches(path); }
    bool less(const model::Value& a, const model::Value& b) const override { return fn_(a, b); }

private:
    PathPattern pattern_;
    LessFn fn_;
};

std::shared_ptr<Comparator> make_comparator(std::string_view expr, CompareFn fn);
std::shared_ptr<Sorter> make_sorter(std::string_view expr, LessFn fn);

namespace detail {

template <typename T>
const T& typed_side(const model::Value& v, const char* role) {
    const T* p = v.get_if<T>();
    if (p == nullptr) {
        throw DiffError(ErrorCode::TypeMismatch, {},
                        std::string(role) + " expects " + model::type_label(model::adapter_for<T>()) + ", got " +
                            v.type_label());
    }
    return *p;
}

} // namespace detail

// Comparator over values of a known type. fn is called as fn(const T&, const T&)
// and returns a CompareOutcome. Matching a value of another type raises TypeMismatch.
template <typename T, typename Fn>
std::shared_ptr<Comparator> make_typed_comparator(std::string_view expr, Fn fn) {
    return make_comparator(expr, [fn = std::move(fn)](const model::Value& a, const model::Value& b) {
        return fn(detail::typed_side<T>(a, "comparator"), detail::typed_side<T>(b, "comparator"));
    });
}

// Sorter over elements of a known type; fn is called as fn(const T&, const T&).
template <typename T, typename Fn>
std::shared_ptr<Sorter> make_typed_sorter(std::string_view expr, Fn fn) {
    return make_sorter(expr, [fn = std::move(fn)](const model::Value& a, const model::Value& b) {
        return fn(detail::typed_side<T>(a, "sorter"), detail::typed_side<T>(b, "sorter"));
    });
}

} // namespace core
