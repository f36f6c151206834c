#include "core/rules.hpp"

#include <stdexcept>

namespace core {

const char* diff_kind_name(DiffKind kind) noexcept {
    switch (kind) {
    case DiffKind::NoDiff: return "NoDiff";
    case DiffKind::LengthDiff: return "LengthDiff";
    case DiffKind::NilDiff: return "NilDiff";
    case DiffKind::ElemDiff: return "ElemDiff";
    }
    return "Invalid";
}

PatternComparator::PatternComparator(std::string_view expr, CompareFn fn)
    : pattern_(expr), fn_(std::move(fn)) {
    if (!fn_) {
        throw std::invalid_argument("PatternComparator requires a callable");
    }
}

CompareOutcome PatternComparator::equals(const model::Value& a, const model::Value& b) const {
    return fn_(a, b);
}

PatternSorter::PatternSorter(std::string_view expr, LessFn fn)
    : pattern_(expr), fn_(std::move(fn)) {
    if (!fn_) {
        throw std::invalid_argument("PatternSorter requires a callable");
    }
}

std::shared_ptr<Comparator> make_comparator(std::string_view expr, CompareFn fn) {
    return std::make_shared<PatternComparator>(expr, std::move(fn));
}

std::shared_ptr<Sorter> make_sorter(std::string_view expr, LessFn fn) {
    return std::make_shared<PatternSorter>(expr, std::move(fn));
}

} // namespace core
