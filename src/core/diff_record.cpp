#include "core/diff_record.hpp"

#include "core/diff_config.hpp"
#include "util/strings.hpp"

namespace core {

std::string DiffRecord::to_string(std::string_view tmpl) const {
    return util::format_template(tmpl, path, a, b);
}

std::ostream& operator<<(std::ostream& os, const DiffRecord& rec) {
    return os << rec.to_string(kDefaultDiffTemplate);
}

} // namespace core
