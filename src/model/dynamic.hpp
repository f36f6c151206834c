#pragma once

#include <json/json.h>

namespace model {

class TypeAdapter;

// Json::Value trees compare as the Dynamic kind. The concrete payload is
// exposed in priority string, number, boolean, array, object. Numbers of every
// JSON flavour (int, uint, real) compare as double, so 1 and 1.0 agree.
// Object members missing on one side read as null.
const TypeAdapter& dynamic_adapter() noexcept;

} // namespace model
