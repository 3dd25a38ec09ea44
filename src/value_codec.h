#pragma once

#include "codegate/value.h"
#include <json/json.h>

namespace codegate {

// Lossless JSON form of runtime values for the supervisor/worker channel.
// JSON-native values travel as themselves; everything else is an object
// tagged with "$t" (tuple, dict, float, bytes, range, opaque).
namespace value_codec {

// Throws SerializationError on cyclic or overly deep values
Json::Value encode(const Value& value);

// Throws SerializationError on malformed input
Value decode(const Json::Value& json);

} // namespace value_codec
} // namespace codegate
