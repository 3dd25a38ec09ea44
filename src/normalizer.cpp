#include "codegate/normalizer.h"
#include "codegate/constants.h"
#include "codegate/errors.h"
#include <cmath>

namespace codegate {

namespace {

bool is_container(const Value& value) {
    return value.is_list() || value.is_tuple() || value.is_dict();
}

std::string key_text(const Value& key) {
    if (key.is_str()) return key.as_str();
    return to_display(key);
}

} // namespace

ResultNormalizer::ResultNormalizer(size_t max_depth, size_t max_size)
    : max_depth_(max_depth), max_size_(max_size) {}

NormalizedResult ResultNormalizer::normalize(const Value& value) const {
    State state;
    NormalizedResult result;
    result.value = convert(value, 0, state);
    result.truncated = state.truncated;
    return result;
}

NormalizedResult ResultNormalizer::normalize(const Json::Value& value) const {
    State state;
    NormalizedResult result;
    result.value = convert(value, 0, state);
    result.truncated = state.truncated;
    return result;
}

void ResultNormalizer::count_node(State& state) const {
    if (++state.nodes > max_size_) {
        throw SerializationError("Result exceeds maximum size of " + std::to_string(max_size_) + " nodes");
    }
}

Json::Value ResultNormalizer::convert(const Value& value, size_t depth, State& state) const {
    count_node(state);

    if (is_container(value) && depth >= max_depth_) {
        state.truncated = true;
        return Json::Value(TRUNCATION_MARKER);
    }

    switch (value.type()) {
        case ValueType::NONE:
            return Json::Value(Json::nullValue);
        case ValueType::BOOL:
            return Json::Value(value.as_bool());
        case ValueType::INT:
            return Json::Value(static_cast<Json::Int64>(value.as_int()));
        case ValueType::FLOAT: {
            double d = value.as_float();
            if (!std::isfinite(d)) return Json::Value(format_float(d));
            return Json::Value(d);
        }
        case ValueType::STR:
            return Json::Value(value.as_str());
        case ValueType::LIST:
        case ValueType::TUPLE: {
            const auto& items = value.is_list() ? value.as_list().items : value.as_tuple().items;
            Json::Value array(Json::arrayValue);
            for (const auto& item : items) array.append(convert(item, depth + 1, state));
            return array;
        }
        case ValueType::DICT: {
            Json::Value object(Json::objectValue);
            for (const auto& [k, v] : value.as_dict().entries()) {
                std::string key = key_text(k);
                if (object.isMember(key)) {
                    throw SerializationError("Duplicate key '" + key + "' after key conversion");
                }
                object[key] = convert(v, depth + 1, state);
            }
            return object;
        }
        default:
            // Client objects, timestamps, bytes, callables: best-effort text
            return Json::Value(to_display(value));
    }
}

Json::Value ResultNormalizer::convert(const Json::Value& value, size_t depth, State& state) const {
    count_node(state);

    bool container = value.isArray() || value.isObject();
    if (container && depth >= max_depth_) {
        state.truncated = true;
        return Json::Value(TRUNCATION_MARKER);
    }

    if (value.isArray()) {
        Json::Value array(Json::arrayValue);
        for (const auto& item : value) array.append(convert(item, depth + 1, state));
        return array;
    }
    if (value.isObject()) {
        Json::Value object(Json::objectValue);
        for (const auto& name : value.getMemberNames()) {
            object[name] = convert(value[name], depth + 1, state);
        }
        return object;
    }
    if (value.type() == Json::realValue && !std::isfinite(value.asDouble())) {
        return Json::Value(format_float(value.asDouble()));
    }
    return value;
}

} // namespace codegate
