#include "value_codec.h"
#include "codegate/errors.h"
#include <cstdlib>

namespace codegate {
namespace value_codec {

namespace {

constexpr int MAX_CODEC_DEPTH = 200;
const char* TAG = "$t";

Json::Value tagged(const char* tag) {
    Json::Value json(Json::objectValue);
    json[TAG] = tag;
    return json;
}

Json::Value encode_at(const Value& value, int depth) {
    if (depth > MAX_CODEC_DEPTH) {
        throw SerializationError("value is nested too deeply to transfer");
    }
    switch (value.type()) {
        case ValueType::NONE:
            return Json::Value(Json::nullValue);
        case ValueType::BOOL:
            return Json::Value(value.as_bool());
        case ValueType::INT:
            return Json::Value(static_cast<Json::Int64>(value.as_int()));
        case ValueType::FLOAT: {
            // Text keeps 1.0 a float and carries nan/inf
            Json::Value json = tagged("float");
            json["v"] = format_float(value.as_float());
            return json;
        }
        case ValueType::STR:
            return Json::Value(value.as_str());
        case ValueType::BYTES: {
            static const char* DIGITS = "0123456789abcdef";
            std::string hex;
            for (unsigned char c : value.as_bytes()) {
                hex += DIGITS[c >> 4];
                hex += DIGITS[c & 0xF];
            }
            Json::Value json = tagged("bytes");
            json["v"] = hex;
            return json;
        }
        case ValueType::LIST: {
            Json::Value array(Json::arrayValue);
            for (const auto& item : value.as_list().items) array.append(encode_at(item, depth + 1));
            return array;
        }
        case ValueType::TUPLE: {
            Json::Value json = tagged("tuple");
            Json::Value items(Json::arrayValue);
            for (const auto& item : value.as_tuple().items) items.append(encode_at(item, depth + 1));
            json["v"] = items;
            return json;
        }
        case ValueType::RANGE: {
            const Range& r = value.as_range();
            Json::Value json = tagged("range");
            Json::Value bounds(Json::arrayValue);
            bounds.append(static_cast<Json::Int64>(r.start));
            bounds.append(static_cast<Json::Int64>(r.stop));
            bounds.append(static_cast<Json::Int64>(r.step));
            json["v"] = bounds;
            return json;
        }
        case ValueType::DICT: {
            Json::Value json = tagged("dict");
            Json::Value entries(Json::arrayValue);
            for (const auto& [k, v] : value.as_dict().entries()) {
                Json::Value pair(Json::arrayValue);
                pair.append(encode_at(k, depth + 1));
                pair.append(encode_at(v, depth + 1));
                entries.append(pair);
            }
            json["v"] = entries;
            return json;
        }
        case ValueType::OPAQUE: {
            const Opaque& opaque = value.as_opaque();
            Json::Value json = tagged("opaque");
            json["type"] = opaque.type_name;
            json["text"] = opaque.text;
            json["exception"] = opaque.exception;
            return json;
        }
        default: {
            // Callables, modules and the client handle cannot cross processes
            Json::Value json = tagged("opaque");
            json["type"] = value.type_name();
            json["text"] = repr(value);
            json["exception"] = false;
            return json;
        }
    }
}

const Json::Value& member(const Json::Value& json, const char* name, Json::ValueType type) {
    const Json::Value& field = json[name];
    if (field.type() != type) {
        throw SerializationError(std::string("malformed value: bad '") + name + "' field");
    }
    return field;
}

Value decode_at(const Json::Value& json, int depth) {
    if (depth > MAX_CODEC_DEPTH) throw SerializationError("value is nested too deeply to transfer");

    switch (json.type()) {
        case Json::nullValue: return Value();
        case Json::booleanValue: return Value(json.asBool());
        case Json::intValue: return Value(static_cast<int64_t>(json.asInt64()));
        case Json::uintValue:
            if (!json.isInt64()) throw SerializationError("malformed value: integer out of range");
            return Value(static_cast<int64_t>(json.asInt64()));
        case Json::realValue: return Value(json.asDouble());
        case Json::stringValue: return Value(json.asString());
        case Json::arrayValue: {
            std::vector<Value> items;
            for (const auto& item : json) items.push_back(decode_at(item, depth + 1));
            return Value::list(std::move(items));
        }
        case Json::objectValue:
            break;
    }

    const std::string tag = member(json, TAG, Json::stringValue).asString();
    if (tag == "float") {
        const std::string text = member(json, "v", Json::stringValue).asString();
        char* end = nullptr;
        double d = std::strtod(text.c_str(), &end);
        if (text.empty() || end != text.c_str() + text.size()) throw SerializationError("malformed value: bad float");
        return Value(d);
    }
    if (tag == "bytes") {
        const std::string hex = member(json, "v", Json::stringValue).asString();
        if (hex.size() % 2 != 0) throw SerializationError("malformed value: bad bytes");
        std::string data;
        for (size_t i = 0; i < hex.size(); i += 2) {
            char* end = nullptr;
            std::string pair = hex.substr(i, 2);
            long byte = std::strtol(pair.c_str(), &end, 16);
            if (end != pair.c_str() + 2) throw SerializationError("malformed value: bad bytes");
            data += static_cast<char>(byte);
        }
        return Value::bytes(data);
    }
    if (tag == "tuple") {
        std::vector<Value> items;
        for (const auto& item : member(json, "v", Json::arrayValue)) items.push_back(decode_at(item, depth + 1));
        return Value::tuple(std::move(items));
    }
    if (tag == "range") {
        const Json::Value& bounds = member(json, "v", Json::arrayValue);
        if (bounds.size() != 3 || !bounds[0].isInt64() || !bounds[1].isInt64() || !bounds[2].isInt64() ||
            bounds[2].asInt64() == 0) {
            throw SerializationError("malformed value: bad range");
        }
        return Value::range(bounds[0].asInt64(), bounds[1].asInt64(), bounds[2].asInt64());
    }
    if (tag == "dict") {
        Value dict = Value::dict();
        for (const auto& pair : member(json, "v", Json::arrayValue)) {
            if (!pair.isArray() || pair.size() != 2) throw SerializationError("malformed value: bad dict entry");
            Value key = decode_at(pair[0], depth + 1);
            if (key.is_list() || key.is_dict()) throw SerializationError("malformed value: unhashable dict key");
            dict.as_dict().set(key, decode_at(pair[1], depth + 1));
        }
        return dict;
    }
    if (tag == "opaque") {
        std::string type = member(json, "type", Json::stringValue).asString();
        std::string text = member(json, "text", Json::stringValue).asString();
        bool exception = json["exception"].isBool() && json["exception"].asBool();
        return exception ? Value::exception(type, text) : Value::opaque(type, text);
    }
    throw SerializationError("malformed value: unknown tag '" + tag + "'");
}

} // namespace

Json::Value encode(const Value& value) {
    return encode_at(value, 0);
}

Value decode(const Json::Value& json) {
    return decode_at(json, 0);
}

} // namespace value_codec
} // namespace codegate
