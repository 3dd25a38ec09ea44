#pragma once

#include "codegate/value.h"
#include <json/json.h>
#include <cstddef>

namespace codegate {

struct NormalizedResult {
    Json::Value value;
    bool truncated = false;     // Some container was replaced by the truncation marker
};

// Converts snippet results into bounded, JSON-safe trees.
// Containers nested deeper than max_depth become "<truncated>"; emitting more
// than max_size nodes raises SerializationError.
class ResultNormalizer {
public:
    ResultNormalizer(size_t max_depth, size_t max_size);

    NormalizedResult normalize(const Value& value) const;

    // Same bounds over an already-JSON value; normalize(normalize(x)) == normalize(x)
    NormalizedResult normalize(const Json::Value& value) const;

private:
    size_t max_depth_;
    size_t max_size_;

    struct State {
        size_t nodes = 0;
        bool truncated = false;
    };

    Json::Value convert(const Value& value, size_t depth, State& state) const;
    Json::Value convert(const Json::Value& value, size_t depth, State& state) const;
    void count_node(State& state) const;
};

} // namespace codegate
