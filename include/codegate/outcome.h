#pragma once

#include "codegate/normalizer.h"
#include "codegate/validator.h"
#include <json/json.h>
#include <chrono>
#include <string>

namespace codegate {

struct ExecutionRequest {
    std::string code;
    std::string resource_hint;      // Empty when the caller gave none

    static ExecutionRequest from_json(const Json::Value& body);
};

enum class OutcomeKind {
    SUCCESS,
    VALIDATION_FAILURE,
    TIMEOUT,
    RUNTIME_FAILURE,
    SERIALIZATION_FAILURE
};

// Result of one request. Exactly one of `result` (SUCCESS) or `message`
// (every other kind) is meaningful.
struct ExecutionOutcome {
    OutcomeKind kind = OutcomeKind::RUNTIME_FAILURE;

    Json::Value result;
    bool truncated = false;

    std::string message;
    std::string construct;          // Offending construct for validation failures
    int line = 0;
    int column = 0;

    std::string output;             // Captured print() text
    bool output_truncated = false;
    std::chrono::milliseconds wall_time{0};

    static ExecutionOutcome success(NormalizedResult normalized);
    static ExecutionOutcome validation_failure(const ValidationVerdict& verdict);
    static ExecutionOutcome timeout(std::chrono::milliseconds limit);
    static ExecutionOutcome runtime_failure(std::string message);
    static ExecutionOutcome serialization_failure(std::string message);

    bool ok() const { return kind == OutcomeKind::SUCCESS; }
};

// Wire status: "success", "validation_error", "timeout" or "execution_error"
const char* status_name(OutcomeKind kind);

// Response document for the transport layer
Json::Value to_response(const ExecutionOutcome& outcome);

} // namespace codegate
