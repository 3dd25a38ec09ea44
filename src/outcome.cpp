#include "codegate/outcome.h"
#include <stdexcept>

namespace codegate {

ExecutionRequest ExecutionRequest::from_json(const Json::Value& body) {
    if (!body.isObject()) {
        throw std::invalid_argument("Request body must be a JSON object");
    }
    if (!body.isMember("code") || !body["code"].isString()) {
        throw std::invalid_argument("Missing 'code' field");
    }

    ExecutionRequest request;
    request.code = body["code"].asString();
    if (body.isMember("resourceHint") && !body["resourceHint"].isNull()) {
        if (!body["resourceHint"].isString()) {
            throw std::invalid_argument("'resourceHint' must be a string");
        }
        request.resource_hint = body["resourceHint"].asString();
    }
    return request;
}

ExecutionOutcome ExecutionOutcome::success(NormalizedResult normalized) {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::SUCCESS;
    outcome.result = std::move(normalized.value);
    outcome.truncated = normalized.truncated;
    return outcome;
}

ExecutionOutcome ExecutionOutcome::validation_failure(const ValidationVerdict& verdict) {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::VALIDATION_FAILURE;
    outcome.message = verdict.reason;
    outcome.construct = verdict.offending_construct;
    outcome.line = verdict.line;
    outcome.column = verdict.column;
    return outcome;
}

ExecutionOutcome ExecutionOutcome::timeout(std::chrono::milliseconds limit) {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::TIMEOUT;
    outcome.message = "Execution exceeded the time limit of " +
                      std::to_string(limit.count()) + " ms";
    return outcome;
}

ExecutionOutcome ExecutionOutcome::runtime_failure(std::string message) {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::RUNTIME_FAILURE;
    outcome.message = std::move(message);
    return outcome;
}

ExecutionOutcome ExecutionOutcome::serialization_failure(std::string message) {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::SERIALIZATION_FAILURE;
    outcome.message = std::move(message);
    return outcome;
}

const char* status_name(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::SUCCESS: return "success";
        case OutcomeKind::VALIDATION_FAILURE: return "validation_error";
        case OutcomeKind::TIMEOUT: return "timeout";
        case OutcomeKind::RUNTIME_FAILURE:
        case OutcomeKind::SERIALIZATION_FAILURE:
            return "execution_error";
    }
    return "execution_error";
}

Json::Value to_response(const ExecutionOutcome& outcome) {
    Json::Value response;
    response["status"] = status_name(outcome.kind);

    switch (outcome.kind) {
        case OutcomeKind::SUCCESS:
            response["result"] = outcome.result;
            if (outcome.truncated) {
                response["truncated"] = true;
            }
            break;
        case OutcomeKind::VALIDATION_FAILURE:
            response["error"] = outcome.message;
            if (!outcome.construct.empty()) {
                response["construct"] = outcome.construct;
            }
            if (outcome.line > 0) {
                response["line"] = outcome.line;
                response["column"] = outcome.column;
            }
            break;
        case OutcomeKind::SERIALIZATION_FAILURE:
            response["error"] = "Result could not be serialized: " + outcome.message;
            break;
        default:
            response["error"] = outcome.message;
            break;
    }

    if (!outcome.output.empty()) {
        response["output"] = outcome.output;
        if (outcome.output_truncated) {
            response["outputTruncated"] = true;
        }
    }
    return response;
}

} // namespace codegate
