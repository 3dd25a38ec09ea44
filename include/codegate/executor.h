#pragma once

#include "codegate/normalizer.h"
#include "codegate/outcome.h"
#include "codegate/policy.h"
#include "codegate/service_client.h"
#include "codegate/validator.h"
#include "codegate/value.h"
#include <memory>
#include <string>

namespace codegate {

// Entry point of the admission pipeline: validate, then run under supervision.
// Safe to call from many threads at once; only the policy is shared.
class CodeExecutor {
public:
    explicit CodeExecutor(PolicyPtr policy);
    ~CodeExecutor();

    CodeExecutor(const CodeExecutor&) = delete;
    CodeExecutor& operator=(const CodeExecutor&) = delete;

    // Never throws; every failure is reported through the outcome
    ExecutionOutcome execute(const ExecutionRequest& request, ServiceClientPtr client);

    // Static check only
    ValidationVerdict validate(const std::string& code) const;

    // Throws SerializationError when the value exceeds the size bound
    NormalizedResult normalize(const Value& value) const;

    const PolicyConfig& policy() const;
    size_t active_workers() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace codegate
