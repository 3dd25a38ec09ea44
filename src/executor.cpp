#include "codegate/executor.h"
#include "ast.h"
#include "fingerprint.h"
#include "supervisor.h"
#include <iostream>

namespace codegate {

class CodeExecutor::Impl {
public:
    PolicyPtr policy_;
    Validator validator_;
    ResultNormalizer normalizer_;
    ExecutionSupervisor supervisor_;

    explicit Impl(PolicyPtr policy)
        : policy_(policy),
          validator_(policy),
          normalizer_(policy->max_result_depth, policy->max_result_size),
          supervisor_(policy) {}

    ExecutionOutcome execute(const ExecutionRequest& request, const ServiceClientPtr& client) {
        const std::string fingerprint = request_fingerprint(request.code);

        ast::Module module;
        ValidationVerdict verdict = validator_.validate(request.code, &module);
        if (!verdict.accepted) {
            std::cerr << "[Executor] " << fingerprint << " rejected construct="
                      << verdict.offending_construct << std::endl;
            return ExecutionOutcome::validation_failure(verdict);
        }

        return supervisor_.run(module, client, fingerprint);
    }
};

CodeExecutor::CodeExecutor(PolicyPtr policy) : pImpl(std::make_unique<Impl>(std::move(policy))) {}

CodeExecutor::~CodeExecutor() = default;

ExecutionOutcome CodeExecutor::execute(const ExecutionRequest& request, ServiceClientPtr client) {
    try {
        return pImpl->execute(request, client);
    } catch (const std::bad_alloc&) {
        std::cerr << "[Executor] Out of memory while handling request" << std::endl;
        return ExecutionOutcome::runtime_failure("Service out of memory");
    } catch (const std::exception& e) {
        std::cerr << "[Executor] Internal error: " << e.what() << std::endl;
        return ExecutionOutcome::runtime_failure("Internal error while executing code");
    }
}

ValidationVerdict CodeExecutor::validate(const std::string& code) const {
    return pImpl->validator_.validate(code);
}

NormalizedResult CodeExecutor::normalize(const Value& value) const {
    return pImpl->normalizer_.normalize(value);
}

const PolicyConfig& CodeExecutor::policy() const {
    return *pImpl->policy_;
}

size_t CodeExecutor::active_workers() const {
    return pImpl->supervisor_.active_workers();
}

} // namespace codegate
