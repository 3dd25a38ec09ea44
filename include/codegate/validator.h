#pragma once

#include "codegate/policy.h"
#include <string>

namespace codegate {

namespace ast {
struct Module;
}

struct ValidationVerdict {
    bool accepted = true;
    std::string reason;
    std::string offending_construct;    // Node kind, "code" or "SyntaxError"
    int line = 0;
    int column = 0;

    static ValidationVerdict accept() { return ValidationVerdict{}; }
    static ValidationVerdict reject(std::string reason, std::string construct, int line = 0, int column = 0) {
        ValidationVerdict verdict;
        verdict.accepted = false;
        verdict.reason = std::move(reason);
        verdict.offending_construct = std::move(construct);
        verdict.line = line;
        verdict.column = column;
        return verdict;
    }
};

// Static admission check. Parses the snippet and walks every node against
// the policy; nothing is executed. Returns the first violation found.
class Validator {
public:
    explicit Validator(PolicyPtr policy);

    // When `parsed` is given and the snippet is accepted, the syntax tree is
    // moved into it so the caller does not parse twice.
    ValidationVerdict validate(const std::string& code, ast::Module* parsed = nullptr) const;

    ValidationVerdict check(const ast::Module& module) const;

private:
    PolicyPtr policy_;
};

} // namespace codegate
