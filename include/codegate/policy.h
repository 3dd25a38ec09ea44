#pragma once

#include "codegate/constants.h"
#include <json/json.h>
#include <chrono>
#include <memory>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace codegate {

// Immutable admission and execution policy. Built once at startup and shared
// read-only by every request.
struct PolicyConfig {
    std::vector<std::string> allowed_modules;           // Exact names; submodules allowed
    std::set<std::string> banned_constructs;            // Node kinds ("FunctionDef", "Lambda", ...)
    std::set<std::string> banned_calls;                 // Callee names ("eval", "open", ...)
    std::vector<std::string> banned_identifier_patterns;
    std::set<std::string> allowed_operations;           // Client operations; empty allows all

    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_MS};
    size_t max_result_depth = DEFAULT_MAX_RESULT_DEPTH;
    size_t max_result_size = DEFAULT_MAX_RESULT_SIZE;
    size_t max_workers = DEFAULT_MAX_WORKERS;
    size_t memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    size_t max_code_bytes = DEFAULT_MAX_CODE_BYTES;
    bool capture_output = true;                         // Return print() text with the result
    bool require_syscall_filter = false;                // Fail the run if seccomp cannot load

    // Compiled form of banned_identifier_patterns, filled in by PolicyStore::freeze
    std::vector<std::regex> identifier_patterns;

    bool is_module_allowed(const std::string& module) const;
    bool is_identifier_banned(const std::string& name) const;
};

using PolicyPtr = std::shared_ptr<const PolicyConfig>;

class PolicyStore {
public:
    // Built-in policy (compiled patterns included)
    static PolicyConfig defaults();

    // Overrides defaults with the keys of a JSON policy document.
    // Unknown keys and ill-typed values raise ConfigError.
    static PolicyPtr from_json(const Json::Value& document);
    static PolicyPtr load_file(const std::string& path);

    // Validates ranges, compiles patterns and seals the config
    static PolicyPtr freeze(PolicyConfig config);

    static Json::Value to_json(const PolicyConfig& config);
};

} // namespace codegate
