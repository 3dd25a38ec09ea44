#include "codegate/policy.h"
#include "codegate/errors.h"
#include "ast.h"
#include <fstream>
#include <functional>
#include <map>

namespace codegate {

namespace {

constexpr size_t MIN_MEMORY_LIMIT_BYTES = 32 * 1024 * 1024;
constexpr int64_t MAX_TIMEOUT_MS = 10 * 60 * 1000;

const char* const DEFAULT_ALLOWED_MODULES[] = {"json", "math"};

const char* const DEFAULT_BANNED_CONSTRUCTS[] = {
    "FunctionDef", "ClassDef", "Lambda", "Global", "Nonlocal", "Return", "With"
};

const char* const DEFAULT_BANNED_CALLS[] = {
    "eval", "exec", "compile", "open", "__import__", "getattr", "setattr",
    "delattr", "globals", "locals", "vars", "input", "breakpoint", "exit",
    "quit", "help", "type", "id", "dir", "memoryview", "super", "object"
};

const char* const DEFAULT_BANNED_PATTERNS[] = {
    // Dunder and private names; a lone "_" stays usable
    "^_[A-Za-z0-9_]",
    // Frame, code and generator internals
    "^(f_(globals|locals|builtins|back|code|trace)|gi_(frame|code)|cr_(frame|code)|"
    "ag_(frame|code)|co_code|tb_(frame|next)|func_(globals|code|closure))$",
    "^mro$"
};

bool is_known_construct(const std::string& name) {
    for (int i = static_cast<int>(ast::NodeKind::Name); i <= static_cast<int>(ast::NodeKind::With); ++i) {
        if (name == ast::node_kind_name(static_cast<ast::NodeKind>(i))) return true;
    }
    return false;
}

std::vector<std::string> read_string_list(const Json::Value& value, const std::string& key) {
    if (!value.isArray()) throw ConfigError("'" + key + "' must be an array of strings");
    std::vector<std::string> out;
    for (const auto& item : value) {
        if (!item.isString()) throw ConfigError("'" + key + "' must be an array of strings");
        out.push_back(item.asString());
    }
    return out;
}

size_t read_size(const Json::Value& value, const std::string& key) {
    if (!value.isIntegral() || value.asInt64() < 0) {
        throw ConfigError("'" + key + "' must be a non-negative integer");
    }
    return static_cast<size_t>(value.asUInt64());
}

bool read_bool(const Json::Value& value, const std::string& key) {
    if (!value.isBool()) throw ConfigError("'" + key + "' must be a boolean");
    return value.asBool();
}

Json::Value to_array(const std::vector<std::string>& items) {
    Json::Value array(Json::arrayValue);
    for (const auto& item : items) array.append(item);
    return array;
}

Json::Value to_array(const std::set<std::string>& items) {
    Json::Value array(Json::arrayValue);
    for (const auto& item : items) array.append(item);
    return array;
}

} // namespace

bool PolicyConfig::is_module_allowed(const std::string& module) const {
    for (const auto& allowed : allowed_modules) {
        if (module == allowed) return true;
        if (module.size() > allowed.size() && module.compare(0, allowed.size(), allowed) == 0 &&
            module[allowed.size()] == '.') {
            return true;
        }
    }
    return false;
}

bool PolicyConfig::is_identifier_banned(const std::string& name) const {
    for (const auto& pattern : identifier_patterns) {
        if (std::regex_search(name, pattern)) return true;
    }
    return false;
}

PolicyConfig PolicyStore::defaults() {
    PolicyConfig config;
    config.allowed_modules.assign(std::begin(DEFAULT_ALLOWED_MODULES), std::end(DEFAULT_ALLOWED_MODULES));
    config.banned_constructs.insert(std::begin(DEFAULT_BANNED_CONSTRUCTS), std::end(DEFAULT_BANNED_CONSTRUCTS));
    config.banned_calls.insert(std::begin(DEFAULT_BANNED_CALLS), std::end(DEFAULT_BANNED_CALLS));
    config.banned_identifier_patterns.assign(std::begin(DEFAULT_BANNED_PATTERNS), std::end(DEFAULT_BANNED_PATTERNS));
    for (const auto& pattern : config.banned_identifier_patterns) {
        config.identifier_patterns.emplace_back(pattern);
    }
    return config;
}

PolicyPtr PolicyStore::freeze(PolicyConfig config) {
    if (config.timeout.count() <= 0 || config.timeout.count() > MAX_TIMEOUT_MS) {
        throw ConfigError("timeout_ms must be between 1 and " + std::to_string(MAX_TIMEOUT_MS));
    }
    if (config.max_result_depth == 0 || config.max_result_depth > MAX_ALLOWED_RESULT_DEPTH) {
        throw ConfigError("max_result_depth must be between 1 and " + std::to_string(MAX_ALLOWED_RESULT_DEPTH));
    }
    if (config.max_result_size == 0) throw ConfigError("max_result_size must be positive");
    if (config.max_workers == 0) throw ConfigError("max_workers must be positive");
    if (config.max_code_bytes == 0) throw ConfigError("max_code_bytes must be positive");
    if (config.memory_limit_bytes < MIN_MEMORY_LIMIT_BYTES) {
        throw ConfigError("memory_limit_bytes must be at least " + std::to_string(MIN_MEMORY_LIMIT_BYTES));
    }
    for (const auto& construct : config.banned_constructs) {
        if (!is_known_construct(construct)) throw ConfigError("unknown construct '" + construct + "'");
    }

    config.identifier_patterns.clear();
    for (const auto& pattern : config.banned_identifier_patterns) {
        try {
            config.identifier_patterns.emplace_back(pattern);
        } catch (const std::regex_error& e) {
            throw ConfigError("invalid identifier pattern '" + pattern + "': " + e.what());
        }
    }
    return std::make_shared<const PolicyConfig>(std::move(config));
}

PolicyPtr PolicyStore::from_json(const Json::Value& document) {
    if (!document.isObject()) throw ConfigError("policy document must be a JSON object");

    PolicyConfig config = defaults();
    const std::map<std::string, std::function<void(const Json::Value&)>> setters = {
        {"allowed_modules", [&](const Json::Value& v) {
            config.allowed_modules = read_string_list(v, "allowed_modules");
        }},
        {"banned_constructs", [&](const Json::Value& v) {
            auto items = read_string_list(v, "banned_constructs");
            config.banned_constructs = std::set<std::string>(items.begin(), items.end());
        }},
        {"banned_calls", [&](const Json::Value& v) {
            auto items = read_string_list(v, "banned_calls");
            config.banned_calls = std::set<std::string>(items.begin(), items.end());
        }},
        {"banned_identifier_patterns", [&](const Json::Value& v) {
            config.banned_identifier_patterns = read_string_list(v, "banned_identifier_patterns");
        }},
        {"allowed_operations", [&](const Json::Value& v) {
            auto items = read_string_list(v, "allowed_operations");
            config.allowed_operations = std::set<std::string>(items.begin(), items.end());
        }},
        {"timeout_ms", [&](const Json::Value& v) {
            config.timeout = std::chrono::milliseconds(static_cast<int64_t>(read_size(v, "timeout_ms")));
        }},
        {"max_result_depth", [&](const Json::Value& v) { config.max_result_depth = read_size(v, "max_result_depth"); }},
        {"max_result_size", [&](const Json::Value& v) { config.max_result_size = read_size(v, "max_result_size"); }},
        {"max_workers", [&](const Json::Value& v) { config.max_workers = read_size(v, "max_workers"); }},
        {"memory_limit_bytes", [&](const Json::Value& v) { config.memory_limit_bytes = read_size(v, "memory_limit_bytes"); }},
        {"max_code_bytes", [&](const Json::Value& v) { config.max_code_bytes = read_size(v, "max_code_bytes"); }},
        {"capture_output", [&](const Json::Value& v) { config.capture_output = read_bool(v, "capture_output"); }},
        {"require_syscall_filter", [&](const Json::Value& v) {
            config.require_syscall_filter = read_bool(v, "require_syscall_filter");
        }},
    };

    for (const auto& key : document.getMemberNames()) {
        auto it = setters.find(key);
        if (it == setters.end()) throw ConfigError("unknown policy key '" + key + "'");
        it->second(document[key]);
    }
    return freeze(std::move(config));
}

PolicyPtr PolicyStore::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw ConfigError("cannot open policy file: " + path);

    Json::Value document;
    Json::CharReaderBuilder builder;
    builder["allowComments"] = true;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &document, &errors)) {
        throw ConfigError("invalid JSON in " + path + ": " + errors);
    }
    return from_json(document);
}

Json::Value PolicyStore::to_json(const PolicyConfig& config) {
    Json::Value json;
    json["allowed_modules"] = to_array(config.allowed_modules);
    json["banned_constructs"] = to_array(config.banned_constructs);
    json["banned_calls"] = to_array(config.banned_calls);
    json["banned_identifier_patterns"] = to_array(config.banned_identifier_patterns);
    json["allowed_operations"] = to_array(config.allowed_operations);
    json["timeout_ms"] = static_cast<Json::Int64>(config.timeout.count());
    json["max_result_depth"] = static_cast<Json::UInt64>(config.max_result_depth);
    json["max_result_size"] = static_cast<Json::UInt64>(config.max_result_size);
    json["max_workers"] = static_cast<Json::UInt64>(config.max_workers);
    json["memory_limit_bytes"] = static_cast<Json::UInt64>(config.memory_limit_bytes);
    json["max_code_bytes"] = static_cast<Json::UInt64>(config.max_code_bytes);
    json["capture_output"] = config.capture_output;
    json["require_syscall_filter"] = config.require_syscall_filter;
    return json;
}

} // namespace codegate
