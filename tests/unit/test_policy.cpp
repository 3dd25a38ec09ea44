/**
 * Unit tests for PolicyStore
 *
 * The policy is loaded once at startup; a bad document must fail loudly
 * rather than silently weakening the sandbox.
 */

#include <gtest/gtest.h>
#include "codegate/constants.h"
#include "codegate/errors.h"
#include "codegate/policy.h"
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace codegate;

namespace {

Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value value;
    std::string errors;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    reader->parse(text.data(), text.data() + text.size(), &value, &errors);
    return value;
}

} // namespace

// ============================================================================
// Test Contract: Defaults
// ============================================================================

TEST(PolicyTest, DefaultsMatchDocumentedLimits) {
    PolicyConfig config = PolicyStore::defaults();

    EXPECT_EQ(config.timeout.count(), DEFAULT_TIMEOUT_MS);
    EXPECT_EQ(config.max_result_depth, DEFAULT_MAX_RESULT_DEPTH);
    EXPECT_EQ(config.max_result_size, DEFAULT_MAX_RESULT_SIZE);
    EXPECT_EQ(config.max_workers, DEFAULT_MAX_WORKERS);
    EXPECT_TRUE(config.allowed_operations.empty());
}

TEST(PolicyTest, DefaultsBanDynamicEvaluation) {
    PolicyConfig config = PolicyStore::defaults();

    for (const char* call : {"eval", "exec", "compile", "open", "__import__", "getattr", "globals"}) {
        EXPECT_TRUE(config.banned_calls.count(call)) << call;
    }
    for (const char* construct : {"FunctionDef", "ClassDef", "Lambda", "Global", "Nonlocal", "Return"}) {
        EXPECT_TRUE(config.banned_constructs.count(construct)) << construct;
    }
}

TEST(PolicyTest, ModuleMatchingIsExactOrSubmodule) {
    PolicyConfig config = PolicyStore::defaults();

    EXPECT_TRUE(config.is_module_allowed("json"));
    EXPECT_TRUE(config.is_module_allowed("json.decoder"));
    EXPECT_FALSE(config.is_module_allowed("jsonpickle"));
    EXPECT_FALSE(config.is_module_allowed("os"));
}

TEST(PolicyTest, IdentifierPatterns) {
    PolicyConfig config = PolicyStore::defaults();

    EXPECT_TRUE(config.is_identifier_banned("__class__"));
    EXPECT_TRUE(config.is_identifier_banned("_private"));
    EXPECT_TRUE(config.is_identifier_banned("f_globals"));
    EXPECT_FALSE(config.is_identifier_banned("_"));
    EXPECT_FALSE(config.is_identifier_banned("items"));
    EXPECT_FALSE(config.is_identifier_banned("f_global_count"));
}

// ============================================================================
// Test Contract: JSON documents
// ============================================================================

TEST(PolicyTest, DocumentOverridesOnlyTheKeysItNames) {
    // Given: A document changing the timeout and the module list
    Json::Value document = parse(R"({"timeout_ms": 2000, "allowed_modules": ["math"]})");

    // When: Loaded
    PolicyPtr policy = PolicyStore::from_json(document);

    // Then: Named keys change, the rest keep their defaults
    EXPECT_EQ(policy->timeout.count(), 2000);
    EXPECT_FALSE(policy->is_module_allowed("json"));
    EXPECT_TRUE(policy->is_module_allowed("math"));
    EXPECT_EQ(policy->max_result_depth, DEFAULT_MAX_RESULT_DEPTH);
    EXPECT_TRUE(policy->banned_calls.count("eval"));
}

TEST(PolicyTest, UnknownKeysAreRejected) {
    EXPECT_THROW(PolicyStore::from_json(parse(R"({"timeout": 5})")), ConfigError);
}

TEST(PolicyTest, IllTypedValuesAreRejected) {
    EXPECT_THROW(PolicyStore::from_json(parse(R"({"timeout_ms": "fast"})")), ConfigError);
    EXPECT_THROW(PolicyStore::from_json(parse(R"({"allowed_modules": "json"})")), ConfigError);
    EXPECT_THROW(PolicyStore::from_json(parse(R"({"capture_output": 1})")), ConfigError);
    EXPECT_THROW(PolicyStore::from_json(parse(R"([1, 2])")), ConfigError);
}

TEST(PolicyTest, OutOfRangeValuesAreRejected) {
    EXPECT_THROW(PolicyStore::from_json(parse(R"({"timeout_ms": 0})")), ConfigError);
    EXPECT_THROW(PolicyStore::from_json(parse(R"({"max_workers": 0})")), ConfigError);
    EXPECT_THROW(PolicyStore::from_json(parse(R"({"max_result_depth": 0})")), ConfigError);
    EXPECT_THROW(PolicyStore::from_json(parse(R"({"banned_constructs": ["NoSuchNode"]})")), ConfigError);
    EXPECT_THROW(PolicyStore::from_json(parse(R"({"banned_identifier_patterns": ["("]})")), ConfigError);
}

TEST(PolicyTest, ToJsonRoundTripsThroughFromJson) {
    PolicyConfig config = PolicyStore::defaults();
    config.timeout = std::chrono::milliseconds(1234);
    config.allowed_operations = {"list_items"};

    PolicyPtr reloaded = PolicyStore::from_json(PolicyStore::to_json(config));

    EXPECT_EQ(reloaded->timeout.count(), 1234);
    EXPECT_EQ(reloaded->allowed_operations, config.allowed_operations);
    EXPECT_EQ(reloaded->banned_calls, config.banned_calls);
}

TEST(PolicyTest, LoadsFromFile) {
    // Given: A policy file on disk
    std::string path = "/tmp/codegate_policy_" + std::to_string(getpid()) + ".json";
    {
        std::ofstream out(path);
        out << "{\n  // comments are tolerated\n  \"max_workers\": 2\n}\n";
    }

    // When: Loaded
    PolicyPtr policy = PolicyStore::load_file(path);
    std::remove(path.c_str());

    // Then: The override is applied
    EXPECT_EQ(policy->max_workers, 2u);
}

TEST(PolicyTest, MissingFileIsAConfigError) {
    EXPECT_THROW(PolicyStore::load_file("/nonexistent/policy.json"), ConfigError);
}
