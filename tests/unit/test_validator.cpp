/**
 * Unit tests for Validator
 *
 * The validator is the admission gate: anything it accepts may run, so these
 * tests pin down what must never get through.
 */

#include <gtest/gtest.h>
#include "../../src/ast.h"
#include "codegate/policy.h"
#include "codegate/validator.h"
#include <string>

using namespace codegate;

// ============================================================================
// Test Fixture
// ============================================================================

class ValidatorTest : public ::testing::Test {
protected:
    PolicyPtr policy = PolicyStore::freeze(PolicyStore::defaults());
    Validator validator{policy};

    void expect_rejected(const std::string& code, const std::string& construct) {
        ValidationVerdict verdict = validator.validate(code);
        EXPECT_FALSE(verdict.accepted) << code;
        EXPECT_EQ(verdict.offending_construct, construct) << code << " -> " << verdict.reason;
        EXPECT_FALSE(verdict.reason.empty());
    }

    void expect_accepted(const std::string& code) {
        ValidationVerdict verdict = validator.validate(code);
        EXPECT_TRUE(verdict.accepted) << code << " -> " << verdict.reason;
    }
};

// ============================================================================
// Test Contract: Ordinary snippets pass
// ============================================================================

TEST_F(ValidatorTest, AcceptsClientQueries) {
    expect_accepted("result = client.list_items()");
    expect_accepted("items = client.list_items(kind='bucket')\n"
                    "result = [i['name'] for i in items if i['size_gb'] > 1]");
    expect_accepted("import json\nresult = json.dumps({'a': 1})");
    expect_accepted("from math import sqrt\nresult = sqrt(16)");
    expect_accepted("try:\n    client.get_item('x')\nexcept ClientError as err:\n    result = str(err)");
}

TEST_F(ValidatorTest, AcceptedSnippetIsHandedBackParsed) {
    // Given: A valid snippet and a slot for the tree
    ast::Module module;

    // When: Validated
    ValidationVerdict verdict = validator.validate("x = 1\ny = 2", &module);

    // Then: The caller gets the parsed statements
    ASSERT_TRUE(verdict.accepted);
    EXPECT_EQ(module.body.size(), 2u);
}

// ============================================================================
// Test Contract: Module allow-list
// ============================================================================

TEST_F(ValidatorTest, RejectsDisallowedImports) {
    expect_rejected("import socket", "Import");
    expect_rejected("import os.path", "Import");
    expect_rejected("from subprocess import run", "ImportFrom");
    expect_rejected("import json, os", "Import");
}

TEST_F(ValidatorTest, RejectsRelativeAndWildcardImports) {
    expect_rejected("from . import json", "ImportFrom");
    expect_rejected("from json import *", "ImportFrom");
}

TEST_F(ValidatorTest, AllowsSubmodulesOfAllowedModules) {
    PolicyConfig config = PolicyStore::defaults();
    config.allowed_modules = {"json"};
    Validator custom(PolicyStore::freeze(config));

    EXPECT_TRUE(custom.validate("import json.decoder").accepted);
    EXPECT_FALSE(custom.validate("import jsonx").accepted);
}

// ============================================================================
// Test Contract: Dynamic evaluation and reflection
// ============================================================================

TEST_F(ValidatorTest, RejectsBannedCalls) {
    expect_rejected("eval('1 + 1')", "Call");
    expect_rejected("exec('x = 1')", "Call");
    expect_rejected("open('/etc/passwd').read()", "Call");
    expect_rejected("getattr(client, 'list_items')", "Call");
    expect_rejected("result = globals()", "Call");
}

TEST_F(ValidatorTest, RejectsBannedNamesEvenWithoutCall) {
    // Aliasing a banned builtin is as bad as calling it
    expect_rejected("f = eval", "Name");
    expect_rejected("fns = [exec, print]", "Name");
}

TEST_F(ValidatorTest, RejectsDunderAndPrivateIdentifiers) {
    expect_rejected("x = ().__class__.__bases__", "Attribute");
    expect_rejected("client._session", "Attribute");
    expect_rejected("__builtins__", "Name");
    expect_rejected("x = [].__class__", "Attribute");
}

TEST_F(ValidatorTest, RejectsFrameAndGeneratorInternals) {
    expect_rejected("x = g.gi_frame", "Attribute");
    expect_rejected("x = f.f_globals", "Attribute");
    expect_rejected("x = c.co_code", "Attribute");
    expect_rejected("x = t.mro", "Attribute");
}

TEST_F(ValidatorTest, AllowsSingleUnderscore) {
    expect_accepted("for _ in range(3):\n    pass");
}

// ============================================================================
// Test Contract: Banned constructs
// ============================================================================

TEST_F(ValidatorTest, RejectsDefinitionsAndScopeStatements) {
    expect_rejected("def f():\n    pass", "FunctionDef");
    expect_rejected("class C:\n    pass", "ClassDef");
    expect_rejected("f = lambda x: x", "Lambda");
    expect_rejected("global x", "Global");
    expect_rejected("return 1", "Return");
}

TEST_F(ValidatorTest, ConstructListComesFromPolicy) {
    // Given: A policy that permits lambdas
    PolicyConfig config = PolicyStore::defaults();
    config.banned_constructs.erase("Lambda");
    Validator custom(PolicyStore::freeze(config));

    // Then: The same snippet is accepted
    EXPECT_TRUE(custom.validate("result = sorted([3, 1], key=lambda v: -v)").accepted);
}

// ============================================================================
// Test Contract: The client binding is immutable
// ============================================================================

TEST_F(ValidatorTest, RejectsEveryFormOfClientRebinding) {
    expect_rejected("client = None", "Assign");
    expect_rejected("client += 1", "AugAssign");
    expect_rejected("a, client = 1, 2", "Assign");
    expect_rejected("for client in range(3):\n    pass", "For");
    expect_rejected("import json as client", "Import");
    expect_rejected("from json import dumps as client", "ImportFrom");
    expect_rejected("try:\n    pass\nexcept Exception as client:\n    pass", "ExceptHandler");
    expect_rejected("del client", "Delete");
    expect_rejected("x = [1 for client in range(2)]", "comprehension");
}

TEST_F(ValidatorTest, RejectsMutatingClientAttributes) {
    expect_rejected("client.region = 'eu'", "Assign");
    expect_rejected("client.config['x'] = 1", "Assign");
}

TEST_F(ValidatorTest, OperationAllowListRestrictsClientAttributes) {
    // Given: Only list_items is permitted
    PolicyConfig config = PolicyStore::defaults();
    config.allowed_operations = {"list_items"};
    Validator custom(PolicyStore::freeze(config));

    // Then: Other operations are refused before anything runs
    EXPECT_TRUE(custom.validate("client.list_items()").accepted);
    ValidationVerdict verdict = custom.validate("client.get_item('x')");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.offending_construct, "Attribute");
}

// ============================================================================
// Test Contract: Malformed and oversized input
// ============================================================================

TEST_F(ValidatorTest, SyntaxErrorIsAValidationFailureWithPosition) {
    ValidationVerdict verdict = validator.validate("x = = 1");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.offending_construct, "SyntaxError");
    EXPECT_EQ(verdict.line, 1);
    EXPECT_GT(verdict.column, 0);
}

TEST_F(ValidatorTest, RejectsOversizedCode) {
    std::string code(policy->max_code_bytes + 1, '#');
    ValidationVerdict verdict = validator.validate(code);
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.offending_construct, "code");
}

TEST_F(ValidatorTest, ReportsFirstViolationPosition) {
    ValidationVerdict verdict = validator.validate("x = 1\ny = 2\nimport os\n");
    EXPECT_FALSE(verdict.accepted);
    EXPECT_EQ(verdict.line, 3);
}
