/**
 * Unit tests for the importable json and math modules
 */

#include <gtest/gtest.h>
#include "test_support.h"
#include "../../src/builtins.h"

using namespace codegate;
using namespace codegate::testing_support;

namespace {

std::string shown(const std::string& code) {
    return repr(run_snippet(code).value);
}

} // namespace

// ============================================================================
// Test Contract: json
// ============================================================================

TEST(JsonModuleTest, DumpsUsesPythonSeparators) {
    EXPECT_EQ(shown("import json\njson.dumps({'a': [1, 2.5, None, True]})"),
              "'{\"a\": [1, 2.5, null, true]}'");
}

TEST(JsonModuleTest, DumpsHonorsIndentAndSortKeys) {
    EXPECT_EQ(shown("import json\njson.dumps({'b': 1, 'a': 2}, sort_keys=True)"),
              "'{\"a\": 2, \"b\": 1}'");
    EXPECT_EQ(shown("import json\njson.dumps([1], indent=2)"), "'[\\n  1\\n]'");
    EXPECT_EQ(shown("import json\njson.dumps({'a': 1}, separators=(',', ':'))"), "'{\"a\":1}'");
}

TEST(JsonModuleTest, DumpsRejectsUnserializableValues) {
    EXPECT_EQ(error_type_of("import json\njson.dumps(range(3))"), "TypeError");
    EXPECT_EQ(error_type_of("import json\njson.dumps(client)"), "TypeError");
}

TEST(JsonModuleTest, LoadsBuildsRuntimeValues) {
    EXPECT_EQ(shown("import json\njson.loads('{\"x\": [1, 2.0, \"s\", null]}')"),
              "{'x': [1, 2.0, 's', None]}");
}

TEST(JsonModuleTest, LoadsFailureIsCatchableAsValueError) {
    std::string code =
        "import json\n"
        "try:\n"
        "    json.loads('{not json')\n"
        "    result = 'parsed'\n"
        "except ValueError:\n"
        "    result = 'rejected'\n";
    EXPECT_EQ(shown(code), "'rejected'");
}

TEST(JsonModuleTest, ReencodingLoadedDataIsStable) {
    std::string code =
        "import json\n"
        "text = json.dumps({'k': [1, {'n': 'v'}]})\n"
        "json.dumps(json.loads(text)) == text\n";
    EXPECT_EQ(shown(code), "True");
}

// ============================================================================
// Test Contract: math
// ============================================================================

TEST(MathModuleTest, ConstantsAndFunctions) {
    EXPECT_EQ(shown("import math\nround(math.pi, 5)"), "3.14159");
    EXPECT_EQ(shown("import math\nmath.sqrt(16)"), "4.0");
    EXPECT_EQ(shown("import math\nmath.ceil(1.2)"), "2");
    EXPECT_EQ(shown("import math\nmath.gcd(12, 18)"), "6");
    EXPECT_EQ(shown("import math\nmath.factorial(5)"), "120");
    EXPECT_EQ(shown("import math\nmath.isclose(0.1 + 0.2, 0.3)"), "True");
    EXPECT_EQ(shown("import math\nmath.fsum([1, 2.5])"), "3.5");
}

TEST(MathModuleTest, DomainErrorsRaise) {
    EXPECT_EQ(error_type_of("import math\nmath.sqrt(-1)"), "ValueError");
    EXPECT_EQ(error_type_of("import math\nmath.log(0)"), "ValueError");
    EXPECT_EQ(error_type_of("import math\nmath.exp(1000)"), "OverflowError");
    EXPECT_EQ(error_type_of("import math\nmath.sqrt('4')"), "TypeError");
}

// ============================================================================
// Test Contract: module loading
// ============================================================================

TEST(ModuleLoaderTest, UnknownModuleIsNotFound) {
    try {
        load_module("os");
        FAIL() << "Expected ScriptError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.type(), "ModuleNotFoundError");
    }
}

TEST(ModuleLoaderTest, EachLoadIsAFreshModule) {
    Value first = load_module("math");
    Value second = load_module("math");

    EXPECT_FALSE(first.same_object(second));
}
