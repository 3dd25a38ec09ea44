/**
 * Unit tests for the snippet interpreter
 *
 * Runs snippets in-process against a fake client; process isolation is
 * covered by the supervisor tests.
 */

#include <gtest/gtest.h>
#include "test_support.h"
#include <string>

using namespace codegate;
using namespace codegate::testing_support;

namespace {

Value eval(const std::string& code) {
    return run_snippet(code).value;
}

std::string shown(const std::string& code) {
    return repr(eval(code));
}

} // namespace

// ============================================================================
// Test Contract: Result extraction
// ============================================================================

TEST(InterpreterTest, ResultBindingWins) {
    EXPECT_EQ(shown("result = 41 + 1\n'ignored'"), "42");
}

TEST(InterpreterTest, TrailingExpressionIsTheResult) {
    EXPECT_EQ(shown("x = [1, 2, 3]\nlen(x)"), "3");
}

TEST(InterpreterTest, NoResultIsNone) {
    EXPECT_TRUE(eval("x = 1").is_none());
    // A later statement clears the trailing expression
    EXPECT_TRUE(eval("1 + 1\nx = 2").is_none());
}

// ============================================================================
// Test Contract: Core semantics
// ============================================================================

TEST(InterpreterTest, ArithmeticFollowsPythonRules) {
    EXPECT_EQ(shown("7 // 2"), "3");
    EXPECT_EQ(shown("-7 // 2"), "-4");
    EXPECT_EQ(shown("-7 % 3"), "2");
    EXPECT_EQ(shown("7 / 2"), "3.5");
    EXPECT_EQ(shown("2 ** 10"), "1024");
    EXPECT_EQ(shown("0.1 + 0.2"), "0.30000000000000004");
    EXPECT_EQ(shown("'ab' * 3"), "'ababab'");
    EXPECT_EQ(shown("[1] + [2, 3]"), "[1, 2, 3]");
}

TEST(InterpreterTest, IntegerOverflowRaises) {
    EXPECT_EQ(error_type_of("9223372036854775807 + 1"), "OverflowError");
}

TEST(InterpreterTest, DivisionByZeroRaises) {
    EXPECT_EQ(error_type_of("1 / 0"), "ZeroDivisionError");
    EXPECT_EQ(error_type_of("1 % 0"), "ZeroDivisionError");
}

TEST(InterpreterTest, ComparisonsChain) {
    EXPECT_EQ(shown("1 < 2 < 3"), "True");
    EXPECT_EQ(shown("1 < 3 < 2"), "False");
    EXPECT_EQ(shown("'a' in 'cat' and 2 not in [1, 3]"), "True");
    EXPECT_EQ(shown("None is None"), "True");
}

TEST(InterpreterTest, ControlFlow) {
    std::string code =
        "total = 0\n"
        "for i in range(10):\n"
        "    if i % 2:\n"
        "        continue\n"
        "    if i > 6:\n"
        "        break\n"
        "    total += i\n"
        "else:\n"
        "    total = -1\n"
        "n = 0\n"
        "while n < 3:\n"
        "    n += 1\n"
        "result = (total, n)\n";
    EXPECT_EQ(shown(code), "(12, 3)");
}

TEST(InterpreterTest, LongElifChainPicksTheMatchingBranch) {
    std::string code = "x = 250\nif x == 0:\n    r = 0\n";
    for (int i = 1; i < 300; ++i) {
        code += "elif x == " + std::to_string(i) + ":\n    r = " + std::to_string(i) + "\n";
    }
    code += "else:\n    r = -1\nresult = r\n";
    EXPECT_EQ(shown(code), "250");
}

TEST(InterpreterTest, UnpackingAndStarredTargets) {
    EXPECT_EQ(shown("a, b = 1, 2\nb, a"), "(2, 1)");
    EXPECT_EQ(shown("first, *rest = [1, 2, 3]\nrest"), "[2, 3]");
    EXPECT_EQ(error_type_of("a, b = [1, 2, 3]"), "ValueError");
}

TEST(InterpreterTest, ListAliasingIsByReference) {
    EXPECT_EQ(shown("a = [1]\nb = a\nb.append(2)\na += [3]\nb"), "[1, 2, 3]");
}

TEST(InterpreterTest, SubscriptsAndSlices) {
    EXPECT_EQ(shown("[1, 2, 3, 4][-1]"), "4");
    EXPECT_EQ(shown("[1, 2, 3, 4][1:3]"), "[2, 3]");
    EXPECT_EQ(shown("[1, 2, 3, 4][::-1]"), "[4, 3, 2, 1]");
    EXPECT_EQ(shown("'hello'[1:4]"), "'ell'");
    EXPECT_EQ(shown("x = [0, 1, 2, 3]\nx[1:3] = ['a']\nx"), "[0, 'a', 3]");
    EXPECT_EQ(shown("x = [0, 1, 2, 3]\ndel x[::2]\nx"), "[1, 3]");
    EXPECT_EQ(error_type_of("[1][5]"), "IndexError");
    EXPECT_EQ(error_type_of("{}['missing']"), "KeyError");
}

TEST(InterpreterTest, DictsKeepInsertionOrder) {
    EXPECT_EQ(shown("d = {'b': 1}\nd['a'] = 2\nd['b'] = 3\nlist(d.keys())"), "['b', 'a']");
    EXPECT_EQ(shown("d = {'a': 1}\nd.get('z', 0)"), "0");
    EXPECT_EQ(error_type_of("d = {[1]: 2}"), "TypeError");
}

TEST(InterpreterTest, Comprehensions) {
    EXPECT_EQ(shown("[x * x for x in range(5) if x % 2 == 0]"), "[0, 4, 16]");
    EXPECT_EQ(shown("{k: v for k, v in [('a', 1), ('b', 2)]}"), "{'a': 1, 'b': 2}");
    EXPECT_EQ(shown("[(a, b) for a in range(2) for b in 'xy']"),
              "[(0, 'x'), (0, 'y'), (1, 'x'), (1, 'y')]");
    EXPECT_EQ(shown("sum(x for x in range(4))"), "6");
}

TEST(InterpreterTest, ComprehensionVariablesDoNotLeak) {
    EXPECT_EQ(error_type_of("[i for i in range(3)]\ni"), "NameError");
}

TEST(InterpreterTest, FormattedStrings) {
    EXPECT_EQ(shown("name = 'x'\nf'{name}-{1 + 1}'"), "'x-2'");
    EXPECT_EQ(shown("f'{3.14159:.2f}'"), "'3.14'");
    EXPECT_EQ(shown("q = 'q'\nf'{q!r}'"), "\"'q'\"");
    EXPECT_EQ(shown("'{} and {}'.format(1, 'b')"), "'1 and b'");
    EXPECT_EQ(shown("'%s=%d' % ('n', 5)"), "'n=5'");
}

TEST(InterpreterTest, ConditionalExpressionAndBoolOps) {
    EXPECT_EQ(shown("'yes' if [] else 'no'"), "'no'");
    EXPECT_EQ(shown("0 or 'fallback'"), "'fallback'");
    EXPECT_EQ(shown("1 and 2"), "2");
}

// ============================================================================
// Test Contract: Exceptions
// ============================================================================

TEST(InterpreterTest, RaisePropagatesTypeAndMessage) {
    try {
        run_snippet("raise ValueError('boom')");
        FAIL() << "Expected ScriptError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.type(), "ValueError");
        EXPECT_EQ(e.message(), "boom");
    }
}

TEST(InterpreterTest, ExceptMatchesHierarchy) {
    std::string code =
        "try:\n"
        "    {}['k']\n"
        "except LookupError as err:\n"
        "    result = 'caught ' + str(err)\n";
    EXPECT_EQ(shown(code), "\"caught 'k'\"");
}

TEST(InterpreterTest, ExceptTupleElseAndFinally) {
    std::string code =
        "log = []\n"
        "for v in [1, 0]:\n"
        "    try:\n"
        "        x = 10 // v\n"
        "    except (TypeError, ZeroDivisionError):\n"
        "        log.append('err')\n"
        "    else:\n"
        "        log.append('ok')\n"
        "    finally:\n"
        "        log.append('done')\n"
        "log\n";
    EXPECT_EQ(shown(code), "['ok', 'done', 'err', 'done']");
}

TEST(InterpreterTest, FinallyRunsWhenErrorEscapes) {
    std::string code =
        "log = []\n"
        "try:\n"
        "    try:\n"
        "        raise KeyError('x')\n"
        "    finally:\n"
        "        log.append('cleanup')\n"
        "except KeyError:\n"
        "    pass\n"
        "log\n";
    EXPECT_EQ(shown(code), "['cleanup']");
}

TEST(InterpreterTest, BareRaiseRethrowsActiveException) {
    std::string code =
        "try:\n"
        "    raise TypeError('inner')\n"
        "except TypeError:\n"
        "    raise\n";
    EXPECT_EQ(error_type_of(code), "TypeError");
    EXPECT_EQ(error_type_of("raise"), "RuntimeError");
}

TEST(InterpreterTest, UnmatchedHandlerLetsErrorThrough) {
    EXPECT_EQ(error_type_of("try:\n    1 / 0\nexcept KeyError:\n    pass\n"), "ZeroDivisionError");
}

TEST(InterpreterTest, AssertRaisesAssertionError) {
    EXPECT_EQ(error_type_of("assert 1 == 2, 'nope'"), "AssertionError");
    EXPECT_EQ(error_type_of("assert True"), "");
}

TEST(InterpreterTest, UnknownNamesRaiseNameError) {
    EXPECT_EQ(error_type_of("undefined_thing + 1"), "NameError");
}

TEST(InterpreterTest, StatementsWithoutRuntimeSupportRaise) {
    // The validator normally rejects these; the interpreter still refuses them
    EXPECT_EQ(error_type_of("def f():\n    pass\n"), "NotImplementedError");
    EXPECT_EQ(error_type_of("return 1\n"), "SyntaxError");
}

// ============================================================================
// Test Contract: Client binding
// ============================================================================

TEST(InterpreterTest, ClientCallsGoThroughTheGateway) {
    auto gateway = std::make_shared<FakeGateway>();

    RunResult run = run_snippet("items = client.list_items()\nresult = [i['name'] for i in items]", gateway);

    EXPECT_EQ(repr(run.value), "['alpha', 'beta']");
    ASSERT_EQ(gateway->calls.size(), 1u);
    EXPECT_EQ(gateway->calls[0], "list_items");
}

TEST(InterpreterTest, ClientErrorsAreCatchable) {
    std::string code =
        "try:\n"
        "    client.fail()\n"
        "except ClientError as e:\n"
        "    result = str(e)\n";
    EXPECT_EQ(shown(code), "'access denied'");
}

TEST(InterpreterTest, UnknownClientOperationIsAttributeError) {
    EXPECT_EQ(error_type_of("client.delete_everything()"), "AttributeError");
}

TEST(InterpreterTest, ClientReferenceIsOpaque) {
    EXPECT_EQ(to_display(eval("client")).find("0x"), std::string::npos);
}

// ============================================================================
// Test Contract: Imports and output
// ============================================================================

TEST(InterpreterTest, ImportsAllowListedModules) {
    EXPECT_EQ(shown("import math\nmath.floor(2.7)"), "2");
    EXPECT_EQ(shown("from json import dumps\ndumps([1, 2])"), "'[1, 2]'");
    EXPECT_EQ(shown("import math as m\nm.sqrt(9)"), "3.0");
}

TEST(InterpreterTest, ImportOfDisallowedModuleFailsAtRuntimeToo) {
    // Defense in depth when a snippet bypasses validation
    EXPECT_EQ(error_type_of("import os"), "ImportError");
}

TEST(InterpreterTest, PrintIsCaptured) {
    RunResult run = run_snippet("print('a', 1)\nprint('b', end='')\nresult = 0");
    EXPECT_EQ(run.output, "a 1\nb");
}

TEST(InterpreterTest, EachRunStartsWithFreshGlobals) {
    run_snippet("leaked = 'secret'");
    EXPECT_EQ(error_type_of("leaked"), "NameError");
}
