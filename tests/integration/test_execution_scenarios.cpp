/**
 * End-to-end scenarios through CodeExecutor
 *
 * Validation, supervised execution and result shaping together, against the
 * demo catalog client.
 */

#include <gtest/gtest.h>
#include "catalog_client.h"
#include "codegate/executor.h"
#include <chrono>
#include <thread>
#include <vector>

namespace codegate {
namespace {

using namespace std::chrono;

class ExecutionScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        PolicyConfig config = PolicyStore::defaults();
        config.timeout = seconds(2);
        executor = std::make_unique<CodeExecutor>(PolicyStore::freeze(config));
        catalog = CatalogClient::demo();
    }

    ExecutionOutcome execute(const std::string& code) {
        ExecutionRequest request;
        request.code = code;
        return executor->execute(request, catalog);
    }

    std::unique_ptr<CodeExecutor> executor;
    std::shared_ptr<CatalogClient> catalog;
};

TEST_F(ExecutionScenarioTest, ListsResourcesThroughTheClient) {
    ExecutionOutcome outcome = execute("result = client.list_items()");

    ASSERT_EQ(outcome.kind, OutcomeKind::SUCCESS) << outcome.message;
    ASSERT_TRUE(outcome.result.isArray());
    EXPECT_EQ(outcome.result.size(), 6u);
    EXPECT_EQ(outcome.result[0]["id"].asString(), "i-0a1b2c3d");
    // Timestamps come back as text
    EXPECT_EQ(outcome.result[0]["created_at"].asString(), "2024-03-01T10:15:00Z");
    EXPECT_FALSE(outcome.truncated);
}

TEST_F(ExecutionScenarioTest, FiltersAndAggregates) {
    std::string code =
        "items = client.list_items(region='us-east-1')\n"
        "by_kind = {}\n"
        "for item in items:\n"
        "    by_kind[item['kind']] = by_kind.get(item['kind'], 0) + item['size_gb']\n"
        "result = sorted(by_kind.items())\n";

    ExecutionOutcome outcome = execute(code);

    ASSERT_EQ(outcome.kind, OutcomeKind::SUCCESS) << outcome.message;
    ASSERT_EQ(outcome.result.size(), 3u);
    EXPECT_EQ(outcome.result[0][0].asString(), "bucket");
    EXPECT_EQ(outcome.result[0][1].asInt(), 120);
    EXPECT_EQ(outcome.result[1][1].asInt(), 16);
}

TEST_F(ExecutionScenarioTest, ImportOfForbiddenModuleIsRejectedBeforeRunning) {
    ExecutionOutcome outcome = execute("import socket\nresult = 1");

    EXPECT_EQ(outcome.kind, OutcomeKind::VALIDATION_FAILURE);
    EXPECT_EQ(outcome.construct, "Import");
    EXPECT_EQ(outcome.line, 1);
    EXPECT_EQ(to_response(outcome)["status"].asString(), "validation_error");
}

TEST_F(ExecutionScenarioTest, IntrospectionEscapesAreRejected) {
    const char* attempts[] = {
        "().__class__.__bases__[0].__subclasses__()",
        "getattr(client, '_session')",
        "eval('1 + 1')",
        "f = lambda: 1",
        "def f():\n    pass\n",
    };
    for (const char* code : attempts) {
        EXPECT_EQ(execute(code).kind, OutcomeKind::VALIDATION_FAILURE) << code;
    }
}

TEST_F(ExecutionScenarioTest, SyntaxErrorsAreValidationFailures) {
    ExecutionOutcome outcome = execute("result = (1 +");

    EXPECT_EQ(outcome.kind, OutcomeKind::VALIDATION_FAILURE);
    EXPECT_EQ(outcome.construct, "SyntaxError");
    EXPECT_GT(outcome.line, 0);
}

TEST_F(ExecutionScenarioTest, InfiniteLoopTimesOut) {
    auto start = steady_clock::now();

    ExecutionOutcome outcome = execute("while True:\n    pass\n");

    auto elapsed = steady_clock::now() - start;
    EXPECT_EQ(outcome.kind, OutcomeKind::TIMEOUT);
    EXPECT_GE(elapsed, milliseconds(1900));
    EXPECT_LT(elapsed, milliseconds(3000));
    EXPECT_EQ(executor->active_workers(), 0u);
}

TEST_F(ExecutionScenarioTest, DeeplyNestedResultIsTruncated) {
    std::string code =
        "d = {}\n"
        "for i in range(10000):\n"
        "    d = {'k': d}\n"
        "result = d\n";

    ExecutionOutcome outcome = execute(code);

    ASSERT_EQ(outcome.kind, OutcomeKind::SUCCESS) << outcome.message;
    EXPECT_TRUE(outcome.truncated);
    Json::Value cursor = outcome.result;
    int depth = 0;
    while (cursor.isObject()) {
        cursor = cursor["k"];
        ++depth;
    }
    EXPECT_EQ(depth, static_cast<int>(DEFAULT_MAX_RESULT_DEPTH));
    EXPECT_EQ(cursor.asString(), TRUNCATION_MARKER);
}

TEST_F(ExecutionScenarioTest, SelfReferentialListIsTruncated) {
    ExecutionOutcome outcome = execute("a = []\na.append(a)\nresult = a\n");

    ASSERT_EQ(outcome.kind, OutcomeKind::SUCCESS) << outcome.message;
    EXPECT_TRUE(outcome.truncated);
    Json::Value cursor = outcome.result;
    int depth = 0;
    while (cursor.isArray()) {
        ASSERT_EQ(cursor.size(), 1u);
        cursor = cursor[0];
        ++depth;
    }
    EXPECT_EQ(depth, static_cast<int>(DEFAULT_MAX_RESULT_DEPTH));
    EXPECT_EQ(cursor.asString(), TRUNCATION_MARKER);
}

TEST_F(ExecutionScenarioTest, SelfReferentialDictIsTruncated) {
    ExecutionOutcome outcome = execute("d = {}\nd['self'] = d\nresult = d\n");

    ASSERT_EQ(outcome.kind, OutcomeKind::SUCCESS) << outcome.message;
    EXPECT_TRUE(outcome.truncated);
    Json::Value cursor = outcome.result;
    int depth = 0;
    while (cursor.isObject()) {
        cursor = cursor["self"];
        ++depth;
    }
    EXPECT_EQ(depth, static_cast<int>(DEFAULT_MAX_RESULT_DEPTH));
    EXPECT_EQ(cursor.asString(), TRUNCATION_MARKER);
}

TEST_F(ExecutionScenarioTest, ResultAtTheLargestAllowedDepthSurvivesTheChannel) {
    // Given: A policy at the depth ceiling and a result nested past it
    PolicyConfig config = PolicyStore::defaults();
    config.timeout = seconds(5);
    config.max_result_depth = MAX_ALLOWED_RESULT_DEPTH;
    CodeExecutor deep_executor(PolicyStore::freeze(config));
    ExecutionRequest request;
    request.code =
        "a = []\n"
        "for i in range(" + std::to_string(MAX_ALLOWED_RESULT_DEPTH + 200) + "):\n"
        "    a = [a]\n"
        "result = a\n";

    // When
    ExecutionOutcome outcome = deep_executor.execute(request, catalog);

    // Then: A truncated success, not a malformed worker message
    ASSERT_EQ(outcome.kind, OutcomeKind::SUCCESS) << outcome.message;
    EXPECT_TRUE(outcome.truncated);
    Json::Value cursor = outcome.result;
    size_t depth = 0;
    while (cursor.isArray() && cursor.size() == 1) {
        cursor = cursor[0];
        ++depth;
    }
    EXPECT_EQ(depth, MAX_ALLOWED_RESULT_DEPTH);
    EXPECT_EQ(cursor.asString(), TRUNCATION_MARKER);
}

TEST_F(ExecutionScenarioTest, ResultLargerThanOneMessageIsASerializationFailure) {
    // Given: Few nodes but more bytes than a channel frame holds
    ExecutionOutcome outcome = execute("result = 'x' * " + std::to_string(MAX_FRAME_BYTES + 1024));

    EXPECT_EQ(outcome.kind, OutcomeKind::SERIALIZATION_FAILURE);
    EXPECT_NE(outcome.message.find("maximum message size"), std::string::npos) << outcome.message;
}

TEST_F(ExecutionScenarioTest, HugeErrorMessageIsSanitizedAndCapped) {
    ExecutionOutcome outcome = execute("raise ValueError('password=' + 'a' * 200000)");

    EXPECT_EQ(outcome.kind, OutcomeKind::RUNTIME_FAILURE);
    EXPECT_LE(outcome.message.size(), MAX_ERROR_MESSAGE_LENGTH);
    EXPECT_EQ(outcome.message.find("ValueError: password=<redacted>"), 0u) << outcome.message;
}

TEST_F(ExecutionScenarioTest, RaisedErrorIsAnExecutionError) {
    ExecutionOutcome outcome = execute("raise ValueError('boom')");

    EXPECT_EQ(outcome.kind, OutcomeKind::RUNTIME_FAILURE);
    Json::Value response = to_response(outcome);
    EXPECT_EQ(response["status"].asString(), "execution_error");
    EXPECT_NE(response["error"].asString().find("ValueError: boom"), std::string::npos);
}

TEST_F(ExecutionScenarioTest, UnknownItemSurfacesAsClientError) {
    ExecutionOutcome outcome = execute("client.get_item('i-missing')");

    EXPECT_EQ(outcome.kind, OutcomeKind::RUNTIME_FAILURE);
    EXPECT_EQ(outcome.message, "ClientError: Item not found: i-missing");
}

TEST_F(ExecutionScenarioTest, OversizedResultIsASerializationFailure) {
    ExecutionOutcome outcome = execute("result = list(range(200000))");

    EXPECT_EQ(outcome.kind, OutcomeKind::SERIALIZATION_FAILURE);
    EXPECT_EQ(to_response(outcome)["error"].asString().find("Result could not be serialized: "), 0u);
}

TEST_F(ExecutionScenarioTest, ConcurrentRequestsDoNotShareState) {
    std::vector<ExecutionOutcome> outcomes(6);
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; i++) {
        threads.emplace_back([this, &outcomes, i] {
            std::string code =
                "try:\n"
                "    seen = shared\n"
                "except NameError:\n"
                "    seen = None\n"
                "shared = " + std::to_string(i) + "\n"
                "result = [seen, shared]\n";
            outcomes[i] = execute(code);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < 6; i++) {
        ASSERT_EQ(outcomes[i].kind, OutcomeKind::SUCCESS) << outcomes[i].message;
        EXPECT_TRUE(outcomes[i].result[0].isNull());
        EXPECT_EQ(outcomes[i].result[1].asInt(), i);
    }
}

TEST_F(ExecutionScenarioTest, NormalizationIsIdempotent) {
    Value value = Value::dict({{Value(1), Value::tuple({Value(2.5), Value("x")})}});

    NormalizedResult once = executor->normalize(value);
    ResultNormalizer normalizer(DEFAULT_MAX_RESULT_DEPTH, DEFAULT_MAX_RESULT_SIZE);
    NormalizedResult twice = normalizer.normalize(once.value);

    EXPECT_EQ(once.value, twice.value);
}

TEST_F(ExecutionScenarioTest, PrintOutputIsReturned) {
    ExecutionOutcome outcome = execute("for i in range(3):\n    print(i)\nresult = 'done'");

    ASSERT_EQ(outcome.kind, OutcomeKind::SUCCESS) << outcome.message;
    EXPECT_EQ(outcome.output, "0\n1\n2\n");
    EXPECT_EQ(to_response(outcome)["output"].asString(), "0\n1\n2\n");
}

}  // namespace
}  // namespace codegate
