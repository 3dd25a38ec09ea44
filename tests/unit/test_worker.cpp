/**
 * Unit tests for the worker side of a supervised run
 *
 * execute_in_worker runs in-process here; the forked path is exercised by
 * the supervisor integration tests.
 */

#include <gtest/gtest.h>
#include "test_support.h"
#include "../../src/worker.h"
#include <thread>

using namespace codegate;
using namespace codegate::testing_support;

namespace {

Json::Value run_in_worker(const std::string& code, PolicyPtr policy = default_policy()) {
    ast::Module module = Parser::parse(code);
    WorkerTask task;
    task.module = &module;
    task.policy = policy;
    return execute_in_worker(task, std::make_shared<FakeGateway>());
}

} // namespace

// ============================================================================
// Test Contract: Final worker message
// ============================================================================

TEST(WorkerExecutionTest, SuccessCarriesNormalizedValue) {
    Json::Value message = run_in_worker("result = {'total': 3, 'items': (1, 2)}");

    EXPECT_EQ(message["type"].asString(), "result");
    EXPECT_EQ(message["value"]["total"].asInt(), 3);
    EXPECT_TRUE(message["value"]["items"].isArray());
    EXPECT_FALSE(message["truncated"].asBool());
}

TEST(WorkerExecutionTest, ScriptErrorsBecomeErrorMessages) {
    Json::Value message = run_in_worker("raise KeyError('missing')");

    EXPECT_EQ(message["type"].asString(), "error");
    EXPECT_EQ(message["error_type"].asString(), "KeyError");
    EXPECT_EQ(message["message"].asString(), "missing");
}

TEST(WorkerExecutionTest, OversizedResultIsASerializationError) {
    PolicyConfig config = PolicyStore::defaults();
    config.max_result_size = 50;

    Json::Value message = run_in_worker("result = list(range(100))", PolicyStore::freeze(config));

    EXPECT_EQ(message["type"].asString(), "serialization_error");
    EXPECT_NE(message["message"].asString().find("maximum size"), std::string::npos);
}

TEST(WorkerExecutionTest, ResultTooLargeForOneFrameIsASerializationError) {
    Json::Value message = run_in_worker("print('before')\nresult = 'x' * " + std::to_string(MAX_FRAME_BYTES));

    EXPECT_EQ(message["type"].asString(), "serialization_error");
    EXPECT_NE(message["message"].asString().find("maximum message size"), std::string::npos);
    EXPECT_EQ(message["output"].asString(), "before\n");
    EXPECT_LE(MessageChannel::serialize(message).size(), MAX_FRAME_BYTES);
}

TEST(WorkerExecutionTest, LongErrorMessagesAreClipped) {
    Json::Value message = run_in_worker("raise ValueError('e' * 200000)");

    EXPECT_EQ(message["type"].asString(), "error");
    EXPECT_LE(message["message"].asString().size(), MAX_RAW_ERROR_LENGTH);
}

TEST(WorkerExecutionTest, DeepResultIsTruncated) {
    std::string code =
        "x = []\n"
        "for i in range(200):\n"
        "    x = [x]\n"
        "result = x\n";

    Json::Value message = run_in_worker(code);

    EXPECT_EQ(message["type"].asString(), "result");
    EXPECT_TRUE(message["truncated"].asBool());
}

TEST(WorkerExecutionTest, OutputIsAttachedWhenCaptured) {
    Json::Value message = run_in_worker("print('hello')\nresult = 1");

    EXPECT_EQ(message["output"].asString(), "hello\n");
    EXPECT_FALSE(message["output_truncated"].asBool());
}

TEST(WorkerExecutionTest, OutputIsOmittedWhenCaptureIsOff) {
    PolicyConfig config = PolicyStore::defaults();
    config.capture_output = false;

    Json::Value message = run_in_worker("print('hello')", PolicyStore::freeze(config));

    EXPECT_FALSE(message.isMember("output"));
}

TEST(WorkerExecutionTest, OutputSurvivesAFailure) {
    Json::Value message = run_in_worker("print('before')\n1 / 0");

    EXPECT_EQ(message["type"].asString(), "error");
    EXPECT_EQ(message["output"].asString(), "before\n");
}

// ============================================================================
// Test Contract: ChannelClientGateway
// ============================================================================

class ChannelGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto pair = MessageChannel::create_pair();
        supervisor = std::make_unique<MessageChannel>(std::move(pair.first));
        worker = std::make_unique<MessageChannel>(std::move(pair.second));
        gateway = std::make_unique<ChannelClientGateway>(*worker, std::set<std::string>{"get_item"});
    }

    // Answers one call with `reply` and records the request
    std::thread answer_once(Json::Value reply) {
        return std::thread([this, reply] {
            if (supervisor->receive(last_request) == ReadStatus::OK) supervisor->send(reply);
        });
    }

    std::unique_ptr<MessageChannel> supervisor;
    std::unique_ptr<MessageChannel> worker;
    std::unique_ptr<ChannelClientGateway> gateway;
    Json::Value last_request;
};

TEST_F(ChannelGatewayTest, KnowsItsOperations) {
    EXPECT_TRUE(gateway->has_operation("get_item"));
    EXPECT_FALSE(gateway->has_operation("drop_table"));
}

TEST_F(ChannelGatewayTest, CallRoundTripsThroughTheSupervisor) {
    // Given
    Json::Value reply;
    reply["type"] = "return";
    reply["value"] = "web-1";
    std::thread peer = answer_once(reply);

    // When
    CallArgs args;
    args.positional.push_back(Value("i-1"));
    args.keywords.emplace_back("verbose", Value(true));
    Value result = gateway->invoke("get_item", args);
    peer.join();

    // Then
    EXPECT_EQ(to_display(result), "web-1");
    EXPECT_EQ(last_request["type"].asString(), "call");
    EXPECT_EQ(last_request["operation"].asString(), "get_item");
    EXPECT_EQ(last_request["args"][0].asString(), "i-1");
    EXPECT_TRUE(last_request["kwargs"]["verbose"].asBool());
}

TEST_F(ChannelGatewayTest, RaiseReplyBecomesScriptError) {
    Json::Value reply;
    reply["type"] = "raise";
    reply["error_type"] = "ClientError";
    reply["message"] = "Item not found: i-9";
    std::thread peer = answer_once(reply);

    try {
        gateway->invoke("get_item", CallArgs{});
        peer.join();
        FAIL() << "Expected ScriptError";
    } catch (const ScriptError& e) {
        peer.join();
        EXPECT_EQ(e.type(), "ClientError");
        EXPECT_EQ(e.message(), "Item not found: i-9");
    }
}

TEST_F(ChannelGatewayTest, ClosedChannelIsARuntimeError) {
    supervisor.reset();

    try {
        gateway->invoke("get_item", CallArgs{});
        FAIL() << "Expected ScriptError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.type(), "RuntimeError");
    }
}
