/**
 * Unit tests for request parsing and the response document
 */

#include <gtest/gtest.h>
#include "codegate/outcome.h"
#include <stdexcept>

using namespace codegate;
using namespace std::chrono;

// ============================================================================
// Test Contract: ExecutionRequest::from_json
// ============================================================================

TEST(ExecutionRequestTest, ReadsCodeAndHint) {
    Json::Value body;
    body["code"] = "result = 1";
    body["resourceHint"] = "catalog";

    ExecutionRequest request = ExecutionRequest::from_json(body);

    EXPECT_EQ(request.code, "result = 1");
    EXPECT_EQ(request.resource_hint, "catalog");
}

TEST(ExecutionRequestTest, HintIsOptional) {
    Json::Value body;
    body["code"] = "1";
    body["resourceHint"] = Json::nullValue;

    EXPECT_TRUE(ExecutionRequest::from_json(body).resource_hint.empty());
}

TEST(ExecutionRequestTest, RejectsMalformedBodies) {
    Json::Value no_code(Json::objectValue);
    Json::Value numeric_code;
    numeric_code["code"] = 5;
    Json::Value bad_hint;
    bad_hint["code"] = "1";
    bad_hint["resourceHint"] = 3;

    EXPECT_THROW(ExecutionRequest::from_json(Json::Value("code")), std::invalid_argument);
    EXPECT_THROW(ExecutionRequest::from_json(no_code), std::invalid_argument);
    EXPECT_THROW(ExecutionRequest::from_json(numeric_code), std::invalid_argument);
    EXPECT_THROW(ExecutionRequest::from_json(bad_hint), std::invalid_argument);
}

// ============================================================================
// Test Contract: to_response
// ============================================================================

TEST(OutcomeResponseTest, SuccessCarriesResultOnly) {
    NormalizedResult normalized;
    normalized.value = Json::Value(Json::arrayValue);
    normalized.value.append(1);

    Json::Value response = to_response(ExecutionOutcome::success(normalized));

    EXPECT_EQ(response["status"].asString(), "success");
    EXPECT_EQ(response["result"][0].asInt(), 1);
    EXPECT_FALSE(response.isMember("error"));
    EXPECT_FALSE(response.isMember("truncated"));
}

TEST(OutcomeResponseTest, TruncationIsFlagged) {
    NormalizedResult normalized;
    normalized.value = "<truncated>";
    normalized.truncated = true;

    EXPECT_TRUE(to_response(ExecutionOutcome::success(normalized))["truncated"].asBool());
}

TEST(OutcomeResponseTest, ValidationFailureNamesTheConstruct) {
    ValidationVerdict verdict = ValidationVerdict::reject("Import of module 'os' is not allowed", "Import", 2, 1);

    Json::Value response = to_response(ExecutionOutcome::validation_failure(verdict));

    EXPECT_EQ(response["status"].asString(), "validation_error");
    EXPECT_EQ(response["construct"].asString(), "Import");
    EXPECT_EQ(response["line"].asInt(), 2);
    EXPECT_EQ(response["column"].asInt(), 1);
    EXPECT_FALSE(response.isMember("result"));
}

TEST(OutcomeResponseTest, TimeoutNamesTheLimit) {
    Json::Value response = to_response(ExecutionOutcome::timeout(milliseconds(2000)));

    EXPECT_EQ(response["status"].asString(), "timeout");
    EXPECT_EQ(response["error"].asString(), "Execution exceeded the time limit of 2000 ms");
}

TEST(OutcomeResponseTest, SerializationFailureIsAnExecutionError) {
    Json::Value response = to_response(ExecutionOutcome::serialization_failure("too big"));

    EXPECT_EQ(response["status"].asString(), "execution_error");
    EXPECT_EQ(response["error"].asString(), "Result could not be serialized: too big");
}

TEST(OutcomeResponseTest, OutputIsIncludedWhenPresent) {
    ExecutionOutcome outcome = ExecutionOutcome::runtime_failure("ValueError: boom");
    outcome.output = "partial\n";
    outcome.output_truncated = true;

    Json::Value response = to_response(outcome);

    EXPECT_EQ(response["status"].asString(), "execution_error");
    EXPECT_EQ(response["output"].asString(), "partial\n");
    EXPECT_TRUE(response["outputTruncated"].asBool());
    EXPECT_FALSE(to_response(ExecutionOutcome::runtime_failure("x")).isMember("output"));
}

TEST(OutcomeResponseTest, StatusNames) {
    EXPECT_STREQ(status_name(OutcomeKind::SUCCESS), "success");
    EXPECT_STREQ(status_name(OutcomeKind::VALIDATION_FAILURE), "validation_error");
    EXPECT_STREQ(status_name(OutcomeKind::TIMEOUT), "timeout");
    EXPECT_STREQ(status_name(OutcomeKind::RUNTIME_FAILURE), "execution_error");
    EXPECT_STREQ(status_name(OutcomeKind::SERIALIZATION_FAILURE), "execution_error");
}
