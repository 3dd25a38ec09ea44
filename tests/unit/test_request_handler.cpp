/**
 * Unit tests for RequestHandler and ClientRegistry
 */

#include <gtest/gtest.h>
#include "../../src/request_handler.h"
#include "../../src/catalog_client.h"
#include "codegate/errors.h"
#include <sstream>

using namespace codegate;

namespace {

Json::Value parse_json(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::istringstream stream(text);
    Json::Value value;
    std::string errors;
    Json::parseFromStream(builder, stream, &value, &errors);
    return value;
}

} // namespace

class RequestHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.add(CatalogClient::demo());
        registry.add(std::make_shared<CatalogClient>(std::vector<CatalogItem>{}, "archive"));
        executor = std::make_unique<CodeExecutor>(PolicyStore::freeze(PolicyStore::defaults()));
        handler = std::make_unique<RequestHandler>(*executor, registry);
    }

    ClientRegistry registry;
    std::unique_ptr<CodeExecutor> executor;
    std::unique_ptr<RequestHandler> handler;
};

// ============================================================================
// Test Contract: ClientRegistry
// ============================================================================

TEST(ClientRegistryTest, FirstClientIsTheDefault) {
    ClientRegistry registry;
    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(registry.default_client(), nullptr);

    registry.add(CatalogClient::demo());
    registry.add(std::make_shared<CatalogClient>(std::vector<CatalogItem>{}, "other"));

    EXPECT_EQ(registry.default_client()->name(), "catalog");
    EXPECT_EQ(registry.find("other")->name(), "other");
    EXPECT_EQ(registry.find("missing"), nullptr);
    EXPECT_EQ(registry.clients().size(), 2u);
}

TEST(ClientRegistryTest, RejectsDuplicatesAndNull) {
    ClientRegistry registry;
    registry.add(CatalogClient::demo());

    EXPECT_THROW(registry.add(CatalogClient::demo()), ConfigError);
    EXPECT_THROW(registry.add(nullptr), ConfigError);
}

// ============================================================================
// Test Contract: execute
// ============================================================================

TEST_F(RequestHandlerTest, UnknownResourceHintIsRejected) {
    ExecutionRequest request;
    request.code = "result = 1";
    request.resource_hint = "billing";

    Json::Value response = handler->execute(request);

    EXPECT_EQ(response["status"].asString(), "validation_error");
    EXPECT_EQ(response["construct"].asString(), "resourceHint");
    EXPECT_EQ(response["error"].asString(), "Unknown resource 'billing'");
}

TEST_F(RequestHandlerTest, MalformedDocumentIsARequestError) {
    Json::Value body;
    body["script"] = "1";

    Json::Value response = handler->execute(body);

    EXPECT_EQ(response["status"].asString(), "validation_error");
    EXPECT_EQ(response["construct"].asString(), "request");
    EXPECT_EQ(response["error"].asString(), "Missing 'code' field");
}

TEST_F(RequestHandlerTest, RejectedSnippetNeverRuns) {
    Json::Value body;
    body["code"] = "import os\nos.system('id')";

    Json::Value response = handler->execute(body);

    EXPECT_EQ(response["status"].asString(), "validation_error");
    EXPECT_EQ(response["construct"].asString(), "Import");
    EXPECT_EQ(executor->active_workers(), 0u);
}

TEST_F(RequestHandlerTest, ResourceHintSelectsTheClient) {
    Json::Value body;
    body["code"] = "result = client.count_items()";
    body["resourceHint"] = "archive";

    Json::Value response = handler->execute(body);

    ASSERT_EQ(response["status"].asString(), "success") << response.toStyledString();
    EXPECT_EQ(response["result"].asInt(), 0);
}

// ============================================================================
// Test Contract: Discovery
// ============================================================================

TEST_F(RequestHandlerTest, SchemaDescribesTheTool) {
    Json::Value schema = handler->input_schema();

    EXPECT_EQ(schema["type"].asString(), "object");
    EXPECT_EQ(schema["required"][0].asString(), "code");
    EXPECT_FALSE(schema["additionalProperties"].asBool());
    std::string description = schema["properties"]["code"]["description"].asString();
    EXPECT_NE(description.find("json, math"), std::string::npos);
    EXPECT_NE(description.find("list_items"), std::string::npos);
}

TEST_F(RequestHandlerTest, ListsOneResourcePerClient) {
    Json::Value resources = handler->list_resources();

    ASSERT_EQ(resources.size(), 2u);
    EXPECT_EQ(resources[0]["uri"].asString(), "catalog://query_resources");
    EXPECT_EQ(resources[1]["uri"].asString(), "archive://query_resources");
    EXPECT_EQ(resources[0]["mimeType"].asString(), "application/json");
}

TEST_F(RequestHandlerTest, ReadResourceListsOperations) {
    Json::Value content = handler->read_resource("catalog://query_resources");

    EXPECT_TRUE(content["operations"].isMember("get_item"));
    EXPECT_NE(content["message"].asString().find("catalog"), std::string::npos);
}

TEST_F(RequestHandlerTest, ReadResourceRejectsBadUris) {
    EXPECT_THROW(handler->read_resource("no-scheme"), std::invalid_argument);
    EXPECT_THROW(handler->read_resource("billing://query_resources"), std::invalid_argument);
    EXPECT_THROW(handler->read_resource("catalog://elsewhere"), std::invalid_argument);
}

TEST_F(RequestHandlerTest, HealthReportsCapacity) {
    Json::Value health = handler->health();

    EXPECT_EQ(health["status"].asString(), "ok");
    EXPECT_EQ(health["active_workers"].asUInt64(), 0u);
    EXPECT_EQ(health["max_workers"].asUInt64(), DEFAULT_MAX_WORKERS);
    EXPECT_EQ(health["clients"].size(), 2u);
}

// ============================================================================
// Test Contract: stdio line protocol
// ============================================================================

TEST_F(RequestHandlerTest, LineWithInvalidJsonIsARequestError) {
    Json::Value response = parse_json(handler->handle_line("{not json"));

    EXPECT_EQ(response["status"].asString(), "validation_error");
    EXPECT_EQ(response["construct"].asString(), "request");
}

TEST_F(RequestHandlerTest, LineMethodsAnswerQueries) {
    Json::Value resources = parse_json(handler->handle_line(R"({"method": "list_resources"})"));
    Json::Value unknown = parse_json(handler->handle_line(R"({"method": "shutdown"})"));
    Json::Value bad_uri = parse_json(handler->handle_line(R"({"method": "read_resource", "uri": "x"})"));

    EXPECT_EQ(resources["resources"].size(), 2u);
    EXPECT_EQ(unknown["error"].asString(), "Unknown method: shutdown");
    EXPECT_TRUE(bad_uri.isMember("error"));
}

TEST_F(RequestHandlerTest, LineWithNonStringMethodOrUriIsAnError) {
    // Given: lines whose method or uri has the wrong JSON type
    std::string array_method = handler->handle_line(R"({"method": [1]})");
    std::string object_method = handler->handle_line(R"({"method": {"name": "health"}})");
    std::string object_uri = handler->handle_line(R"({"method": "read_resource", "uri": {}})");
    std::string missing_uri = handler->handle_line(R"({"method": "read_resource"})");

    // Then: each gets an error response instead of terminating the loop
    EXPECT_EQ(parse_json(array_method)["error"].asString(), "'method' must be a string");
    EXPECT_EQ(parse_json(object_method)["error"].asString(), "'method' must be a string");
    EXPECT_EQ(parse_json(object_uri)["error"].asString(), "'uri' must be a string");
    EXPECT_EQ(parse_json(missing_uri)["error"].asString(), "'uri' must be a string");
}

TEST_F(RequestHandlerTest, ServeStdioSurvivesIllTypedLines) {
    std::istringstream in("{\"method\": [1]}\n{\"method\": \"health\"}\n");
    std::ostringstream out;

    handler->serve_stdio(in, out);

    std::istringstream lines(out.str());
    std::string first, second;
    ASSERT_TRUE(std::getline(lines, first));
    ASSERT_TRUE(std::getline(lines, second));
    EXPECT_TRUE(parse_json(first).isMember("error"));
    EXPECT_EQ(parse_json(second)["status"].asString(), "ok");
}

TEST_F(RequestHandlerTest, ServeStdioAnswersEachLine) {
    std::istringstream in("{\"method\": \"health\"}\n\n{\"method\": \"schema\"}\n");
    std::ostringstream out;

    handler->serve_stdio(in, out);

    std::istringstream lines(out.str());
    std::string first, second, extra;
    ASSERT_TRUE(std::getline(lines, first));
    ASSERT_TRUE(std::getline(lines, second));
    EXPECT_FALSE(std::getline(lines, extra));
    EXPECT_EQ(parse_json(first)["status"].asString(), "ok");
    EXPECT_TRUE(parse_json(second).isMember("schema"));
}
