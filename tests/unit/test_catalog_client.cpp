/**
 * Unit tests for CatalogClient
 */

#include <gtest/gtest.h>
#include "../../src/catalog_client.h"
#include "codegate/errors.h"
#include <cstdio>
#include <fstream>

using namespace codegate;

namespace {

CallArgs positional(std::vector<Value> values) {
    CallArgs args;
    args.positional = std::move(values);
    return args;
}

CallArgs keywords(std::vector<std::pair<std::string, Value>> values) {
    CallArgs args;
    args.keywords = std::move(values);
    return args;
}

Value field(const Value& item, const char* key) {
    const Value* value = item.as_dict().find(Value(key));
    return value ? *value : Value();
}

} // namespace

class CatalogClientTest : public ::testing::Test {
protected:
    std::shared_ptr<CatalogClient> client = CatalogClient::demo();
};

TEST_F(CatalogClientTest, AdvertisesItsOperations) {
    std::vector<std::string> names;
    for (const auto& op : client->operations()) names.push_back(op.name);

    EXPECT_EQ(client->name(), "catalog");
    EXPECT_EQ(names, (std::vector<std::string>{"list_items", "get_item", "count_items", "describe"}));
}

TEST_F(CatalogClientTest, ListItemsReturnsEverythingByDefault) {
    Value items = client->call("list_items", CallArgs{});

    ASSERT_TRUE(items.is_list());
    EXPECT_EQ(items.as_list().items.size(), 6u);
    EXPECT_EQ(to_display(field(items.as_list().items[0], "id")), "i-0a1b2c3d");
}

TEST_F(CatalogClientTest, ListItemsFiltersByKindAndRegion) {
    Value items = client->call("list_items", keywords({{"kind", Value("instance")}, {"region", Value("eu-west-1")}}));

    ASSERT_EQ(items.as_list().items.size(), 1u);
    EXPECT_EQ(to_display(field(items.as_list().items[0], "name")), "batch-1");
}

TEST_F(CatalogClientTest, ListItemsHonorsLimit) {
    EXPECT_EQ(client->call("list_items", keywords({{"limit", Value(2)}})).as_list().items.size(), 2u);
    EXPECT_EQ(client->call("list_items", keywords({{"limit", Value(0)}})).as_list().items.size(), 0u);
}

TEST_F(CatalogClientTest, ListItemsRejectsBadArguments) {
    try {
        client->call("list_items", keywords({{"limit", Value(-1)}}));
        FAIL() << "Expected ScriptError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.type(), "ValueError");
    }
    try {
        client->call("list_items", positional({Value(5)}));
        FAIL() << "Expected ScriptError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.type(), "TypeError");
    }
}

TEST_F(CatalogClientTest, ItemsCarryTimestampsAsOpaqueValues) {
    Value item = client->call("get_item", positional({Value("b-logs")}));

    Value created = field(item, "created_at");
    EXPECT_EQ(created.type_name(), "datetime");
    EXPECT_EQ(to_display(created), "2023-11-20T00:00:00Z");
    EXPECT_EQ(repr(field(item, "size_gb")), "120");
}

TEST_F(CatalogClientTest, GetItemUnknownIdIsAClientError) {
    EXPECT_THROW(client->call("get_item", positional({Value("nope")})), ClientError);
}

TEST_F(CatalogClientTest, CountItems) {
    EXPECT_EQ(repr(client->call("count_items", CallArgs{})), "6");
    EXPECT_EQ(repr(client->call("count_items", positional({Value("bucket")}))), "2");
}

TEST_F(CatalogClientTest, DescribeSummarizesInventory) {
    Value summary = client->call("describe", CallArgs{});

    EXPECT_EQ(repr(field(summary, "total")), "6");
    EXPECT_EQ(repr(field(summary, "kinds")), "{'bucket': 2, 'instance': 3, 'queue': 1}");
}

TEST_F(CatalogClientTest, UnknownOperationIsAnAttributeError) {
    try {
        client->call("delete_all", CallArgs{});
        FAIL() << "Expected ScriptError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.type(), "AttributeError");
    }
}

TEST(CatalogLoadingTest, FromJsonBuildsItems) {
    Json::Value doc;
    doc["name"] = "inventory";
    Json::Value item;
    item["id"] = "x-1";
    item["kind"] = "disk";
    item["tags"]["owner"] = "ops";
    doc["items"].append(item);

    auto client = CatalogClient::from_json(doc);

    EXPECT_EQ(client->name(), "inventory");
    Value loaded = client->call("get_item", positional({Value("x-1")}));
    EXPECT_EQ(to_display(field(loaded, "name")), "x-1");
    EXPECT_EQ(repr(field(loaded, "tags")), "{'owner': 'ops'}");
}

TEST(CatalogLoadingTest, MalformedDocumentsAreConfigErrors) {
    Json::Value no_items(Json::objectValue);
    Json::Value missing_kind;
    missing_kind["items"].append(Json::Value(Json::objectValue));
    missing_kind["items"][0]["id"] = "x";

    EXPECT_THROW(CatalogClient::from_json(no_items), ConfigError);
    EXPECT_THROW(CatalogClient::from_json(missing_kind), ConfigError);
    EXPECT_THROW(CatalogClient::load_file("/nonexistent/catalog.json"), ConfigError);
}

TEST(CatalogLoadingTest, IllTypedFieldsAreConfigErrors) {
    auto document_with = [](const char* key, const Json::Value& value) {
        Json::Value item;
        item["id"] = "x-1";
        item["kind"] = "disk";
        item[key] = value;
        Json::Value doc;
        doc["items"].append(item);
        return doc;
    };
    Json::Value bad_tag(Json::objectValue);
    bad_tag["owner"] = Json::Value(Json::arrayValue);
    Json::Value bad_name;
    bad_name["name"] = 7;
    bad_name["items"] = Json::Value(Json::arrayValue);

    EXPECT_THROW(CatalogClient::from_json(document_with("size_gb", "large")), ConfigError);
    EXPECT_THROW(CatalogClient::from_json(document_with("size_gb", Json::Value(Json::arrayValue))), ConfigError);
    EXPECT_THROW(CatalogClient::from_json(document_with("region", Json::Value(Json::objectValue))), ConfigError);
    EXPECT_THROW(CatalogClient::from_json(document_with("tags", bad_tag)), ConfigError);
    EXPECT_THROW(CatalogClient::from_json(document_with("tags", "ops")), ConfigError);
    EXPECT_THROW(CatalogClient::from_json(bad_name), ConfigError);
}

TEST(CatalogLoadingTest, LoadFileReadsJson) {
    std::string path = ::testing::TempDir() + "codegate_catalog.json";
    {
        std::ofstream out(path);
        out << R"({"items": [{"id": "q-1", "kind": "queue"}]})";
    }

    auto client = CatalogClient::load_file(path);
    std::remove(path.c_str());

    EXPECT_EQ(repr(client->call("count_items", CallArgs{})), "1");
}
