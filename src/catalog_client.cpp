#include "catalog_client.h"
#include "builtins.h"
#include "codegate/errors.h"
#include <algorithm>
#include <fstream>

namespace codegate {

namespace {

Value item_to_value(const CatalogItem& item) {
    Value tags = Value::dict();
    for (const auto& tag : item.tags) {
        tags.as_dict().set(Value(tag.first), Value(tag.second));
    }
    return Value::dict({
        {Value("id"), Value(item.id)},
        {Value("kind"), Value(item.kind)},
        {Value("name"), Value(item.name)},
        {Value("region"), Value(item.region)},
        {Value("state"), Value(item.state)},
        {Value("size_gb"), Value(static_cast<long long>(item.size_gb))},
        {Value("created_at"), Value::opaque("datetime", item.created_at)},
        {Value("tags"), tags},
    });
}

// Positional-or-keyword argument; nullptr when not given or None
const Value* argument(const CallArgs& args, size_t index, const std::string& name) {
    const Value* value = nullptr;
    if (index < args.positional.size()) {
        value = &args.positional[index];
    } else {
        value = args.keyword(name);
    }
    return (value && !value->is_none()) ? value : nullptr;
}

std::string string_argument(const Value* value, const std::string& operation, const std::string& name) {
    if (!value->is_str()) {
        throw ScriptError("TypeError", operation + "() argument '" + name + "' must be str, not " +
                          value->type_name());
    }
    return value->as_str();
}

std::string required_string(const Json::Value& object, const char* key) {
    if (!object.isMember(key) || !object[key].isString()) {
        throw ConfigError(std::string("catalog item field '") + key + "' must be a string");
    }
    return object[key].asString();
}

std::string optional_string(const Json::Value& object, const char* key, const std::string& fallback) {
    if (!object.isMember(key)) return fallback;
    if (!object[key].isString()) {
        throw ConfigError(std::string("catalog item field '") + key + "' must be a string");
    }
    return object[key].asString();
}

int64_t optional_int(const Json::Value& object, const char* key) {
    if (!object.isMember(key)) return 0;
    if (!object[key].isInt64()) {
        throw ConfigError(std::string("catalog item field '") + key + "' must be an integer");
    }
    return object[key].asInt64();
}

} // namespace

CatalogClient::CatalogClient(std::vector<CatalogItem> items, std::string name)
    : name_(std::move(name)), items_(std::move(items)) {}

std::shared_ptr<CatalogClient> CatalogClient::demo() {
    std::vector<CatalogItem> items = {
        {"i-0a1b2c3d", "instance", "web-1", "us-east-1", "running", 8, "2024-03-01T10:15:00Z",
         {{"env", "prod"}, {"team", "web"}}},
        {"i-0e4f5a6b", "instance", "web-2", "us-east-1", "running", 8, "2024-03-01T10:16:00Z",
         {{"env", "prod"}, {"team", "web"}}},
        {"i-07c8d9e0", "instance", "batch-1", "eu-west-1", "stopped", 32, "2024-05-12T08:00:00Z",
         {{"env", "staging"}, {"team", "data"}}},
        {"b-logs", "bucket", "app-logs", "us-east-1", "available", 120, "2023-11-20T00:00:00Z",
         {{"env", "prod"}}},
        {"b-reports", "bucket", "reports", "eu-west-1", "available", 4, "2024-01-05T12:30:00Z",
         {{"team", "data"}}},
        {"q-orders", "queue", "orders", "us-east-1", "available", 0, "2024-02-14T09:45:00Z",
         {{"env", "prod"}, {"team", "web"}}},
    };
    return std::make_shared<CatalogClient>(std::move(items));
}

std::shared_ptr<CatalogClient> CatalogClient::from_json(const Json::Value& document) {
    if (!document.isObject() || !document["items"].isArray()) {
        throw ConfigError("catalog document must be an object with an 'items' array");
    }

    std::vector<CatalogItem> items;
    for (const auto& entry : document["items"]) {
        if (!entry.isObject()) {
            throw ConfigError("catalog items must be objects");
        }
        CatalogItem item;
        item.id = required_string(entry, "id");
        item.kind = required_string(entry, "kind");
        item.name = optional_string(entry, "name", item.id);
        item.region = optional_string(entry, "region", "");
        item.state = optional_string(entry, "state", "");
        item.size_gb = optional_int(entry, "size_gb");
        item.created_at = optional_string(entry, "created_at", "");
        if (entry.isMember("tags")) {
            const Json::Value& tags = entry["tags"];
            if (!tags.isObject()) {
                throw ConfigError("catalog item field 'tags' must be an object");
            }
            for (const auto& key : tags.getMemberNames()) {
                if (!tags[key].isString()) {
                    throw ConfigError("catalog tag '" + key + "' must be a string");
                }
                item.tags[key] = tags[key].asString();
            }
        }
        items.push_back(std::move(item));
    }
    std::string name = "catalog";
    if (document.isMember("name")) {
        if (!document["name"].isString()) {
            throw ConfigError("catalog 'name' must be a string");
        }
        name = document["name"].asString();
    }
    return std::make_shared<CatalogClient>(std::move(items), name);
}

std::shared_ptr<CatalogClient> CatalogClient::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open catalog file " + path);
    }

    Json::CharReaderBuilder builder;
    Json::Value document;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &document, &errors)) {
        throw ConfigError("invalid catalog file " + path + ": " + errors);
    }
    return from_json(document);
}

std::string CatalogClient::description() const {
    return "Read-only inventory of cloud resources (instances, buckets, queues)";
}

std::vector<OperationInfo> CatalogClient::operations() const {
    return {
        {"list_items", "list_items(kind=None, region=None, limit=None) -> list of item dicts"},
        {"get_item", "get_item(id) -> item dict; raises ClientError when unknown"},
        {"count_items", "count_items(kind=None, region=None) -> int"},
        {"describe", "describe() -> summary of the inventory"},
    };
}

Value CatalogClient::call(const std::string& operation, const CallArgs& args) {
    if (operation == "list_items") return list_items(args);
    if (operation == "get_item") return get_item(args);
    if (operation == "count_items") return count_items(args);
    if (operation == "describe") return describe(args);
    throw ScriptError("AttributeError", "client has no operation '" + operation + "'");
}

std::vector<const CatalogItem*> CatalogClient::filter(const CallArgs& args,
                                                      const std::string& operation) const {
    const Value* kind = argument(args, 0, "kind");
    const Value* region = argument(args, 1, "region");
    std::string kind_filter = kind ? string_argument(kind, operation, "kind") : "";
    std::string region_filter = region ? string_argument(region, operation, "region") : "";

    std::vector<const CatalogItem*> matches;
    for (const auto& item : items_) {
        if (!kind_filter.empty() && item.kind != kind_filter) continue;
        if (!region_filter.empty() && item.region != region_filter) continue;
        matches.push_back(&item);
    }
    return matches;
}

Value CatalogClient::list_items(const CallArgs& args) const {
    check_arity(args, "list_items", 0, 3);
    check_keywords(args, "list_items", {"kind", "region", "limit"});

    auto matches = filter(args, "list_items");
    size_t limit = matches.size();
    if (const Value* value = argument(args, 2, "limit")) {
        if (!value->is_int() || value->as_int() < 0) {
            throw ScriptError("ValueError", "list_items() limit must be a non-negative int");
        }
        limit = std::min(limit, static_cast<size_t>(value->as_int()));
    }

    std::vector<Value> items;
    for (size_t i = 0; i < limit; ++i) {
        items.push_back(item_to_value(*matches[i]));
    }
    return Value::list(std::move(items));
}

Value CatalogClient::get_item(const CallArgs& args) const {
    check_arity(args, "get_item", 0, 1);
    check_keywords(args, "get_item", {"id"});

    const Value* id = argument(args, 0, "id");
    if (!id) {
        throw ScriptError("TypeError", "get_item() missing required argument 'id'");
    }
    std::string wanted = string_argument(id, "get_item", "id");
    for (const auto& item : items_) {
        if (item.id == wanted) return item_to_value(item);
    }
    throw ClientError("Item not found: " + wanted);
}

Value CatalogClient::count_items(const CallArgs& args) const {
    check_arity(args, "count_items", 0, 2);
    check_keywords(args, "count_items", {"kind", "region"});
    return Value(static_cast<long long>(filter(args, "count_items").size()));
}

Value CatalogClient::describe(const CallArgs& args) const {
    check_arity(args, "describe", 0, 0);
    check_no_keywords(args, "describe");

    std::map<std::string, int64_t> kinds;
    for (const auto& item : items_) {
        ++kinds[item.kind];
    }
    Value by_kind = Value::dict();
    for (const auto& kind : kinds) {
        by_kind.as_dict().set(Value(kind.first), Value(static_cast<long long>(kind.second)));
    }

    std::vector<Value> ops;
    for (const auto& op : operations()) {
        ops.push_back(Value(op.name));
    }
    return Value::dict({
        {Value("name"), Value(name_)},
        {Value("description"), Value(description())},
        {Value("total"), Value(static_cast<long long>(items_.size()))},
        {Value("kinds"), by_kind},
        {Value("operations"), Value::list(std::move(ops))},
    });
}

} // namespace codegate
