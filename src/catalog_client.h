#pragma once

#include "codegate/service_client.h"
#include <json/json.h>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace codegate {

struct CatalogItem {
    std::string id;
    std::string kind;           // "instance", "bucket", "queue", ...
    std::string name;
    std::string region;
    std::string state;
    int64_t size_gb = 0;
    std::string created_at;     // ISO-8601; surfaces as an opaque datetime
    std::map<std::string, std::string> tags;
};

// Read-only in-memory inventory of cloud-style resources. Stands in for a
// real service client in the binary and the tests.
class CatalogClient : public ServiceClient {
public:
    explicit CatalogClient(std::vector<CatalogItem> items, std::string name = "catalog");

    // Small fixed inventory across two regions
    static std::shared_ptr<CatalogClient> demo();

    // {"name": ..., "items": [{"id": ..., "kind": ..., ...}]}; throws ConfigError
    static std::shared_ptr<CatalogClient> from_json(const Json::Value& document);
    static std::shared_ptr<CatalogClient> load_file(const std::string& path);

    std::string name() const override { return name_; }
    std::string description() const override;
    std::vector<OperationInfo> operations() const override;
    Value call(const std::string& operation, const CallArgs& args) override;

private:
    std::string name_;
    std::vector<CatalogItem> items_;

    Value list_items(const CallArgs& args) const;
    Value get_item(const CallArgs& args) const;
    Value count_items(const CallArgs& args) const;
    Value describe(const CallArgs& args) const;

    std::vector<const CatalogItem*> filter(const CallArgs& args, const std::string& operation) const;
};

} // namespace codegate
