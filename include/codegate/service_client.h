#pragma once

#include "codegate/value.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace codegate {

struct OperationInfo {
    std::string name;
    std::string description;
};

// A pre-authorized service client. Snippets reach it only as `client.<op>(...)`;
// calls arrive from supervisor threads, so implementations must be thread-safe.
class ServiceClient {
public:
    virtual ~ServiceClient() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual std::vector<OperationInfo> operations() const = 0;

    // Throws ClientError for service failures and ScriptError for bad arguments
    virtual Value call(const std::string& operation, const CallArgs& args) = 0;
};

using ServiceClientPtr = std::shared_ptr<ServiceClient>;

// Clients by name. A request's resource hint selects one; the first client
// registered is the default.
class ClientRegistry {
public:
    void add(ServiceClientPtr client);

    // nullptr when no client has that name
    ServiceClientPtr find(const std::string& name) const;
    ServiceClientPtr default_client() const;

    std::vector<ServiceClientPtr> clients() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::vector<ServiceClientPtr> order_;
    std::map<std::string, ServiceClientPtr> by_name_;
};

} // namespace codegate
