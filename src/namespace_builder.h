#pragma once

#include "builtins.h"
#include "client_gateway.h"
#include "codegate/policy.h"
#include <map>
#include <memory>
#include <string>
#include <unordered_map>

namespace codegate {

// Everything a snippet can reach by name. Built fresh for each request and
// discarded with the worker.
struct Namespace {
    std::unordered_map<std::string, Value> globals;
    std::map<std::string, Value> builtins;
    std::shared_ptr<OutputBuffer> output;
    PolicyPtr policy;
};

class NamespaceBuilder {
public:
    explicit NamespaceBuilder(PolicyPtr policy);

    // Globals hold only the client binding; modules are materialized on import
    Namespace build(std::shared_ptr<ClientGateway> gateway) const;

private:
    PolicyPtr policy_;
};

} // namespace codegate
