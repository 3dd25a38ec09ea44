#include "namespace_builder.h"
#include "codegate/constants.h"

namespace codegate {

NamespaceBuilder::NamespaceBuilder(PolicyPtr policy) : policy_(std::move(policy)) {}

Namespace NamespaceBuilder::build(std::shared_ptr<ClientGateway> gateway) const {
    Namespace ns;
    ns.policy = policy_;
    ns.output = std::make_shared<OutputBuffer>();
    ns.builtins = make_builtins(ns.output);
    ns.globals[CLIENT_BINDING_NAME] = Value::client(std::move(gateway));
    return ns;
}

} // namespace codegate
