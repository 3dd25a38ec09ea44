#include "codegate/service_client.h"
#include "codegate/errors.h"

namespace codegate {

void ClientRegistry::add(ServiceClientPtr client) {
    if (!client) {
        throw ConfigError("cannot register a null client");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string name = client->name();
    if (by_name_.count(name)) {
        throw ConfigError("duplicate client name '" + name + "'");
    }
    by_name_[name] = client;
    order_.push_back(std::move(client));
}

ServiceClientPtr ClientRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : it->second;
}

ServiceClientPtr ClientRegistry::default_client() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.empty() ? nullptr : order_.front();
}

std::vector<ServiceClientPtr> ClientRegistry::clients() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

bool ClientRegistry::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.empty();
}

} // namespace codegate
