#pragma once

#include "codegate/value.h"
#include <string>

namespace codegate {

// What the snippet's `client` binding talks to. Inside a worker the
// implementation forwards every call to the supervisor; tests may bind a
// local implementation directly.
class ClientGateway {
public:
    virtual ~ClientGateway() = default;

    virtual bool has_operation(const std::string& name) const = 0;

    // Runs one client operation; failures surface as ScriptError
    virtual Value invoke(const std::string& operation, const CallArgs& args) = 0;
};

} // namespace codegate
