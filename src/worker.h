#pragma once

#include "ast.h"
#include "channel.h"
#include "client_gateway.h"
#include "codegate/policy.h"
#include <json/json.h>
#include <sys/types.h>
#include <memory>
#include <set>
#include <string>

namespace codegate {

// Everything the forked worker needs; shared with the parent through fork.
struct WorkerTask {
    const ast::Module* module = nullptr;
    PolicyPtr policy;
    std::set<std::string> operations;   // What the bound client answers to
    pid_t supervisor_pid = 0;
};

// Worker-side client binding: every call is a round trip to the supervisor.
class ChannelClientGateway : public ClientGateway {
public:
    ChannelClientGateway(MessageChannel& channel, std::set<std::string> operations);

    bool has_operation(const std::string& name) const override;
    Value invoke(const std::string& operation, const CallArgs& args) override;

private:
    MessageChannel& channel_;
    std::set<std::string> operations_;
};

// Interprets the snippet and returns the final worker message:
//   {"type":"result","value":...,"truncated":bool}
//   {"type":"error","error_type":...,"message":...}
//   {"type":"serialization_error","message":...}
// with "output"/"output_truncated" attached when output capture is on.
Json::Value execute_in_worker(const WorkerTask& task, std::shared_ptr<ClientGateway> gateway);

// Child side of a supervised run: confines the process, executes, reports and
// exits. Never returns.
[[noreturn]] void run_worker(const WorkerTask& task, UniqueFd channel);

} // namespace codegate
