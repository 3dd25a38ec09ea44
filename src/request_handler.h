#pragma once

#include "http_server.h"
#include "rate_limiter.h"
#include "codegate/executor.h"
#include "codegate/service_client.h"
#include <json/json.h>
#include <atomic>
#include <iosfwd>
#include <string>

namespace codegate {

// Transport-independent request handling shared by the HTTP and stdio front ends
class RequestHandler {
public:
    RequestHandler(CodeExecutor& executor, const ClientRegistry& registry);

    // Resolves the resource hint to a client, then validates and runs the snippet
    Json::Value execute(const ExecutionRequest& request);

    // Same, from a request document; malformed documents become validation errors
    Json::Value execute(const Json::Value& body);

    // JSON schema of the execute tool's input
    Json::Value input_schema() const;

    // Resource listing, one entry per registered client
    Json::Value list_resources() const;

    // Throws std::invalid_argument for unknown URIs
    Json::Value read_resource(const std::string& uri) const;

    Json::Value health() const;

    // One JSON document per line in, one compact response per line out:
    // {"code": ...} executes; {"method": "list_resources" | "read_resource" |
    // "schema" | "health"} answers the corresponding query.
    std::string handle_line(const std::string& line);
    void serve_stdio(std::istream& in, std::ostream& out);

private:
    CodeExecutor& executor_;
    const ClientRegistry& registry_;
};

// Registers POST /execute, GET /health, GET /schema and GET /resources.
// /execute is admitted through `limiter` per client IP.
void install_routes(HttpServer& server, RequestHandler& handler, RateLimiter& limiter);

} // namespace codegate
