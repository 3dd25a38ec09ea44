#include "request_handler.h"
#include "codegate/constants.h"
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace codegate {

namespace {

constexpr const char* RESOURCE_SCHEME = "://";
constexpr const char* QUERY_RESOURCE_PATH = "query_resources";

std::string to_compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

bool parse_document(const std::string& text, Json::Value& document, std::string& errors) {
    Json::CharReaderBuilder builder;
    builder["stackLimit"] = 200;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    try {
        return reader->parse(text.data(), text.data() + text.size(), &document, &errors);
    } catch (const Json::Exception& e) {
        errors = e.what();
        return false;
    }
}

Json::Value request_error(const std::string& message) {
    ValidationVerdict verdict = ValidationVerdict::reject(message, "request");
    return to_response(ExecutionOutcome::validation_failure(verdict));
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

} // namespace

RequestHandler::RequestHandler(CodeExecutor& executor, const ClientRegistry& registry)
    : executor_(executor), registry_(registry) {}

Json::Value RequestHandler::execute(const ExecutionRequest& request) {
    ServiceClientPtr client;
    if (request.resource_hint.empty()) {
        client = registry_.default_client();
    } else {
        client = registry_.find(request.resource_hint);
        if (!client) {
            ValidationVerdict verdict = ValidationVerdict::reject(
                "Unknown resource '" + request.resource_hint + "'", "resourceHint");
            return to_response(ExecutionOutcome::validation_failure(verdict));
        }
    }
    return to_response(executor_.execute(request, client));
}

Json::Value RequestHandler::execute(const Json::Value& body) {
    ExecutionRequest request;
    try {
        request = ExecutionRequest::from_json(body);
    } catch (const std::invalid_argument& e) {
        return request_error(e.what());
    }
    return execute(request);
}

Json::Value RequestHandler::input_schema() const {
    const PolicyConfig& policy = executor_.policy();

    std::vector<std::string> operations;
    for (const auto& client : registry_.clients()) {
        for (const auto& op : client->operations()) {
            if (policy.allowed_operations.empty() || policy.allowed_operations.count(op.name)) {
                operations.push_back(op.name);
            }
        }
    }

    std::ostringstream description;
    description << "Code snippet to run. The authorized client is bound as `" << CLIENT_BINDING_NAME
                << "`. Assign the value to return to `" << RESULT_BINDING_NAME
                << "` or end with an expression. Importable modules: " << join(policy.allowed_modules)
                << ". Client operations: " << join(operations) << ".";

    Json::Value schema;
    schema["type"] = "object";
    schema["properties"]["code"]["type"] = "string";
    schema["properties"]["code"]["description"] = description.str();
    schema["properties"]["resourceHint"]["type"] = "string";
    schema["properties"]["resourceHint"]["description"] = "Name of the client to bind; defaults to the first";
    schema["required"].append("code");
    schema["additionalProperties"] = false;
    return schema;
}

Json::Value RequestHandler::list_resources() const {
    Json::Value resources(Json::arrayValue);
    for (const auto& client : registry_.clients()) {
        Json::Value resource;
        resource["uri"] = client->name() + RESOURCE_SCHEME + QUERY_RESOURCE_PATH;
        resource["name"] = client->name() + " query";
        resource["description"] = client->description();
        resource["mimeType"] = "application/json";
        resources.append(resource);
    }
    return resources;
}

Json::Value RequestHandler::read_resource(const std::string& uri) const {
    size_t separator = uri.find(RESOURCE_SCHEME);
    if (separator == std::string::npos) {
        throw std::invalid_argument("Malformed resource URI: " + uri);
    }
    std::string scheme = uri.substr(0, separator);
    std::string path = uri.substr(separator + std::string(RESOURCE_SCHEME).size());

    ServiceClientPtr client = registry_.find(scheme);
    if (!client) {
        throw std::invalid_argument("Unsupported URI scheme: " + scheme);
    }
    if (path != QUERY_RESOURCE_PATH) {
        throw std::invalid_argument("Unknown resource path: " + path);
    }

    Json::Value content;
    content["message"] = "Use the execute operation with a code snippet to query " + client->name();
    for (const auto& op : client->operations()) {
        content["operations"][op.name] = op.description;
    }
    return content;
}

Json::Value RequestHandler::health() const {
    Json::Value status;
    status["status"] = "ok";
    status["active_workers"] = static_cast<Json::UInt64>(executor_.active_workers());
    status["max_workers"] = static_cast<Json::UInt64>(executor_.policy().max_workers);
    status["clients"] = Json::Value(Json::arrayValue);
    for (const auto& client : registry_.clients()) {
        status["clients"].append(client->name());
    }
    return status;
}

std::string RequestHandler::handle_line(const std::string& line) {
    Json::Value document;
    std::string errors;
    if (!parse_document(line, document, errors)) {
        return to_compact(request_error("Invalid JSON: " + errors));
    }
    if (!document.isObject()) {
        return to_compact(request_error("Request must be a JSON object"));
    }

    if (!document.isMember("method")) {
        return to_compact(execute(document));
    }

    if (!document["method"].isString()) {
        Json::Value response;
        response["error"] = "'method' must be a string";
        return to_compact(response);
    }
    const std::string method = document["method"].asString();
    Json::Value response;
    try {
        if (method == "list_resources") {
            response["resources"] = list_resources();
        } else if (method == "read_resource") {
            const Json::Value& uri = document["uri"];
            if (!uri.isString()) {
                throw std::invalid_argument("'uri' must be a string");
            }
            response["contents"] = read_resource(uri.asString());
        } else if (method == "schema") {
            response["schema"] = input_schema();
        } else if (method == "health") {
            response = health();
        } else {
            response["error"] = "Unknown method: " + method;
        }
    } catch (const std::invalid_argument& e) {
        response = Json::Value();
        response["error"] = e.what();
    } catch (const Json::Exception& e) {
        std::cerr << "[Handler] " << method << " failed: " << e.what() << std::endl;
        response = Json::Value();
        response["error"] = "Malformed request";
    }
    return to_compact(response);
}

void RequestHandler::serve_stdio(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        out << handle_line(line) << std::endl;
    }
}

void install_routes(HttpServer& server, RequestHandler& handler, RateLimiter& limiter) {
    auto request_counter = std::make_shared<std::atomic<unsigned long long>>(0);

    server.route("POST", "/execute", [&handler, &limiter, request_counter](const HttpRequest& req) {
        Json::Value body;
        std::string errors;
        if (!parse_document(req.body, body, errors)) {
            return HttpResponse::json_error(400, "Invalid JSON: " + errors);
        }

        std::string request_id = std::to_string(++(*request_counter));
        if (!limiter.register_request_start(req.client_ip, request_id)) {
            return HttpResponse::json_error(429, limiter.check_quota(req.client_ip).reason);
        }

        HttpResponse resp;
        try {
            resp.body = to_compact(handler.execute(body));
        } catch (...) {
            limiter.register_request_end(req.client_ip, request_id);
            throw;
        }
        limiter.register_request_end(req.client_ip, request_id);
        return resp;
    });

    server.route("GET", "/health", [&handler](const HttpRequest&) {
        HttpResponse resp;
        resp.body = to_compact(handler.health());
        return resp;
    });

    server.route("GET", "/schema", [&handler](const HttpRequest&) {
        HttpResponse resp;
        resp.body = to_compact(handler.input_schema());
        return resp;
    });

    server.route("GET", "/resources", [&handler](const HttpRequest&) {
        HttpResponse resp;
        resp.body = to_compact(handler.list_resources());
        return resp;
    });
}

} // namespace codegate
