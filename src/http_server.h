#pragma once

#include "codegate/constants.h"
#include <string>
#include <functional>
#include <map>
#include <atomic>

namespace codegate {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;     // Names lower-cased
    std::string body;
    std::string client_ip;

    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
    }

    static HttpResponse json_error(int status_code, const std::string& message);
};

using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP/1.1 server, one thread per connection, one request per connection
class HttpServer {
public:
    explicit HttpServer(int port = DEFAULT_PORT);
    ~HttpServer();

    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Binds and serves until stop(); throws std::runtime_error if the socket cannot be set up
    void start();
    void stop();

    // Dispatches a parsed request to its route (404 / 405 otherwise)
    HttpResponse dispatch(const HttpRequest& req) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);

private:
    int port_;
    std::atomic<int> server_fd_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;     // "METHOD /path"

    void handle_client(int client_fd, const std::string& client_ip);
    static void write_all(int fd, const std::string& data);
};

} // namespace codegate
