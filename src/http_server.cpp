#include "http_server.h"

#include <json/json.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace codegate {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

const char* reason_phrase(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

// Parses Content-Length out of a raw header block; -1 when absent, -2 when invalid
long long content_length_of(const std::string& headers) {
    std::istringstream stream(headers);
    std::string line;
    while (std::getline(stream, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (to_lower(trim(line.substr(0, colon))) != "content-length") continue;
        std::string value = trim(line.substr(colon + 1));
        if (value.empty() || !std::all_of(value.begin(), value.end(),
                                          [](unsigned char c) { return std::isdigit(c); })) {
            return -2;
        }
        try {
            return std::stoll(value);
        } catch (const std::exception&) {
            return -2;
        }
    }
    return -1;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? "" : it->second;
}

HttpResponse HttpResponse::json_error(int status_code, const std::string& message) {
    HttpResponse resp;
    resp.status_code = status_code;
    Json::Value body;
    body["error"] = message;
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    resp.body = Json::writeString(builder, body);
    return resp;
}

HttpServer::HttpServer(int port) : port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = std::move(handler);
}

void HttpServer::start() {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_));
    }

    if (listen(fd, LISTEN_BACKLOG) < 0) {
        close(fd);
        throw std::runtime_error("Failed to listen");
    }

    server_fd_ = fd;
    running_ = true;
    std::cerr << "[HttpServer] Listening on port " << port_ << std::endl;

    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(fd, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len,
                                SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (running_) continue;
            break;
        }

        char ip[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);
        }).detach();
    }
}

void HttpServer::stop() {
    running_ = false;
    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        shutdown(fd, SHUT_RDWR);
        close(fd);
    }
}

void HttpServer::write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::send(fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        written += static_cast<size_t>(n);
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    size_t expected_size = 0;

    while (true) {
        ssize_t bytes_read = read(client_fd, buffer, sizeof(buffer));
        if (bytes_read < 0 && errno == EINTR) continue;
        if (bytes_read <= 0) break;
        request_data.append(buffer, static_cast<size_t>(bytes_read));

        if (request_data.size() > MAX_REQUEST_SIZE) {
            write_all(client_fd, build_response(HttpResponse::json_error(413, "Request too large")));
            return;
        }

        if (expected_size == 0) {
            size_t header_end = request_data.find("\r\n\r\n");
            if (header_end == std::string::npos) continue;

            long long content_length = content_length_of(request_data.substr(0, header_end));
            if (content_length == -2) {
                write_all(client_fd, build_response(HttpResponse::json_error(400, "Invalid Content-Length")));
                return;
            }
            expected_size = header_end + 4 + static_cast<size_t>(std::max(content_length, 0LL));
            if (expected_size > MAX_REQUEST_SIZE) {
                write_all(client_fd, build_response(HttpResponse::json_error(413, "Request too large")));
                return;
            }
        }
        if (request_data.size() >= expected_size) break;
    }

    if (request_data.empty()) return;

    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;
    write_all(client_fd, build_response(dispatch(req)));
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    auto it = routes_.find(req.method + " " + req.path);
    if (it == routes_.end()) {
        bool path_known = std::any_of(routes_.begin(), routes_.end(), [&req](const auto& entry) {
            return entry.first.substr(entry.first.find(' ') + 1) == req.path;
        });
        return path_known ? HttpResponse::json_error(405, "Method not allowed")
                          : HttpResponse::json_error(404, "Not found");
    }

    try {
        return it->second(req);
    } catch (const std::exception& e) {
        std::cerr << "[HttpServer] Handler for " << req.method << " " << req.path
                  << " failed: " << e.what() << std::endl;
        return HttpResponse::json_error(500, "Internal server error");
    }
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    std::istringstream stream(head);
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);
    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        req.path = line.substr(space1 + 1, space2 - space1 - 1);
        // Query strings are not routed
        size_t query = req.path.find('?');
        if (query != std::string::npos) req.path.erase(query);
    }

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
    }

    // Content-Length caps the body when more bytes arrived
    std::string declared = req.header("content-length");
    if (!declared.empty()) {
        long long length = content_length_of("content-length: " + declared);
        if (length >= 0 && static_cast<size_t>(length) < req.body.size()) {
            req.body.resize(static_cast<size_t>(length));
        }
    }
    return req;
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    out << "HTTP/1.1 " << resp.status_code << " " << reason_phrase(resp.status_code) << "\r\n";
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }
    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";
    out << resp.body;

    return out.str();
}

} // namespace codegate
