/*
 * codegate - admission-controlled execution of caller-supplied code snippets
 * against a pre-authorized service client
 */

#include "catalog_client.h"
#include "http_server.h"
#include "rate_limiter.h"
#include "request_handler.h"
#include "codegate/constants.h"
#include "codegate/errors.h"
#include "codegate/executor.h"
#include "codegate/policy.h"
#include <signal.h>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace codegate;

namespace {

struct Options {
    int port = DEFAULT_PORT;
    std::string policy_file;
    std::string catalog_file;
    bool stdio = false;
    long long max_workers = 0;      // 0 keeps the policy value
    long long timeout_ms = 0;
};

long long parse_number(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size() || value <= 0) throw std::invalid_argument(text);
        return value;
    } catch (const std::exception&) {
        throw ConfigError(flag + " expects a positive integer, got '" + text + "'");
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n"
              << "  --port N          HTTP port (default " << DEFAULT_PORT << ")\n"
              << "  --policy FILE     JSON policy document\n"
              << "  --catalog FILE    JSON inventory for the catalog client\n"
              << "  --stdio           Serve one JSON request per line on stdin\n"
              << "  --max-workers N   Override the policy's worker bound\n"
              << "  --timeout-ms N    Override the policy's execution timeout\n";
}

Options parse_options(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--port" && has_value) {
            options.port = static_cast<int>(parse_number(arg, argv[++i]));
        } else if (arg == "--policy" && has_value) {
            options.policy_file = argv[++i];
        } else if (arg == "--catalog" && has_value) {
            options.catalog_file = argv[++i];
        } else if (arg == "--stdio") {
            options.stdio = true;
        } else if (arg == "--max-workers" && has_value) {
            options.max_workers = parse_number(arg, argv[++i]);
        } else if (arg == "--timeout-ms" && has_value) {
            options.timeout_ms = parse_number(arg, argv[++i]);
        } else {
            throw ConfigError("unknown or incomplete option '" + arg + "'");
        }
    }
    if (options.port > 65535) {
        throw ConfigError("--port must be at most 65535");
    }
    return options;
}

PolicyPtr build_policy(const Options& options) {
    PolicyConfig config = options.policy_file.empty()
        ? PolicyStore::defaults()
        : *PolicyStore::load_file(options.policy_file);

    if (options.max_workers > 0) {
        config.max_workers = static_cast<size_t>(options.max_workers);
    }
    if (options.timeout_ms > 0) {
        config.timeout = std::chrono::milliseconds(options.timeout_ms);
    }
    return PolicyStore::freeze(std::move(config));
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    PolicyPtr policy;
    ClientRegistry registry;
    try {
        options = parse_options(argc, argv);
        policy = build_policy(options);
        registry.add(options.catalog_file.empty()
            ? CatalogClient::demo()
            : CatalogClient::load_file(options.catalog_file));
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    // Peers that hang up must not kill the service
    signal(SIGPIPE, SIG_IGN);

    CodeExecutor executor(policy);
    RequestHandler handler(executor, registry);

    std::cerr << "codegate - code admission and execution service" << std::endl;
    std::cerr << "   timeout=" << policy->timeout.count() << "ms"
              << " workers=" << policy->max_workers
              << " modules=" << policy->allowed_modules.size() << std::endl;

    if (options.stdio) {
        std::cerr << "[Main] Serving requests on stdio" << std::endl;
        handler.serve_stdio(std::cin, std::cout);
        return 0;
    }

    RateLimiter rate_limiter;

    // Periodic cleanup of idle callers
    std::thread([&rate_limiter]() {
        while (true) {
            std::this_thread::sleep_for(std::chrono::minutes(1));
            rate_limiter.cleanup_old_entries();
        }
    }).detach();

    HttpServer server(options.port);
    install_routes(server, handler, rate_limiter);

    try {
        server.start();
    } catch (const std::runtime_error& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
