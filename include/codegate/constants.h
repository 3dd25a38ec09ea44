#pragma once

#include <cstddef>  // for size_t

namespace codegate {

// Fixed bindings inside every sandbox namespace
constexpr const char* CLIENT_BINDING_NAME = "client";             // Authorized client handle
constexpr const char* RESULT_BINDING_NAME = "result";             // Snippet result variable

// Execution limits
constexpr int DEFAULT_TIMEOUT_MS = 5000;                          // 5 seconds per snippet
constexpr size_t DEFAULT_MAX_WORKERS = 4;                         // Concurrent worker processes
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 512 * 1024 * 1024;  // 512MB address space per worker
constexpr size_t DEFAULT_MAX_CODE_BYTES = 64 * 1024;              // 64KB max snippet
constexpr size_t MAX_CAPTURED_OUTPUT = 64 * 1024;                 // 64KB of print() output
constexpr int WORKER_OPEN_FILES_LIMIT = 16;                       // Descriptors inside a worker

// Result limits
constexpr size_t DEFAULT_MAX_RESULT_DEPTH = 50;                   // Nesting levels
constexpr size_t DEFAULT_MAX_RESULT_SIZE = 100000;                // Emitted nodes
constexpr size_t MAX_ALLOWED_RESULT_DEPTH = 1000;                 // Ceiling for max_result_depth
constexpr const char* TRUNCATION_MARKER = "<truncated>";

// Parser limits
constexpr int MAX_NESTING_DEPTH = 100;                            // Blocks + expressions

// Error reporting
constexpr size_t MAX_ERROR_MESSAGE_LENGTH = 512;
constexpr size_t MAX_RAW_ERROR_LENGTH = 4 * MAX_ERROR_MESSAGE_LENGTH;  // Cut before redaction runs

// Worker channel
constexpr size_t MAX_FRAME_BYTES = 16 * 1024 * 1024;              // 16MB per message
constexpr size_t PIPE_BUFFER_SIZE = 4096;                         // Read buffer size
// Frame envelope, result value and truncation marker all nest inside one message
constexpr size_t MAX_MESSAGE_NESTING = MAX_ALLOWED_RESULT_DEPTH + 16;

// Rate limiting
constexpr int MAX_CONCURRENT_REQUESTS_PER_CALLER = 4;
constexpr int MAX_REQUESTS_PER_MINUTE = 60;

// Network
constexpr int DEFAULT_PORT = 8443;                                // Default server port
constexpr int LISTEN_BACKLOG = 10;                                // Socket listen backlog
constexpr size_t MAX_REQUEST_SIZE = 1024 * 1024;                  // 1MB max HTTP request
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                      // Initial HTTP buffer

} // namespace codegate
