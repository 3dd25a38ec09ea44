#include "worker.h"
#include "interpreter.h"
#include "namespace_builder.h"
#include "sanitize.h"
#include "value_codec.h"
#include "codegate/constants.h"
#include "codegate/errors.h"
#include "codegate/normalizer.h"
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <fcntl.h>
#include <seccomp.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <new>
#include <vector>

namespace codegate {

namespace {

// Exit codes seen by the supervisor when no result message made it out
constexpr int EXIT_REPORTED = 0;
constexpr int EXIT_CHANNEL_LOST = 3;

void close_inherited_descriptors(int keep_fd) {
    // stdio goes to /dev/null so nothing the worker does reaches the host's streams
    int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        dup2(null_fd, STDOUT_FILENO);
        dup2(null_fd, STDERR_FILENO);
        if (null_fd > STDERR_FILENO) close(null_fd);
    }

    unsigned int first = STDERR_FILENO + 1;
    unsigned int keep = static_cast<unsigned int>(keep_fd);
#ifdef SYS_close_range
    bool closed = true;
    if (keep > first && syscall(SYS_close_range, first, keep - 1, 0) != 0) closed = false;
    if (closed && syscall(SYS_close_range, keep + 1, UINT_MAX, 0) != 0) closed = false;
    if (closed) return;
#endif
    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0) max_fd = 1024;
    for (long fd = first; fd < max_fd; ++fd) {
        if (fd != keep_fd) close(static_cast<int>(fd));
    }
}

bool set_limit(int resource, rlim_t value) {
    struct rlimit limit;
    limit.rlim_cur = limit.rlim_max = value;
    return setrlimit(resource, &limit) == 0;
}

// Address space the worker already holds when it starts: everything mapped
// by the host before fork (thread stacks, allocator arenas, the binary).
// Zero when /proc is unavailable, which leaves the limit absolute.
rlim_t inherited_address_space() {
    int fd = open("/proc/self/statm", O_RDONLY | O_CLOEXEC);
    if (fd < 0) return 0;
    char buffer[128];
    ssize_t n = read(fd, buffer, sizeof(buffer) - 1);
    close(fd);
    if (n <= 0) return 0;
    buffer[n] = '\0';

    // First field: total program size in pages
    unsigned long long pages = std::strtoull(buffer, nullptr, 10);
    long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0) return 0;
    return static_cast<rlim_t>(pages) * static_cast<rlim_t>(page_size);
}

// Returns the name of the first limit that could not be applied, or nullptr
const char* apply_resource_limits(const PolicyConfig& policy) {
    // Memory limit, on top of what was inherited so that load elsewhere in
    // the host does not eat into this request's budget
    rlim_t address_space = inherited_address_space() + static_cast<rlim_t>(policy.memory_limit_bytes);
    if (!set_limit(RLIMIT_AS, address_space)) return "RLIMIT_AS";

    // CPU time limit; the supervisor's wall clock normally fires first
    auto cpu_seconds = std::chrono::duration_cast<std::chrono::seconds>(policy.timeout).count() + 1;
    if (!set_limit(RLIMIT_CPU, static_cast<rlim_t>(cpu_seconds))) return "RLIMIT_CPU";

    // No file writes, no core dumps
    if (!set_limit(RLIMIT_FSIZE, 0)) return "RLIMIT_FSIZE";
    if (!set_limit(RLIMIT_CORE, 0)) return "RLIMIT_CORE";

    // No children
    if (!set_limit(RLIMIT_NPROC, 0)) return "RLIMIT_NPROC";

    // File descriptor limit
    if (!set_limit(RLIMIT_NOFILE, WORKER_OPEN_FILES_LIMIT)) return "RLIMIT_NOFILE";
    return nullptr;
}

// Everything else fails with EPERM. Returns false when the filter could not
// be installed.
bool setup_seccomp_filter() {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ERRNO(EPERM));
    if (!ctx) {
        return false;
    }

    // Memory management, the channel socket, signals and exit
    std::vector<int> allowed_syscalls = {
        SCMP_SYS(read), SCMP_SYS(write), SCMP_SYS(close),
        SCMP_SYS(recvfrom), SCMP_SYS(sendto), SCMP_SYS(recvmsg), SCMP_SYS(sendmsg),
        SCMP_SYS(poll), SCMP_SYS(ppoll),
        SCMP_SYS(exit), SCMP_SYS(exit_group),
        SCMP_SYS(brk), SCMP_SYS(mmap), SCMP_SYS(munmap), SCMP_SYS(mremap),
        SCMP_SYS(mprotect), SCMP_SYS(madvise), SCMP_SYS(futex),
        SCMP_SYS(rt_sigaction), SCMP_SYS(rt_sigprocmask), SCMP_SYS(rt_sigreturn),
        SCMP_SYS(clock_gettime), SCMP_SYS(getpid), SCMP_SYS(gettid),
        SCMP_SYS(fstat), SCMP_SYS(newfstatat), SCMP_SYS(sched_yield),
        SCMP_SYS(getrandom), SCMP_SYS(restart_syscall)
    };

    for (int syscall_number : allowed_syscalls) {
        int rc = seccomp_rule_add(ctx, SCMP_ACT_ALLOW, syscall_number, 0);
        // -EDOM: not a syscall on this architecture
        if (rc != 0 && rc != -EDOM) {
            seccomp_release(ctx);
            return false;
        }
    }

    int rc = seccomp_load(ctx);
    seccomp_release(ctx);
    return rc == 0;
}

Json::Value error_message(const std::string& type, const std::string& message) {
    Json::Value out;
    out["type"] = "error";
    out["error_type"] = type;
    out["message"] = message;
    return out;
}

} // namespace

ChannelClientGateway::ChannelClientGateway(MessageChannel& channel, std::set<std::string> operations)
    : channel_(channel), operations_(std::move(operations)) {}

bool ChannelClientGateway::has_operation(const std::string& name) const {
    return operations_.count(name) > 0;
}

Value ChannelClientGateway::invoke(const std::string& operation, const CallArgs& args) {
    Json::Value request;
    request["type"] = "call";
    request["operation"] = operation;
    try {
        request["args"] = Json::Value(Json::arrayValue);
        for (const auto& arg : args.positional) {
            request["args"].append(value_codec::encode(arg));
        }
        request["kwargs"] = Json::Value(Json::objectValue);
        for (const auto& kw : args.keywords) {
            request["kwargs"][kw.first] = value_codec::encode(kw.second);
        }
    } catch (const SerializationError& e) {
        throw ScriptError("TypeError", "client." + operation + "() arguments: " + e.what());
    }

    if (!channel_.send(request)) {
        throw ScriptError("RuntimeError", "client channel closed");
    }

    Json::Value reply;
    if (channel_.receive(reply) != ReadStatus::OK) {
        throw ScriptError("RuntimeError", "client channel closed");
    }

    const std::string type = reply.get("type", "").asString();
    if (type == "return") {
        try {
            return value_codec::decode(reply["value"]);
        } catch (const SerializationError& e) {
            throw ScriptError("ClientError", e.what());
        }
    }
    if (type == "raise") {
        throw ScriptError(reply.get("error_type", "ClientError").asString(),
                          reply.get("message", "").asString());
    }
    throw ScriptError("RuntimeError", "unexpected reply on client channel");
}

Json::Value execute_in_worker(const WorkerTask& task, std::shared_ptr<ClientGateway> gateway) {
    std::shared_ptr<OutputBuffer> output;
    Json::Value message;
    try {
        NamespaceBuilder builder(task.policy);
        Namespace ns = builder.build(std::move(gateway));
        output = ns.output;

        Interpreter interpreter(ns);
        interpreter.run(*task.module);

        ResultNormalizer normalizer(task.policy->max_result_depth, task.policy->max_result_size);
        NormalizedResult normalized = normalizer.normalize(interpreter.result());
        message["type"] = "result";
        message["value"] = std::move(normalized.value);
        message["truncated"] = normalized.truncated;
    } catch (const SerializationError& e) {
        message = Json::Value();
        message["type"] = "serialization_error";
        message["message"] = clip_message(e.what(), MAX_RAW_ERROR_LENGTH);
    } catch (const ScriptError& e) {
        message = error_message(e.type(), clip_message(e.message(), MAX_RAW_ERROR_LENGTH));
    } catch (const SyntaxError& e) {
        message = error_message("SyntaxError", clip_message(e.what(), MAX_RAW_ERROR_LENGTH));
    } catch (const std::bad_alloc&) {
        message = error_message("MemoryError", "out of memory");
    } catch (const std::exception& e) {
        message = error_message("RuntimeError", clip_message(e.what(), MAX_RAW_ERROR_LENGTH));
    }

    if (task.policy->capture_output && output) {
        message["output"] = output->text();
        message["output_truncated"] = output->truncated();
    }

    // A result can fit the node budget and still not fit in one frame
    if (MessageChannel::serialize(message).size() > MAX_FRAME_BYTES) {
        Json::Value oversized;
        oversized["type"] = "serialization_error";
        oversized["message"] = "Result exceeds maximum message size of " +
                               std::to_string(MAX_FRAME_BYTES) + " bytes";
        if (message.isMember("output")) {
            oversized["output"] = message["output"];
            oversized["output_truncated"] = message["output_truncated"];
        }
        message = oversized;
    }
    return message;
}

void run_worker(const WorkerTask& task, UniqueFd channel_fd) {
    // Nothing may unwind out of here: the stack below belongs to the host
    try {
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        // Parent may have died before the death signal was armed
        if (getppid() != task.supervisor_pid) {
            _exit(EXIT_CHANNEL_LOST);
        }

        close_inherited_descriptors(channel_fd.get());
        const char* failed_limit = apply_resource_limits(*task.policy);
        bool filtered = failed_limit == nullptr && setup_seccomp_filter();

        MessageChannel channel(std::move(channel_fd));
        Json::Value message;
        if (failed_limit != nullptr) {
            message = error_message("RuntimeError", std::string("resource limit ") + failed_limit +
                                                    " could not be applied");
        } else if (!filtered && task.policy->require_syscall_filter) {
            message = error_message("RuntimeError", "syscall filter could not be installed");
        } else {
            auto gateway = std::make_shared<ChannelClientGateway>(channel, task.operations);
            message = execute_in_worker(task, gateway);
        }

        _exit(channel.send(message) ? EXIT_REPORTED : EXIT_CHANNEL_LOST);
    } catch (...) {
        _exit(EXIT_CHANNEL_LOST);
    }
}

} // namespace codegate
