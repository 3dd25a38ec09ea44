#include "supervisor.h"
#include "channel.h"
#include "sanitize.h"
#include "value_codec.h"
#include "worker.h"
#include "codegate/errors.h"
#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <system_error>

namespace codegate {

WorkerSlots::WorkerSlots(size_t capacity) : capacity_(capacity) {}

bool WorkerSlots::acquire(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!freed_.wait_until(lock, deadline, [this] { return in_use_ < capacity_; })) {
        return false;
    }
    ++in_use_;
    return true;
}

void WorkerSlots::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) --in_use_;
    }
    freed_.notify_one();
}

size_t WorkerSlots::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

namespace {

using Clock = std::chrono::steady_clock;

class SlotGuard {
public:
    SlotGuard(WorkerSlots& slots, Clock::time_point deadline)
        : slots_(slots), acquired_(slots.acquire(deadline)) {}
    ~SlotGuard() {
        if (acquired_) slots_.release();
    }
    bool acquired() const { return acquired_; }

private:
    WorkerSlots& slots_;
    bool acquired_;
};

// Owns a forked worker. Whatever path leaves the run, the worker is killed
// and reaped.
class WorkerProcess {
public:
    explicit WorkerProcess(pid_t pid) : pid_(pid) {}
    ~WorkerProcess() { kill_and_reap(); }

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    // Returns the wait status (0 when already reaped)
    int kill_and_reap() {
        if (pid_ <= 0) return status_;
        kill(pid_, SIGKILL);
        while (waitpid(pid_, &status_, 0) == -1 && errno == EINTR) {
        }
        pid_ = -1;
        return status_;
    }

private:
    pid_t pid_;
    int status_ = 0;
};

std::string describe_exit(int status) {
    if (WIFSIGNALED(status)) {
        if (WTERMSIG(status) == SIGKILL) {
            return "Worker was killed before producing a result (resource limit exceeded)";
        }
        return "Worker terminated by signal " + std::to_string(WTERMSIG(status)) +
               " (" + strsignal(WTERMSIG(status)) + ")";
    }
    return "Worker exited without a result";
}

std::string fault_message(const Json::Value& message) {
    std::string type = message.get("error_type", "RuntimeError").asString();
    std::string text = message.get("message", "").asString();
    return sanitize_error_message(text.empty() ? type : type + ": " + text);
}

std::chrono::milliseconds elapsed_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

class ExecutionSupervisor::Impl {
public:
    PolicyPtr policy_;
    WorkerSlots slots_;

    explicit Impl(PolicyPtr policy)
        : policy_(std::move(policy)), slots_(policy_->max_workers) {}

    ExecutionOutcome run(const ast::Module& module, const ServiceClientPtr& client,
                         const std::string& fingerprint) {
        auto start = Clock::now();
        ExecutionOutcome outcome = supervise(module, client, start + policy_->timeout);
        outcome.wall_time = elapsed_since(start);

        std::cerr << "[Supervisor] " << fingerprint
                  << " status=" << status_name(outcome.kind)
                  << " wall=" << outcome.wall_time.count() << "ms" << std::endl;
        return outcome;
    }

private:
    ExecutionOutcome supervise(const ast::Module& module, const ServiceClientPtr& client,
                               Clock::time_point deadline) {
        SlotGuard slot(slots_, deadline);
        if (!slot.acquired()) {
            return ExecutionOutcome::runtime_failure(
                "Service at capacity: no worker became available within the time limit");
        }

        std::pair<UniqueFd, UniqueFd> fds;
        try {
            fds = MessageChannel::create_pair();
        } catch (const std::system_error& e) {
            std::cerr << "[Supervisor] Failed to create worker channel: " << e.what() << std::endl;
            return ExecutionOutcome::runtime_failure("Failed to start worker");
        }

        WorkerTask task;
        task.module = &module;
        task.policy = policy_;
        task.supervisor_pid = getpid();
        if (client) {
            for (const auto& op : client->operations()) {
                task.operations.insert(op.name);
            }
        }

        pid_t pid = fork();
        if (pid == -1) {
            std::cerr << "[Supervisor] fork failed: " << std::strerror(errno) << std::endl;
            return ExecutionOutcome::runtime_failure("Failed to start worker");
        }
        if (pid == 0) {
            fds.first.reset();
            run_worker(task, std::move(fds.second));
        }

        fds.second.reset();
        WorkerProcess worker(pid);
        MessageChannel channel(std::move(fds.first));

        while (true) {
            Json::Value message;
            ReadStatus status = channel.receive(message, deadline);

            if (status == ReadStatus::TIMEOUT) {
                worker.kill_and_reap();
                return ExecutionOutcome::timeout(policy_->timeout);
            }
            if (status == ReadStatus::CLOSED) {
                return ExecutionOutcome::runtime_failure(describe_exit(worker.kill_and_reap()));
            }
            if (status == ReadStatus::MALFORMED) {
                worker.kill_and_reap();
                return ExecutionOutcome::runtime_failure("Worker sent a malformed message");
            }

            const std::string type = message.get("type", "").asString();
            if (type == "call") {
                Json::Value reply = serve_call(message, client);
                // Client calls are not preemptible; one that ran past the
                // deadline ends the run as soon as it returns
                if (Clock::now() >= deadline) {
                    worker.kill_and_reap();
                    return ExecutionOutcome::timeout(policy_->timeout);
                }
                // A failed send shows up as CLOSED on the next receive
                channel.send(reply);
                continue;
            }

            worker.kill_and_reap();
            ExecutionOutcome outcome = final_outcome(type, message);
            if (message.isMember("output")) {
                outcome.output = message["output"].asString();
                outcome.output_truncated = message.get("output_truncated", false).asBool();
            }
            return outcome;
        }
    }

    ExecutionOutcome final_outcome(const std::string& type, const Json::Value& message) {
        if (type == "result") {
            // Re-applies the bounds; the worker's tree is not trusted blindly
            ResultNormalizer normalizer(policy_->max_result_depth, policy_->max_result_size);
            try {
                NormalizedResult normalized = normalizer.normalize(message["value"]);
                normalized.truncated = normalized.truncated || message.get("truncated", false).asBool();
                return ExecutionOutcome::success(std::move(normalized));
            } catch (const SerializationError& e) {
                return ExecutionOutcome::serialization_failure(e.what());
            }
        }
        if (type == "error") {
            return ExecutionOutcome::runtime_failure(fault_message(message));
        }
        if (type == "serialization_error") {
            return ExecutionOutcome::serialization_failure(
                sanitize_error_message(message.get("message", "").asString()));
        }
        return ExecutionOutcome::runtime_failure("Worker sent an unknown message");
    }

    Json::Value serve_call(const Json::Value& message, const ServiceClientPtr& client) {
        const std::string operation = message.get("operation", "").asString();
        Json::Value reply;
        try {
            if (!client) {
                throw ScriptError("ClientError", "no client is bound to this request");
            }
            if (!policy_->allowed_operations.empty() && !policy_->allowed_operations.count(operation)) {
                throw ScriptError("AttributeError", "client operation '" + operation + "' is not allowed");
            }

            CallArgs args;
            for (const auto& arg : message["args"]) {
                args.positional.push_back(value_codec::decode(arg));
            }
            const Json::Value& kwargs = message["kwargs"];
            if (kwargs.isObject()) {
                for (const auto& name : kwargs.getMemberNames()) {
                    args.keywords.emplace_back(name, value_codec::decode(kwargs[name]));
                }
            }

            Value value = client->call(operation, args);
            reply["type"] = "return";
            reply["value"] = value_codec::encode(value);
        } catch (const ScriptError& e) {
            reply = raise_reply(e.type(), e.message());
        } catch (const ClientError& e) {
            reply = raise_reply("ClientError", sanitize_error_message(e.what()));
        } catch (const SerializationError& e) {
            reply = raise_reply("TypeError", e.what());
        } catch (const std::exception& e) {
            std::cerr << "[Supervisor] client." << operation << " failed: " << e.what() << std::endl;
            reply = raise_reply("ClientError", sanitize_error_message(e.what()));
        }
        return reply;
    }

    static Json::Value raise_reply(const std::string& type, const std::string& message) {
        Json::Value reply;
        reply["type"] = "raise";
        reply["error_type"] = type;
        reply["message"] = message;
        return reply;
    }
};

ExecutionSupervisor::ExecutionSupervisor(PolicyPtr policy)
    : pImpl(std::make_unique<Impl>(std::move(policy))) {}

ExecutionSupervisor::~ExecutionSupervisor() = default;

ExecutionOutcome ExecutionSupervisor::run(const ast::Module& module, ServiceClientPtr client,
                                          const std::string& fingerprint) {
    return pImpl->run(module, client, fingerprint);
}

size_t ExecutionSupervisor::active_workers() const {
    return pImpl->slots_.in_use();
}

} // namespace codegate
