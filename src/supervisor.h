#pragma once

#include "ast.h"
#include "codegate/outcome.h"
#include "codegate/policy.h"
#include "codegate/service_client.h"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace codegate {

// Counting semaphore over worker processes
class WorkerSlots {
public:
    explicit WorkerSlots(size_t capacity);

    // False when no slot freed up before `deadline`
    bool acquire(std::chrono::steady_clock::time_point deadline);
    void release();

    size_t in_use() const;
    size_t capacity() const { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable freed_;
    size_t capacity_;
    size_t in_use_ = 0;
};

// Runs validated snippets in disposable worker processes under a hard
// wall-clock deadline. Each run forks a fresh worker, serves its client calls
// and SIGKILLs it once the deadline passes; nothing in the worker is trusted
// to cooperate.
class ExecutionSupervisor {
public:
    explicit ExecutionSupervisor(PolicyPtr policy);
    ~ExecutionSupervisor();

    ExecutionSupervisor(const ExecutionSupervisor&) = delete;
    ExecutionSupervisor& operator=(const ExecutionSupervisor&) = delete;

    // `client` may be null; snippets then fail on their first client call.
    // `fingerprint` only labels log lines.
    ExecutionOutcome run(const ast::Module& module, ServiceClientPtr client,
                         const std::string& fingerprint);

    size_t active_workers() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace codegate
