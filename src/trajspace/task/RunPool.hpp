#pragma once
#include "core/Error.hpp"
#include "task/Executor.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace TS {

// Fixed set of worker threads; each job is one run of an exploration.
// Jobs report their own failures and must not throw.
class RunPool : public Executor {
public:
    explicit RunPool(std::size_t threadCount = std::thread::hardware_concurrency());
    ~RunPool() override;

    RunPool(RunPool const&)                    = delete;
    auto operator=(RunPool const&) -> RunPool& = delete;

    auto submit(Job job) -> std::optional<Error> override;
    auto shutdown() -> void override;
    auto size() const -> std::size_t override;

    // Blocks until the queue is empty and no job is running.
    auto waitIdle() -> void;

private:
    auto workerFunction(std::size_t workerIndex) -> void;

    std::vector<std::jthread> workers;
    std::queue<Job>           jobs;
    std::mutex                mutex;
    std::condition_variable   jobCV;
    std::condition_variable   idleCV;
    std::atomic<bool>         shuttingDown{false};
    std::size_t               activeJobs = 0;
};

} // namespace TS
