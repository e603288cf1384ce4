#include "task/RunPool.hpp"

#include "log/TaggedLogger.hpp"

#include <string>

namespace TS {

RunPool::RunPool(std::size_t threadCount) {
    if (threadCount == 0)
        threadCount = 1;
    for (std::size_t i = 0; i < threadCount; ++i)
        this->workers.emplace_back(&RunPool::workerFunction, this, i);
    ts_log("RunPool::RunPool workers=" + std::to_string(this->workers.size()), "RunPool");
}

RunPool::~RunPool() {
    this->shutdown();
}

auto RunPool::submit(Job job) -> std::optional<Error> {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown)
            return Error{Error::Code::QueueClosed, "Run pool is shutting down"};
        this->jobs.push(std::move(job));
    }
    this->jobCV.notify_one();
    return std::nullopt;
}

auto RunPool::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->shuttingDown = true;
    }
    this->jobCV.notify_all();
    for (auto& th : this->workers) {
        if (th.joinable())
            th.join();
    }
    this->workers.clear();
}

auto RunPool::size() const -> std::size_t {
    return this->workers.size();
}

auto RunPool::waitIdle() -> void {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->idleCV.wait(lock, [this] { return this->jobs.empty() && this->activeJobs == 0; });
}

auto RunPool::workerFunction(std::size_t workerIndex) -> void {
#ifdef TS_LOG_DEBUG
    set_thread_name("RunPool-" + std::to_string(workerIndex));
#else
    (void)workerIndex;
#endif
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            this->jobCV.wait(lock, [this] { return this->shuttingDown || !this->jobs.empty(); });
            if (this->shuttingDown && this->jobs.empty())
                break;
            job = std::move(this->jobs.front());
            this->jobs.pop();
            ++this->activeJobs;
        }

        job();

        {
            std::lock_guard<std::mutex> lock(this->mutex);
            --this->activeJobs;
        }
        this->idleCV.notify_all();
    }
}

} // namespace TS
