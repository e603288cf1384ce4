#include "queue/WriteQueue.hpp"

#include "log/TaggedLogger.hpp"
#include "queue/Snapshot.hpp"

#include <exception>

namespace TS {

auto applyStoreRequest(NodeTree& tree, StorageCoordinator& coordinator, StoreRequest const& request) -> Expected<void> {
    auto snapshot = decodeSnapshot(request.snapshot);
    if (!snapshot)
        return std::unexpected(snapshot.error());
    auto grafted = graftSnapshot(tree, *snapshot);
    if (!grafted)
        return std::unexpected(grafted.error());
    for (Node* top : grafted->tops) {
        if (auto stored = coordinator.store(tree, *top, request.options); !stored)
            return stored;
    }
    for (Node* owner : grafted->linkOwners) {
        StoreOptions linkOptions{.recursive = true, .maxDepth = 1, .level = StoreLevel::Skeleton, .withLinks = true};
        if (auto stored = coordinator.store(tree, *owner, linkOptions); !stored)
            return stored;
    }
    return {};
}

auto writeQueueStateToString(WriteQueue::State state) -> std::string_view {
    switch (state) {
    case WriteQueue::State::Idle:
        return "idle";
    case WriteQueue::State::Draining:
        return "draining";
    case WriteQueue::State::Closed:
        return "closed";
    }
    return "unknown";
}

WriteQueue::Submission::~Submission() {
    this->release();
}

WriteQueue::Submission::Submission(Submission&& other) noexcept
    : queue(other.queue) {
    other.queue = nullptr;
}

auto WriteQueue::Submission::operator=(Submission&& other) noexcept -> Submission& {
    if (this != &other) {
        this->release();
        this->queue = other.queue;
        other.queue = nullptr;
    }
    return *this;
}

auto WriteQueue::Submission::submit(StoreRequest request) -> Expected<Result> {
    if (!this->queue)
        return std::unexpected(Error{Error::Code::QueueClosed, "Submission handle was released"});
    return this->queue->submit(std::move(request));
}

auto WriteQueue::Submission::release() -> void {
    if (this->queue) {
        this->queue->releaseHandle();
        this->queue = nullptr;
    }
}

WriteQueue::WriteQueue(Applier applier, std::size_t capacity)
    : apply(std::move(applier)), maxPending(capacity == 0 ? 1 : capacity) {
    this->writer = std::jthread([this] { this->writerLoop(); });
}

WriteQueue::~WriteQueue() {
    this->close();
}

auto WriteQueue::openSubmission() -> Expected<Submission> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->closing || this->current == State::Closed)
        return std::unexpected(Error{Error::Code::QueueClosed, "Write queue is closing"});
    ++this->openHandles;
    return Submission{this};
}

auto WriteQueue::releaseHandle() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        --this->openHandles;
    }
    this->drained.notify_all();
}

auto WriteQueue::submit(StoreRequest request) -> Expected<Result> {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->notFull.wait(lock, [this] { return this->jobs.size() < this->maxPending || this->current == State::Closed; });
    if (this->current == State::Closed)
        return std::unexpected(Error{Error::Code::QueueClosed, "Write queue is closed"});

    Job job{std::move(request), std::promise<Expected<void>>{}};
    auto future = job.promise.get_future();
    this->jobs.push_back(std::move(job));
    lock.unlock();
    this->notEmpty.notify_one();
    return future;
}

auto WriteQueue::close() -> void {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->closing = true;
    this->drained.wait(lock, [this] {
        return this->current == State::Closed || (this->jobs.empty() && !this->busy && this->openHandles == 0);
    });
    if (this->current == State::Closed) {
        // The close that switched to Closed owns the join.
        this->drained.wait(lock, [this] { return this->writerStopped; });
        return;
    }
    this->current = State::Closed;
    lock.unlock();
    this->notEmpty.notify_all();
    this->notFull.notify_all();
    if (this->writer.joinable())
        this->writer.join();
    lock.lock();
    this->writerStopped = true;
    lock.unlock();
    this->drained.notify_all();
    ts_log("WriteQueue::close applied=" + std::to_string(this->applied), "WriteQueue");
}

auto WriteQueue::state() const -> State {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->current;
}

auto WriteQueue::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->jobs.size();
}

auto WriteQueue::processed() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->applied;
}

auto WriteQueue::writerLoop() -> void {
#ifdef TS_LOG_DEBUG
    set_thread_name("Writer");
#endif
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            this->notEmpty.wait(lock, [this] { return !this->jobs.empty() || this->current == State::Closed; });
            if (this->jobs.empty())
                break;
            job = std::move(this->jobs.front());
            this->jobs.pop_front();
            this->busy    = true;
            this->current = State::Draining;
        }
        this->notFull.notify_one();

        Expected<void> outcome;
        try {
            outcome = this->apply(job.request);
        } catch (std::exception const& e) {
            outcome = std::unexpected(Error{Error::Code::UnknownError, "Store request '" + job.request.label + "' threw: " + e.what()});
        } catch (...) {
            outcome = std::unexpected(Error{Error::Code::UnknownError, "Store request '" + job.request.label + "' threw a non-standard exception"});
        }
        if (!outcome)
            ts_log("WriteQueue request '" + job.request.label + "' failed: " + describeError(outcome.error()), "WriteQueue", "Error");
        job.promise.set_value(std::move(outcome));

        {
            std::lock_guard<std::mutex> lock(this->mutex);
            ++this->applied;
            this->busy = false;
            if (this->jobs.empty() && this->current == State::Draining)
                this->current = State::Idle;
        }
        this->drained.notify_all();
    }
}

} // namespace TS
