#pragma once
#include "core/Error.hpp"
#include "core/NodeTree.hpp"
#include "storage/StorageCoordinator.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace TS {

// Value message sent from a worker to the writer.
struct StoreRequest {
    std::vector<std::uint8_t>  snapshot; // encoded TreeSnapshot of the nodes to write
    StoreOptions               options;
    std::optional<std::size_t> completedRun;
    std::string                label;
};

// Grafts the request snapshot into `tree` and stores what it added.
[[nodiscard]] auto applyStoreRequest(NodeTree& tree, StorageCoordinator& coordinator, StoreRequest const& request) -> Expected<void>;

/**
 * @brief FIFO funnel in front of a single writer thread.
 *
 * State machine: Idle -> Draining -> Idle, terminal Closed. Requests are
 * applied strictly in submission order. A failing request resolves its own
 * future with the error and the writer moves on. A full queue blocks the
 * submitter. close() waits until the queue is empty and every Submission
 * handle is gone; afterwards submit() fails with QueueClosed.
 */
class WriteQueue {
public:
    enum class State {
        Idle,
        Draining,
        Closed
    };

    using Applier = std::function<Expected<void>(StoreRequest const&)>;
    using Result  = std::future<Expected<void>>;

    // Scoped permission to submit; close() waits for all of them.
    class Submission {
    public:
        Submission() = default;
        ~Submission();
        Submission(Submission&& other) noexcept;
        auto operator=(Submission&& other) noexcept -> Submission&;
        Submission(Submission const&)            = delete;
        Submission& operator=(Submission const&) = delete;

        auto submit(StoreRequest request) -> Expected<Result>;
        auto release() -> void;
        auto isOpen() const -> bool { return this->queue != nullptr; }

    private:
        friend class WriteQueue;
        explicit Submission(WriteQueue* owner)
            : queue(owner) {}

        WriteQueue* queue = nullptr;
    };

    explicit WriteQueue(Applier applier, std::size_t capacity = 64);
    ~WriteQueue();

    WriteQueue(WriteQueue const&)            = delete;
    WriteQueue& operator=(WriteQueue const&) = delete;

    auto openSubmission() -> Expected<Submission>;
    auto submit(StoreRequest request) -> Expected<Result>;
    auto close() -> void;

    auto state() const -> State;
    auto pending() const -> std::size_t;
    auto processed() const -> std::size_t;
    auto capacity() const -> std::size_t { return this->maxPending; }

private:
    struct Job {
        StoreRequest                  request;
        std::promise<Expected<void>> promise;
    };

    auto writerLoop() -> void;
    auto releaseHandle() -> void;

    Applier     apply;
    std::size_t maxPending;

    mutable std::mutex      mutex;
    std::condition_variable notEmpty;
    std::condition_variable notFull;
    std::condition_variable drained;
    std::deque<Job>         jobs;
    State                   current       = State::Idle;
    bool                    closing       = false;
    bool                    writerStopped = false;
    bool                    busy          = false;
    std::size_t             openHandles   = 0;
    std::size_t             applied       = 0;
    std::jthread            writer;
};

[[nodiscard]] auto writeQueueStateToString(WriteQueue::State state) -> std::string_view;

} // namespace TS
