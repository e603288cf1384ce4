#pragma once

#include "core/Error.hpp"

#include <cstddef>
#include <functional>
#include <optional>

namespace TS {

/**
 * Executor: interface for running jobs on worker threads.
 *
 * Contract
 * --------
 * - submit(...) returns std::nullopt on success, or an Error on refusal
 *   (e.g., executor shutting down).
 * - shutdown() stops accepting jobs, lets queued jobs finish and joins the workers.
 * - size() returns the number of workers.
 *
 * Implementations must accept concurrent submit() calls.
 */
struct Executor {
    using Job = std::function<void()>;

    virtual ~Executor() = default;

    virtual auto submit(Job job) -> std::optional<Error> = 0;
    virtual auto shutdown() -> void                      = 0;
    virtual auto size() const -> std::size_t             = 0;
};

} // namespace TS
