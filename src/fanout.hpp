#pragma once
#include "embedder.hpp"
#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace curbench {

struct FanoutFailure {
    size_t index;              // task that failed first
    std::exception_ptr error;
};

// Run task(i) for every i in [0, count) with at most `max_concurrency` tasks
// in flight. The first task to throw cancels `cancel`; every started task is
// joined before returning. Later failures are logged and dropped.
std::optional<FanoutFailure> run_all(size_t count, uint32_t max_concurrency,
                                     CancelToken& cancel,
                                     const std::function<void(size_t)>& task);

// Embed every text concurrently. Results are returned in input order.
// Rethrows the first failure after all in-flight requests have finished.
std::vector<Embedding> embed_all(Embedder& embedder,
                                 const std::vector<std::string>& texts,
                                 CancelToken& cancel,
                                 uint32_t max_concurrency);

} // namespace curbench
