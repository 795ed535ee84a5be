#include "fanout.hpp"
#include "cancel.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <mutex>

namespace curbench {

std::optional<FanoutFailure> run_all(size_t count, uint32_t max_concurrency,
                                     CancelToken& cancel,
                                     const std::function<void(size_t)>& task) {
    size_t batch_size = std::max<uint32_t>(1, max_concurrency);
    std::mutex error_mutex;
    std::optional<FanoutFailure> failure;

    auto run_one = [&](size_t i) {
        try {
            task(i);
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!failure) {
                failure = FanoutFailure{i, std::current_exception()};
                cancel.cancel();
            } else {
                std::cerr << "[fanout] Sibling task " << i << " aborted: " << e.what() << "\n";
            }
        }
    };

    for (size_t start = 0; start < count; start += batch_size) {
        {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (failure) break;
        }
        size_t end = std::min(count, start + batch_size);

        std::vector<std::future<void>> futures;
        futures.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            futures.push_back(std::async(std::launch::async, run_one, i));
        }
        // Join the whole batch so no task outlives the call.
        for (auto& f : futures) f.get();
    }

    return failure;
}

std::vector<Embedding> embed_all(Embedder& embedder,
                                 const std::vector<std::string>& texts,
                                 CancelToken& cancel,
                                 uint32_t max_concurrency) {
    std::vector<Embedding> results(texts.size());

    auto failure = run_all(texts.size(), max_concurrency, cancel, [&](size_t i) {
        results[i] = embedder.embed(texts[i], &cancel);
    });
    if (failure) std::rethrow_exception(failure->error);
    return results;
}

} // namespace curbench
