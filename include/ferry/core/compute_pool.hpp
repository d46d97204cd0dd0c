#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <type_traits>

namespace ferry::core {

/**
 * @brief CPU-bound work pool kept apart from the stream I/O threads
 *
 * Compression and decompression are submitted here so a slow codec never
 * stalls the send/receive loop of another stream.
 */
class ComputePool {
public:
    explicit ComputePool(std::size_t threads) : pool_(threads == 0 ? 1 : threads) {}

    ~ComputePool() { shutdown(); }

    ComputePool(const ComputePool&) = delete;
    ComputePool& operator=(const ComputePool&) = delete;

    template<typename F>
    auto submit(F&& work) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(work));
        auto future = task->get_future();
        boost::asio::post(pool_, [task]() { (*task)(); });
        return future;
    }

    /// Finishes queued work and joins the workers; idempotent.
    void shutdown() {
        if (!joined_.exchange(true)) {
            pool_.join();
        }
    }

private:
    boost::asio::thread_pool pool_;
    std::atomic<bool> joined_{false};
};

} // namespace ferry::core
