#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace lcu_companion::utils {

enum class ThreadPoolError {
    Shutdown
};

std::string to_string(ThreadPoolError error);

// Fixed set of worker threads fed from one FIFO queue. shutdown() stops
// accepting work, lets the workers drain what is already queued and joins
// them. Exceptions thrown by a task surface through its future.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t workers = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    using ResultOf = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;

    template<typename F, typename... Args>
    std::expected<std::future<ResultOf<F, Args...>>, ThreadPoolError> try_submit(F&& f, Args&&... args);

    // As try_submit, but throws std::runtime_error after shutdown
    template<typename F, typename... Args>
    std::future<ResultOf<F, Args...>> submit(F&& f, Args&&... args);

    void shutdown();

    [[nodiscard]] std::size_t size() const { return m_size; }
    [[nodiscard]] bool is_shutdown() const;
    [[nodiscard]] std::size_t pending() const;

private:
    bool push(std::function<void()> job);
    void run(std::stop_token stop);

    std::size_t m_size;
    mutable std::mutex m_mutex;
    std::condition_variable_any m_ready;
    std::deque<std::function<void()>> m_jobs;
    bool m_accepting = true;
    std::vector<std::jthread> m_workers;
};

template<typename F, typename... Args>
std::expected<std::future<ThreadPool::ResultOf<F, Args...>>, ThreadPoolError>
ThreadPool::try_submit(F&& f, Args&&... args) {
    using R = ResultOf<F, Args...>;

    auto task = std::make_shared<std::packaged_task<R()>>(
        [fn = std::forward<F>(f), ... bound = std::forward<Args>(args)]() mutable {
            return std::invoke(fn, bound...);
        });
    auto future = task->get_future();

    if (!push([task] { (*task)(); })) {
        return std::unexpected(ThreadPoolError::Shutdown);
    }
    return future;
}

template<typename F, typename... Args>
std::future<ThreadPool::ResultOf<F, Args...>> ThreadPool::submit(F&& f, Args&&... args) {
    auto submitted = try_submit(std::forward<F>(f), std::forward<Args>(args)...);
    if (!submitted) {
        throw std::runtime_error("ThreadPool: " + to_string(submitted.error()));
    }
    return std::move(*submitted);
}

} // namespace lcu_companion::utils
