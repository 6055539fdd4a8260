#include "lcu_companion/utils/threading.hpp"
#include "lcu_companion/utils/logger.hpp"

namespace lcu_companion::utils {

std::string to_string(ThreadPoolError error) {
    switch (error) {
        case ThreadPoolError::Shutdown: return "thread pool is shut down";
    }
    return "thread pool error";
}

ThreadPool::ThreadPool(std::size_t workers)
    : m_size(workers == 0 ? 1 : workers) {
    m_workers.reserve(m_size);
    for (std::size_t i = 0; i < m_size; ++i) {
        m_workers.emplace_back([this](std::stop_token stop) { run(stop); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

bool ThreadPool::push(std::function<void()> job) {
    {
        std::lock_guard lock(m_mutex);
        if (!m_accepting) {
            return false;
        }
        m_jobs.push_back(std::move(job));
    }
    m_ready.notify_one();
    return true;
}

void ThreadPool::shutdown() {
    std::vector<std::jthread> workers;
    {
        std::lock_guard lock(m_mutex);
        m_accepting = false;
        workers.swap(m_workers);
    }
    for (auto& worker : workers) {
        worker.request_stop();
    }
    // Joined here, after the queue has drained
    workers.clear();
}

bool ThreadPool::is_shutdown() const {
    std::lock_guard lock(m_mutex);
    return !m_accepting;
}

std::size_t ThreadPool::pending() const {
    std::lock_guard lock(m_mutex);
    return m_jobs.size();
}

void ThreadPool::run(std::stop_token stop) {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock lock(m_mutex);
            // Returns early on a stop request; remaining jobs are still taken
            m_ready.wait(lock, stop, [this] { return !m_jobs.empty(); });
            if (m_jobs.empty()) {
                return;
            }
            job = std::move(m_jobs.front());
            m_jobs.pop_front();
        }

        try {
            job();
        } catch (const std::exception& e) {
            LCU_LOG_ERROR("ThreadPool", std::string("Task failed: ") + e.what());
        }
    }
}

} // namespace lcu_companion::utils
