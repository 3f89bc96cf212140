#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <utility>
#include <vector>

namespace graph {

/**
 * @brief Owns a set of worker threads and joins them on every exit path
 *
 * If the group is destroyed while workers are still running (for example
 * because starting a later worker threw), the stop callback is invoked so
 * blocked workers can leave their wait, and every started thread is joined.
 */
class WorkerGroup {
public:
    explicit WorkerGroup(std::function<void()> stop) : m_stop(std::move(stop)) {}

    ~WorkerGroup() {
        if (running()) {
            m_stop();
            join();
        }
    }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    /// Start one worker; throws std::system_error if the thread cannot be created
    template <typename F>
    void spawn(F&& fn) {
        m_workers.emplace_back(std::forward<F>(fn));
    }

    /// Wait for workers that finish on their own
    void join() {
        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    std::size_t size() const { return m_workers.size(); }

private:
    bool running() const {
        for (const auto& worker : m_workers) {
            if (worker.joinable()) {
                return true;
            }
        }
        return false;
    }

    std::function<void()> m_stop;
    std::vector<std::thread> m_workers;
};

} // namespace graph
