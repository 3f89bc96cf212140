#include "graph/Executor.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "graph/WorkerGroup.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace graph {

template <typename T>
Executor<T>::Executor(const stencil::StencilSpec<T>& stencil, ExecutorConfig config)
    : m_stencil(stencil), m_config(config) {
    LOG_DEBUG("Executor created with {} worker threads", threadCount());
}

template <typename T>
std::size_t Executor<T>::threadCount() const {
    if (m_config.threadCount > 0) {
        return m_config.threadCount;
    }
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

template <typename T>
void Executor<T>::evaluateChunk(const Plan& plan,
                                std::size_t index,
                                const field::FieldBuffer<T>& source,
                                T* destination,
                                const domain::Region& destinationStorage) const {
    const Chunk& chunk = plan.chunk(index);
    const domain::Domain& dom = plan.getDomain();
    const domain::Region& sourceStorage = source.storageRegion();
    const T* sourceData = source.data();

    Coord scratch;
    Coord resolved;
    auto lookup = [&](const Coord& p) -> T {
        if (dom.contains(p)) {
            return sourceData[sourceStorage.linearIndex(p)];
        }
        double value = 0.0;
        if (dom.resolve(p, resolved, value)) {
            return sourceData[sourceStorage.linearIndex(resolved)];
        }
        return static_cast<T>(value);
    };

    chunk.region.forEachPoint([&](const Coord& p) {
        destination[destinationStorage.linearIndex(p)] = m_stencil.evaluate(p, chunk.step, lookup, scratch);
    });
}

template <typename T>
field::FieldBuffer<T> Executor<T>::run(const Plan& plan, field::FieldBuffer<T> initial) {
    LOG_INFO("Executor run: '{}' plan, {} chunks, {} steps",
             plan.strategyName(), plan.chunkCount(), plan.stepCount());

    m_stats = RunStats{};

    const domain::Domain& dom = plan.getDomain();
    if (!initial.getDomain().sameExtents(dom)) {
        throw core::InvalidPlanConfig("initial field covers " + initial.getDomain().region().toString() +
                                      " but the plan covers " + dom.region().toString());
    }
    if (m_stencil.rank() != dom.rank()) {
        throw core::InvalidPlanConfig("stencil rank does not match plan domain rank");
    }
    for (size_t d = 0; d < dom.rank(); ++d) {
        if (m_stencil.radius()[d] > plan.radius()[d]) {
            throw core::InvalidPlanConfig("stencil radius exceeds the radius the plan was generated for");
        }
    }

    // Nothing is evaluated before the DAG is known to be schedulable
    plan.checkFeasibility();

    if (plan.chunkCount() == 0) {
        LOG_INFO("Empty plan; returning the initial field");
        return initial;
    }

    const auto start = std::chrono::steady_clock::now();

    field::FieldBuffer<T> second(initial.getDomain(), initial.radius());
    LOG_CHECK(second.sameShape(initial), "rotation buffers must share one storage layout");
    field::FieldBuffer<T>* buffers[2] = {&initial, &second};
    T* bufferData[2] = {initial.data(), second.data()};
    const domain::Region& storage = initial.storageRegion();

    const std::size_t total = plan.chunkCount();
    const std::size_t workerCount = std::min(threadCount(), total);

    // Scheduler state, guarded by mutex
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::size_t> ready;
    std::vector<std::size_t> pending(total);
    std::size_t completed = 0;
    std::size_t pointsEvaluated = 0;
    bool stopping = false;
    std::optional<core::EvaluationError> firstError;

    for (std::size_t i = 0; i < total; ++i) {
        pending[i] = plan.chunk(i).predecessors.size();
        if (pending[i] == 0) {
            ready.push_back(i);
        }
    }
    LOG_DEBUG("{} chunks initially ready, {} workers", ready.size(), workerCount);

    auto recordFailure = [&](std::size_t index, const std::string& message) {
        const Chunk& chunk = plan.chunk(index);
        std::lock_guard<std::mutex> lock(mutex);
        if (!firstError) {
            firstError.emplace(message, index, chunk.step, chunk.region.lo(), chunk.region.hi());
        }
    };

    auto worker = [&]() {
        while (true) {
            std::size_t index = 0;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [&] {
                    return stopping || firstError.has_value() || !ready.empty() || completed == total;
                });
                // After a failure no new chunk is dispatched
                if (stopping || firstError || ready.empty()) {
                    return;
                }
                index = ready.front();
                ready.pop_front();
            }

            const Chunk& chunk = plan.chunk(index);
            const std::size_t s = chunk.step;
            bool ok = false;
            try {
                evaluateChunk(plan, index, *buffers[s % 2], bufferData[(s + 1) % 2], storage);
                ok = true;
            } catch (const std::exception& e) {
                LOG_ERROR("Chunk {} (step {}, region {}) failed: {}", index, s, chunk.region.toString(), e.what());
                recordFailure(index, e.what());
            } catch (...) {
                LOG_ERROR("Chunk {} (step {}, region {}) failed with a non-standard exception",
                          index, s, chunk.region.toString());
                recordFailure(index, "unknown exception");
            }

            if (ok) {
                std::lock_guard<std::mutex> lock(mutex);
                ++completed;
                pointsEvaluated += chunk.region.volume();
                for (std::size_t dependent : plan.dependents(index)) {
                    if (--pending[dependent] == 0) {
                        ready.push_back(dependent);
                    }
                }
                LOG_TRACE("Chunk {} done (step {}), {}/{} complete", index, s, completed, total);
            }
            cv.notify_all();
        }
    };

    {
        WorkerGroup workers([&] {
            std::lock_guard<std::mutex> lock(mutex);
            stopping = true;
            cv.notify_all();
        });
        try {
            for (std::size_t i = 0; i < workerCount; ++i) {
                workers.spawn(worker);
            }
        } catch (const std::system_error& e) {
            LOG_ERROR("Could not start worker {} of {}: {}", workers.size() + 1, workerCount, e.what());
            throw;
        }
        // Joining drains chunks that were in flight when a failure occurred
        workers.join();
    }

    initial.markHaloStale();
    second.markHaloStale();

    m_stats.chunksExecuted = completed;
    m_stats.pointsEvaluated = pointsEvaluated;
    m_stats.workerCount = workerCount;
    m_stats.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (firstError) {
        LOG_ERROR("Run aborted after {} of {} chunks: {}", completed, total, firstError->what());
        throw *firstError;
    }

    LOG_INFO("Run complete: {} chunks, {} points in {:.3f} s", completed, pointsEvaluated, m_stats.seconds);
    return std::move(*buffers[plan.stepCount() % 2]);
}

template class Executor<float>;
template class Executor<double>;
template class Executor<int32_t>;
template class Executor<int64_t>;

} // namespace graph
