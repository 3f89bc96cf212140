#pragma once

#include "field/FieldBuffer.hpp"
#include "graph/Plan.hpp"
#include "stencil/StencilSpec.hpp"

#include <cstddef>
#include <cstdint>

namespace graph {

/**
 * @brief Executor settings
 */
struct ExecutorConfig {
    std::size_t threadCount = 0;  // 0 = hardware concurrency
};

/**
 * @brief Statistics of the most recent run
 */
struct RunStats {
    std::size_t chunksExecuted = 0;
    std::size_t pointsEvaluated = 0;
    std::size_t workerCount = 0;
    double seconds = 0.0;
};

/**
 * @brief Walks a plan's chunk DAG on a fixed pool of worker threads
 *
 * Owns two buffers for the duration of a run and alternates them between
 * steps: a chunk at step s reads buffer s % 2 and writes buffer (s + 1) % 2.
 * Chunks become ready when all predecessors have completed; completion is
 * published under the scheduler mutex, so a dispatched chunk observes every
 * predecessor's writes. Chunks of one step write disjoint regions and need
 * no locking on cells.
 */
template <typename T>
class Executor {
public:
    /**
     * @param stencil Stencil to apply; must outlive the executor
     * @param config Worker pool settings
     */
    explicit Executor(const stencil::StencilSpec<T>& stencil, ExecutorConfig config = {});

    /**
     * Run every chunk of a plan
     * @param plan Plan generated for this stencil's radius (or a larger one)
     * @param initial Field at step 0; consumed by the run
     * @return Field after plan.stepCount() steps
     * @throws core::InvalidPlanConfig if the field or stencil do not fit the plan
     * @throws core::PlanIntegrityError if the DAG is infeasible (before any evaluation)
     * @throws core::EvaluationError if a chunk fails; the run's buffers are discarded
     */
    field::FieldBuffer<T> run(const Plan& plan, field::FieldBuffer<T> initial);

    const RunStats& lastRunStats() const { return m_stats; }

    std::size_t threadCount() const;

private:
    void evaluateChunk(const Plan& plan,
                       std::size_t index,
                       const field::FieldBuffer<T>& source,
                       T* destination,
                       const domain::Region& destinationStorage) const;

    const stencil::StencilSpec<T>& m_stencil;
    ExecutorConfig m_config;
    RunStats m_stats;
};

extern template class Executor<float>;
extern template class Executor<double>;
extern template class Executor<int32_t>;
extern template class Executor<int64_t>;

} // namespace graph
