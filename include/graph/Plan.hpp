#pragma once

#include "domain/Domain.hpp"
#include "graph/PlanStrategy.hpp"
#include "stencil/StencilSpec.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace graph {

/**
 * @brief Dependency-ordered decomposition of a multi-step stencil run
 *
 * The chunk DAG is an arena addressed by index; each chunk lists the
 * indices of its predecessors, and the plan keeps the reverse edges.
 * A plan can be run any number of times with fresh buffers.
 */
class Plan {
public:
    /**
     * Decompose a run with the given strategy and validate the result
     * @param strategy Decomposition strategy
     * @param domain Domain to cover
     * @param radius Stencil radius per dimension
     * @param stepCount Number of time steps
     * @throws core::InvalidPlanConfig on rank mismatch or bad strategy configuration
     * @throws core::PlanIntegrityError if the strategy produced a malformed DAG
     */
    static Plan generate(const PlanStrategy& strategy,
                         const domain::Domain& domain,
                         const Coord& radius,
                         std::size_t stepCount);

    template <typename T>
    static Plan generate(const PlanStrategy& strategy,
                         const domain::Domain& domain,
                         const stencil::StencilSpec<T>& stencil,
                         std::size_t stepCount) {
        return generate(strategy, domain, stencil.radius(), stepCount);
    }

    /**
     * Wrap externally produced chunks without validating them
     * @throws core::PlanIntegrityError if a predecessor index is out of range
     */
    static Plan fromChunks(const domain::Domain& domain,
                           const Coord& radius,
                           std::size_t stepCount,
                           std::string strategyName,
                           std::vector<Chunk> chunks);

    /**
     * Topological feasibility: acyclic, steps in range, and every
     * predecessor one step earlier
     * @throws core::PlanIntegrityError
     */
    void checkFeasibility() const;

    /**
     * Full check: feasibility, each step partitions the domain, and every
     * chunk's read footprint is covered by its predecessors
     * @throws core::PlanIntegrityError
     */
    void validate() const;

    /// Kahn order of chunk indices; throws core::PlanIntegrityError on cycles
    std::vector<std::size_t> topologicalOrder() const;

    const domain::Domain& getDomain() const { return m_domain; }
    const Coord& radius() const { return m_radius; }
    std::size_t stepCount() const { return m_stepCount; }
    const std::string& strategyName() const { return m_strategyName; }

    const std::vector<Chunk>& chunks() const { return m_chunks; }
    std::size_t chunkCount() const { return m_chunks.size(); }
    const Chunk& chunk(std::size_t index) const { return m_chunks[index]; }

    /// Chunks that list `index` as a predecessor
    const std::vector<std::size_t>& dependents(std::size_t index) const { return m_dependents[index]; }

    std::vector<std::size_t> chunksAtStep(std::size_t step) const;

    /// Largest number of chunks sharing one step
    std::size_t maxParallelWidth() const;

    /// Export the chunk DAG as GraphViz DOT
    std::string exportDOT() const;

private:
    Plan(const domain::Domain& domain,
         const Coord& radius,
         std::size_t stepCount,
         std::string strategyName,
         std::vector<Chunk> chunks);

    void checkCoverage() const;

    domain::Domain m_domain;
    Coord m_radius;
    std::size_t m_stepCount;
    std::string m_strategyName;
    std::vector<Chunk> m_chunks;
    std::vector<std::vector<std::size_t>> m_dependents;
};

} // namespace graph
