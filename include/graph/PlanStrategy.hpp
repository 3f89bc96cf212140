#pragma once

#include "domain/Domain.hpp"
#include "domain/Region.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace graph {

using domain::Coord;

/**
 * @brief Indivisible unit of work: one spatial region at one time step
 *
 * A chunk with step s reads state s and writes state s+1. Predecessors are
 * indices into the owning plan's chunk arena.
 */
struct Chunk {
    domain::Region region;
    std::size_t step = 0;
    std::vector<std::size_t> predecessors;
};

/**
 * @brief Decomposition strategy interface
 *
 * Implementations must be deterministic and must produce chunks whose
 * radius-expanded read footprint is covered by their predecessors.
 */
class PlanStrategy {
public:
    virtual ~PlanStrategy() = default;

    virtual std::string name() const = 0;

    /**
     * Produce the chunk arena for a run
     * @param domain Domain to decompose
     * @param radius Stencil radius per dimension
     * @param stepCount Number of time steps
     * @throws core::InvalidPlanConfig if the strategy cannot handle the inputs
     */
    virtual std::vector<Chunk> decompose(const domain::Domain& domain,
                                         const Coord& radius,
                                         std::size_t stepCount) const = 0;
};

/**
 * @brief One chunk per step covering the entire domain
 */
class DirectStrategy : public PlanStrategy {
public:
    std::string name() const override { return "direct"; }

    std::vector<Chunk> decompose(const domain::Domain& domain,
                                 const Coord& radius,
                                 std::size_t stepCount) const override;
};

/**
 * @brief Fixed-size spatial tiles, one chunk per tile per step
 *
 * Tiles that do not divide the extent are truncated at the upper edge.
 */
class SpatialTiledStrategy : public PlanStrategy {
public:
    /**
     * @throws core::InvalidPlanConfig if tileExtent is empty or any entry is <= 0
     */
    explicit SpatialTiledStrategy(std::vector<int64_t> tileExtent);

    std::string name() const override { return "spatial_tiled"; }

    const std::vector<int64_t>& tileExtent() const { return m_tileExtent; }

    std::vector<Chunk> decompose(const domain::Domain& domain,
                                 const Coord& radius,
                                 std::size_t stepCount) const override;

private:
    std::vector<int64_t> m_tileExtent;
};

/**
 * @brief Time-skewed trapezoids: a shrinking core plus boundary fillers
 *
 * At level k the core is the domain shrunk by k * radius on every side. The
 * core of step s is computed from the core of step s - 1 alone, so the core
 * chain never waits on the filler chunks around it. Fillers are the boxes
 * between the core and the domain edge. Levels count 1, 2, ... and restart
 * every `height` steps (0 = never). Once the core is empty a step is a
 * single chunk.
 */
class TrapezoidStrategy : public PlanStrategy {
public:
    explicit TrapezoidStrategy(std::size_t height = 0) : m_height(height) {}

    std::string name() const override { return "trapezoid"; }

    std::size_t height() const { return m_height; }

    std::vector<Chunk> decompose(const domain::Domain& domain,
                                 const Coord& radius,
                                 std::size_t stepCount) const override;

private:
    std::size_t m_height;
};

enum class StrategyKind {
    Direct,
    SpatialTiled,
    Trapezoid
};

/**
 * @brief Strategy selection as it arrives from configuration
 */
struct StrategyConfig {
    StrategyKind kind = StrategyKind::Direct;
    std::vector<int64_t> tileExtent;  // SpatialTiled only
    std::size_t height = 0;           // Trapezoid only
};

/**
 * @brief Parse "direct", "spatial_tiled" or "trapezoid"
 * @throws core::InvalidPlanConfig on unknown names
 */
StrategyKind parseStrategyKind(const std::string& name);

const char* toString(StrategyKind kind);

/**
 * @throws core::InvalidPlanConfig for invalid tile extents
 */
std::unique_ptr<PlanStrategy> makeStrategy(const StrategyConfig& config);

/**
 * @brief Cells a chunk region reads, after applying the boundary policy
 *
 * Along periodic dimensions the radius-expanded interval wraps around; along
 * the other dimensions it is clipped to the domain. The returned boxes are
 * pairwise disjoint and lie inside the domain.
 */
std::vector<domain::Region> readFootprint(const domain::Domain& domain,
                                          const domain::Region& region,
                                          const Coord& radius);

} // namespace graph
