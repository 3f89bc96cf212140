#pragma once

#include "domain/Region.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace domain {

/**
 * @brief Rule applied to reads that fall outside the domain along one dimension
 */
enum class BoundaryKind {
    Periodic,   // wrap modulo extent
    ZeroClamp,  // read as zero
    EdgeClamp,  // read the nearest in-range cell
    Constant    // read a configured constant
};

/**
 * @brief Boundary policy for one dimension
 */
struct Boundary {
    BoundaryKind kind = BoundaryKind::ZeroClamp;
    double value = 0.0;  // used by Constant only

    Boundary() = default;
    Boundary(BoundaryKind k, double v = 0.0) : kind(k), value(v) {}
};

/// Inclusive index bounds of one dimension
struct Extent {
    int64_t lo = 0;
    int64_t hi = 0;
};

const char* toString(BoundaryKind kind);

/**
 * @brief Parse "periodic", "zero", "edge" or "constant"
 * @throws std::invalid_argument on unknown names
 */
BoundaryKind parseBoundaryKind(const std::string& name);

/**
 * @brief Outcome of resolving an out-of-domain read
 *
 * Either an in-range index/position to read from, or a boundary value.
 */
struct BoundaryResolution {
    bool isValue = false;
    int64_t index = 0;
    double value = 0.0;
};

/**
 * @brief Active index region of the grid plus a boundary policy per dimension
 *
 * Immutable after construction; its rank must match every stencil and
 * field used with it.
 */
class Domain {
public:
    /**
     * @throws core::InvalidDomain if lo > hi on any dimension, the rank is zero,
     *         or the boundary count differs from the rank
     */
    Domain(const std::vector<Extent>& extents, const std::vector<BoundaryKind>& boundaries);
    Domain(const std::vector<Extent>& extents, const std::vector<Boundary>& boundaries);

    size_t rank() const { return m_region.rank(); }
    const Region& region() const { return m_region; }
    int64_t lo(size_t d) const { return m_region.lo(d); }
    int64_t hi(size_t d) const { return m_region.hi(d); }
    int64_t extent(size_t d) const { return m_region.extent(d); }
    size_t pointCount() const { return m_region.volume(); }
    const Boundary& boundary(size_t d) const { return m_boundaries[d]; }
    const std::vector<Boundary>& boundaries() const { return m_boundaries; }

    bool contains(const Coord& index) const { return m_region.contains(index); }

    /**
     * Resolve a single coordinate along one dimension
     * @param index Coordinate, possibly out of range
     * @param dimension Dimension whose boundary policy applies
     */
    BoundaryResolution resolveBoundary(int64_t index, size_t dimension) const;

    /**
     * Resolve a full position
     * @param position Position of the read, possibly outside the domain
     * @param resolved Receives the in-domain position to read when the result is true
     * @param value Receives the boundary value when the result is false
     * @return true if the read maps to a cell, false if it yields a boundary value
     */
    bool resolve(const Coord& position, Coord& resolved, double& value) const;

    /// Same extents (boundaries are not compared)
    bool sameExtents(const Domain& other) const { return m_region == other.m_region; }

    std::string describe() const;

private:
    Region m_region;
    std::vector<Boundary> m_boundaries;
};

} // namespace domain
