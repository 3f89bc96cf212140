#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace domain {

/// Integer grid coordinate; its size is the rank
using Coord = std::vector<int64_t>;

/**
 * @brief Axis-aligned box of grid indices, inclusive of both corners
 *
 * Maps between coordinates and a row-major linear index
 * (last dimension varies fastest).
 */
class Region {
public:
    Region() = default;

    /**
     * @throws std::invalid_argument if lo and hi differ in rank or lo > hi anywhere
     */
    Region(Coord lo, Coord hi);

    size_t rank() const { return m_lo.size(); }
    const Coord& lo() const { return m_lo; }
    const Coord& hi() const { return m_hi; }
    int64_t lo(size_t d) const { return m_lo[d]; }
    int64_t hi(size_t d) const { return m_hi[d]; }

    /// Number of points along dimension d
    int64_t extent(size_t d) const { return m_hi[d] - m_lo[d] + 1; }

    /// Total number of points
    size_t volume() const;

    bool contains(const Coord& coord) const;
    bool containsRegion(const Region& other) const;
    bool intersects(const Region& other) const;

    /// Overlap of two regions, or nullopt if they are disjoint
    std::optional<Region> intersection(const Region& other) const;

    /// Grow every side of dimension d by radius[d]
    Region expanded(const Coord& radius) const;

    size_t linearIndex(const Coord& coord) const;
    Coord coordAt(size_t linear) const;

    /**
     * Visit every point in row-major order
     * @param fn Callable taking const Coord&
     */
    template <typename Fn>
    void forEachPoint(Fn&& fn) const {
        if (m_lo.empty()) {
            return;
        }
        Coord c = m_lo;
        const size_t last = rank() - 1;
        while (true) {
            fn(static_cast<const Coord&>(c));
            size_t d = last;
            while (true) {
                if (++c[d] <= m_hi[d]) {
                    break;
                }
                c[d] = m_lo[d];
                if (d == 0) {
                    return;
                }
                --d;
            }
        }
    }

    /// "[lo0:hi0, lo1:hi1, ...]"
    std::string toString() const;

    bool operator==(const Region& other) const {
        return m_lo == other.m_lo && m_hi == other.m_hi;
    }
    bool operator!=(const Region& other) const { return !(*this == other); }

private:
    Coord m_lo;
    Coord m_hi;
};

} // namespace domain
