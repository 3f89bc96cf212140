#include "graph/PlanStrategy.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace graph {

namespace {

struct Interval {
    int64_t lo;
    int64_t hi;
};

// Resolve [lo, hi] along dimension d into in-domain intervals
std::vector<Interval> resolveInterval(const domain::Domain& domain, size_t d, int64_t lo, int64_t hi) {
    const int64_t L = domain.lo(d);
    const int64_t H = domain.hi(d);

    if (domain.boundary(d).kind != domain::BoundaryKind::Periodic) {
        return {{std::max(lo, L), std::min(hi, H)}};
    }

    const int64_t n = H - L + 1;
    const int64_t length = hi - lo + 1;
    if (length >= n) {
        return {{L, H}};
    }

    int64_t start = (lo - L) % n;
    if (start < 0) {
        start += n;
    }
    start += L;
    const int64_t end = start + length - 1;
    if (end <= H) {
        return {{start, end}};
    }
    return {{start, H}, {L, L + (end - H) - 1}};
}

} // namespace

std::vector<domain::Region> readFootprint(const domain::Domain& domain,
                                          const domain::Region& region,
                                          const Coord& radius) {
    const size_t rank = domain.rank();
    std::vector<std::vector<Interval>> perDim(rank);
    for (size_t d = 0; d < rank; ++d) {
        perDim[d] = resolveInterval(domain, d, region.lo(d) - radius[d], region.hi(d) + radius[d]);
    }

    // Cartesian product of the per-dimension intervals
    std::vector<domain::Region> boxes;
    std::vector<size_t> pick(rank, 0);
    while (true) {
        Coord lo(rank);
        Coord hi(rank);
        for (size_t d = 0; d < rank; ++d) {
            lo[d] = perDim[d][pick[d]].lo;
            hi[d] = perDim[d][pick[d]].hi;
        }
        boxes.emplace_back(std::move(lo), std::move(hi));

        size_t d = rank;
        while (d > 0) {
            --d;
            if (++pick[d] < perDim[d].size()) {
                break;
            }
            pick[d] = 0;
            if (d == 0) {
                return boxes;
            }
        }
    }
}

std::vector<Chunk> DirectStrategy::decompose(const domain::Domain& domain,
                                             const Coord& radius,
                                             std::size_t stepCount) const {
    (void)radius;
    std::vector<Chunk> chunks;
    chunks.reserve(stepCount);
    for (size_t s = 0; s < stepCount; ++s) {
        Chunk chunk;
        chunk.region = domain.region();
        chunk.step = s;
        if (s > 0) {
            chunk.predecessors.push_back(s - 1);
        }
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

SpatialTiledStrategy::SpatialTiledStrategy(std::vector<int64_t> tileExtent)
    : m_tileExtent(std::move(tileExtent)) {
    if (m_tileExtent.empty()) {
        throw core::InvalidPlanConfig("tile extent must not be empty");
    }
    for (size_t d = 0; d < m_tileExtent.size(); ++d) {
        if (m_tileExtent[d] <= 0) {
            throw core::InvalidPlanConfig("tile extent in dimension " + std::to_string(d) +
                                          " must be positive, got " + std::to_string(m_tileExtent[d]));
        }
    }
}

std::vector<Chunk> SpatialTiledStrategy::decompose(const domain::Domain& domain,
                                                   const Coord& radius,
                                                   std::size_t stepCount) const {
    const size_t rank = domain.rank();
    if (m_tileExtent.size() != rank) {
        throw core::InvalidPlanConfig("tile extent rank " + std::to_string(m_tileExtent.size()) +
                                      " does not match domain rank " + std::to_string(rank));
    }

    // Tile grid: tile i along d covers [lo + i*t, min(lo + (i+1)*t - 1, hi)]
    std::vector<int64_t> tilesPerDim(rank);
    size_t tileCount = 1;
    for (size_t d = 0; d < rank; ++d) {
        tilesPerDim[d] = (domain.extent(d) + m_tileExtent[d] - 1) / m_tileExtent[d];
        tileCount *= static_cast<size_t>(tilesPerDim[d]);
    }
    const domain::Region tileGrid(Coord(rank, 0), [&] {
        Coord hi(rank);
        for (size_t d = 0; d < rank; ++d) {
            hi[d] = tilesPerDim[d] - 1;
        }
        return hi;
    }());

    LOG_DEBUG("SpatialTiled: {} tiles per step over {}", tileCount, domain.region().toString());

    // Spatial layout and predecessor tile sets, identical for every step
    std::vector<domain::Region> tiles;
    std::vector<std::vector<size_t>> predecessorTiles;
    tiles.reserve(tileCount);
    predecessorTiles.reserve(tileCount);
    tileGrid.forEachPoint([&](const Coord& t) {
        Coord lo(rank);
        Coord hi(rank);
        for (size_t d = 0; d < rank; ++d) {
            lo[d] = domain.lo(d) + t[d] * m_tileExtent[d];
            hi[d] = std::min(lo[d] + m_tileExtent[d] - 1, domain.hi(d));
        }
        domain::Region tile(std::move(lo), std::move(hi));

        std::set<size_t> preds;
        for (const auto& box : readFootprint(domain, tile, radius)) {
            Coord first(rank);
            Coord last(rank);
            for (size_t d = 0; d < rank; ++d) {
                first[d] = (box.lo(d) - domain.lo(d)) / m_tileExtent[d];
                last[d] = (box.hi(d) - domain.lo(d)) / m_tileExtent[d];
            }
            domain::Region(std::move(first), std::move(last)).forEachPoint([&](const Coord& p) {
                preds.insert(tileGrid.linearIndex(p));
            });
        }

        tiles.push_back(std::move(tile));
        predecessorTiles.emplace_back(preds.begin(), preds.end());
    });

    std::vector<Chunk> chunks;
    chunks.reserve(tileCount * stepCount);
    for (size_t s = 0; s < stepCount; ++s) {
        for (size_t t = 0; t < tileCount; ++t) {
            Chunk chunk;
            chunk.region = tiles[t];
            chunk.step = s;
            if (s > 0) {
                chunk.predecessors.reserve(predecessorTiles[t].size());
                for (size_t p : predecessorTiles[t]) {
                    chunk.predecessors.push_back((s - 1) * tileCount + p);
                }
            }
            chunks.push_back(std::move(chunk));
        }
    }
    return chunks;
}

namespace {

// outer minus inner as disjoint boxes: per dimension, a slab below and above
// the inner box, restricted to the inner range in the dimensions already cut
std::vector<domain::Region> subtractBox(const domain::Region& outer, const domain::Region& inner) {
    std::vector<domain::Region> boxes;
    Coord lo = outer.lo();
    Coord hi = outer.hi();
    for (size_t d = 0; d < outer.rank(); ++d) {
        if (inner.lo(d) > lo[d]) {
            Coord slabHi = hi;
            slabHi[d] = inner.lo(d) - 1;
            boxes.emplace_back(lo, std::move(slabHi));
        }
        if (inner.hi(d) < hi[d]) {
            Coord slabLo = lo;
            slabLo[d] = inner.hi(d) + 1;
            boxes.emplace_back(std::move(slabLo), hi);
        }
        lo[d] = inner.lo(d);
        hi[d] = inner.hi(d);
    }
    return boxes;
}

} // namespace

std::vector<Chunk> TrapezoidStrategy::decompose(const domain::Domain& domain,
                                                const Coord& radius,
                                                std::size_t stepCount) const {
    const size_t rank = domain.rank();
    if (radius.size() != rank) {
        throw core::InvalidPlanConfig("radius rank " + std::to_string(radius.size()) +
                                      " does not match domain rank " + std::to_string(rank));
    }

    std::vector<Chunk> chunks;
    std::vector<size_t> previous;
    for (size_t s = 0; s < stepCount; ++s) {
        const int64_t level = static_cast<int64_t>(m_height == 0 ? s + 1 : s % m_height + 1);

        // Core: the domain shrunk by level * radius on both sides
        bool coreEmpty = false;
        Coord coreLo(rank);
        Coord coreHi(rank);
        for (size_t d = 0; d < rank; ++d) {
            coreLo[d] = domain.lo(d) + level * radius[d];
            coreHi[d] = domain.hi(d) - level * radius[d];
            if (coreLo[d] > coreHi[d]) {
                coreEmpty = true;
            }
        }

        std::vector<domain::Region> regions;
        if (coreEmpty) {
            regions.push_back(domain.region());
        } else {
            domain::Region core(std::move(coreLo), std::move(coreHi));
            regions = subtractBox(domain.region(), core);
            regions.insert(regions.begin(), std::move(core));
        }
        LOG_DEBUG("Trapezoid step {}: level {}, {} chunks", s, level, regions.size());

        std::vector<size_t> current;
        current.reserve(regions.size());
        for (auto& region : regions) {
            Chunk chunk;
            chunk.step = s;
            if (s > 0) {
                std::set<size_t> preds;
                for (const auto& box : readFootprint(domain, region, radius)) {
                    for (size_t p : previous) {
                        if (box.intersects(chunks[p].region)) {
                            preds.insert(p);
                        }
                    }
                }
                chunk.predecessors.assign(preds.begin(), preds.end());
            }
            chunk.region = std::move(region);
            current.push_back(chunks.size());
            chunks.push_back(std::move(chunk));
        }
        previous = std::move(current);
    }
    return chunks;
}

StrategyKind parseStrategyKind(const std::string& name) {
    if (name == "direct") {
        return StrategyKind::Direct;
    }
    if (name == "spatial_tiled") {
        return StrategyKind::SpatialTiled;
    }
    if (name == "trapezoid") {
        return StrategyKind::Trapezoid;
    }
    throw core::InvalidPlanConfig("unknown strategy: " + name);
}

const char* toString(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Direct:
            return "direct";
        case StrategyKind::SpatialTiled:
            return "spatial_tiled";
        case StrategyKind::Trapezoid:
            return "trapezoid";
    }
    return "unknown";
}

std::unique_ptr<PlanStrategy> makeStrategy(const StrategyConfig& config) {
    switch (config.kind) {
        case StrategyKind::Direct:
            return std::make_unique<DirectStrategy>();
        case StrategyKind::SpatialTiled:
            return std::make_unique<SpatialTiledStrategy>(config.tileExtent);
        case StrategyKind::Trapezoid:
            return std::make_unique<TrapezoidStrategy>(config.height);
    }
    throw core::InvalidPlanConfig("unknown strategy kind");
}

} // namespace graph
