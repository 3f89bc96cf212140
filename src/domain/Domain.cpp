#include "domain/Domain.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <sstream>
#include <stdexcept>

namespace domain {

const char* toString(BoundaryKind kind) {
    switch (kind) {
        case BoundaryKind::Periodic:
            return "periodic";
        case BoundaryKind::ZeroClamp:
            return "zero";
        case BoundaryKind::EdgeClamp:
            return "edge";
        case BoundaryKind::Constant:
            return "constant";
    }
    return "unknown";
}

BoundaryKind parseBoundaryKind(const std::string& name) {
    if (name == "periodic") return BoundaryKind::Periodic;
    if (name == "zero") return BoundaryKind::ZeroClamp;
    if (name == "edge") return BoundaryKind::EdgeClamp;
    if (name == "constant") return BoundaryKind::Constant;
    throw std::invalid_argument("Unknown boundary kind: " + name);
}

namespace {

std::vector<Boundary> toBoundaries(const std::vector<BoundaryKind>& kinds) {
    std::vector<Boundary> result;
    result.reserve(kinds.size());
    for (auto kind : kinds) {
        result.emplace_back(kind);
    }
    return result;
}

Region makeRegion(const std::vector<Extent>& extents) {
    if (extents.empty()) {
        throw core::InvalidDomain("domain must have at least one dimension");
    }
    Coord lo(extents.size());
    Coord hi(extents.size());
    for (size_t d = 0; d < extents.size(); ++d) {
        if (extents[d].lo > extents[d].hi) {
            std::ostringstream ss;
            ss << "dimension " << d << " has lo " << extents[d].lo << " > hi " << extents[d].hi;
            throw core::InvalidDomain(ss.str());
        }
        lo[d] = extents[d].lo;
        hi[d] = extents[d].hi;
    }
    return Region(std::move(lo), std::move(hi));
}

} // namespace

Domain::Domain(const std::vector<Extent>& extents, const std::vector<BoundaryKind>& boundaries)
    : Domain(extents, toBoundaries(boundaries)) {}

Domain::Domain(const std::vector<Extent>& extents, const std::vector<Boundary>& boundaries)
    : m_region(makeRegion(extents)), m_boundaries(boundaries) {
    if (m_boundaries.size() != extents.size()) {
        throw core::InvalidDomain("expected " + std::to_string(extents.size()) +
                                  " boundary kinds, got " + std::to_string(m_boundaries.size()));
    }
    LOG_DEBUG("Domain created: {}", describe());
}

BoundaryResolution Domain::resolveBoundary(int64_t index, size_t dimension) const {
    BoundaryResolution r;
    const int64_t lo = m_region.lo(dimension);
    const int64_t hi = m_region.hi(dimension);
    if (index >= lo && index <= hi) {
        r.index = index;
        return r;
    }

    const Boundary& b = m_boundaries[dimension];
    switch (b.kind) {
        case BoundaryKind::Periodic: {
            const int64_t n = hi - lo + 1;
            int64_t offset = (index - lo) % n;
            if (offset < 0) {
                offset += n;
            }
            r.index = lo + offset;
            break;
        }
        case BoundaryKind::EdgeClamp:
            r.index = index < lo ? lo : hi;
            break;
        case BoundaryKind::ZeroClamp:
            r.isValue = true;
            r.value = 0.0;
            break;
        case BoundaryKind::Constant:
            r.isValue = true;
            r.value = b.value;
            break;
    }
    return r;
}

bool Domain::resolve(const Coord& position, Coord& resolved, double& value) const {
    resolved.resize(rank());
    for (size_t d = 0; d < rank(); ++d) {
        BoundaryResolution r = resolveBoundary(position[d], d);
        if (r.isValue) {
            value = r.value;
            return false;
        }
        resolved[d] = r.index;
    }
    return true;
}

std::string Domain::describe() const {
    std::ostringstream ss;
    ss << m_region.toString() << " boundaries (";
    for (size_t d = 0; d < m_boundaries.size(); ++d) {
        if (d > 0) {
            ss << ", ";
        }
        ss << toString(m_boundaries[d].kind);
        if (m_boundaries[d].kind == BoundaryKind::Constant) {
            ss << "=" << m_boundaries[d].value;
        }
    }
    ss << ")";
    return ss.str();
}

} // namespace domain
