#include "domain/Region.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace domain {

Region::Region(Coord lo, Coord hi)
    : m_lo(std::move(lo)), m_hi(std::move(hi)) {
    if (m_lo.size() != m_hi.size()) {
        throw std::invalid_argument("Region corners differ in rank");
    }
    for (size_t d = 0; d < m_lo.size(); ++d) {
        if (m_lo[d] > m_hi[d]) {
            throw std::invalid_argument("Region lower corner exceeds upper corner in dimension " +
                                        std::to_string(d));
        }
    }
}

size_t Region::volume() const {
    if (m_lo.empty()) {
        return 0;
    }
    size_t v = 1;
    for (size_t d = 0; d < rank(); ++d) {
        v *= static_cast<size_t>(extent(d));
    }
    return v;
}

bool Region::contains(const Coord& coord) const {
    if (coord.size() != rank()) {
        return false;
    }
    for (size_t d = 0; d < rank(); ++d) {
        if (coord[d] < m_lo[d] || coord[d] > m_hi[d]) {
            return false;
        }
    }
    return true;
}

bool Region::containsRegion(const Region& other) const {
    if (other.rank() != rank()) {
        return false;
    }
    for (size_t d = 0; d < rank(); ++d) {
        if (other.m_lo[d] < m_lo[d] || other.m_hi[d] > m_hi[d]) {
            return false;
        }
    }
    return true;
}

bool Region::intersects(const Region& other) const {
    if (other.rank() != rank()) {
        return false;
    }
    for (size_t d = 0; d < rank(); ++d) {
        if (other.m_hi[d] < m_lo[d] || other.m_lo[d] > m_hi[d]) {
            return false;
        }
    }
    return true;
}

std::optional<Region> Region::intersection(const Region& other) const {
    if (!intersects(other)) {
        return std::nullopt;
    }
    Coord lo(rank());
    Coord hi(rank());
    for (size_t d = 0; d < rank(); ++d) {
        lo[d] = std::max(m_lo[d], other.m_lo[d]);
        hi[d] = std::min(m_hi[d], other.m_hi[d]);
    }
    return Region(std::move(lo), std::move(hi));
}

Region Region::expanded(const Coord& radius) const {
    if (radius.size() != rank()) {
        throw std::invalid_argument("Radius rank does not match region rank");
    }
    Coord lo = m_lo;
    Coord hi = m_hi;
    for (size_t d = 0; d < rank(); ++d) {
        lo[d] -= radius[d];
        hi[d] += radius[d];
    }
    return Region(std::move(lo), std::move(hi));
}

size_t Region::linearIndex(const Coord& coord) const {
    size_t index = 0;
    for (size_t d = 0; d < rank(); ++d) {
        index = index * static_cast<size_t>(extent(d)) + static_cast<size_t>(coord[d] - m_lo[d]);
    }
    return index;
}

Coord Region::coordAt(size_t linear) const {
    Coord c(rank());
    for (size_t d = rank(); d-- > 0;) {
        const auto n = static_cast<size_t>(extent(d));
        c[d] = m_lo[d] + static_cast<int64_t>(linear % n);
        linear /= n;
    }
    return c;
}

std::string Region::toString() const {
    std::ostringstream ss;
    ss << "[";
    for (size_t d = 0; d < rank(); ++d) {
        if (d > 0) {
            ss << ", ";
        }
        ss << m_lo[d] << ":" << m_hi[d];
    }
    ss << "]";
    return ss.str();
}

} // namespace domain
