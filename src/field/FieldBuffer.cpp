#include "field/FieldBuffer.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace field {

namespace {

domain::Region storageFor(const domain::Domain& domain, const Coord& radius) {
    if (radius.size() != domain.rank()) {
        throw core::InvalidField("halo radius rank " + std::to_string(radius.size()) +
                                 " does not match domain rank " + std::to_string(domain.rank()));
    }
    for (auto r : radius) {
        if (r < 0) {
            throw core::InvalidField("halo radius must be non-negative");
        }
    }
    return domain.region().expanded(radius);
}

} // namespace

template <typename T>
FieldBuffer<T>::FieldBuffer(const domain::Domain& domain, const Coord& radius)
    : m_domain(domain),
      m_radius(radius),
      m_storage(storageFor(domain, radius)),
      m_data(m_storage.volume(), T(0)) {
    LOG_TRACE("FieldBuffer allocated: storage {} ({} cells)", m_storage.toString(), m_data.size());
}

template <typename T>
FieldBuffer<T> FieldBuffer<T>::fromValues(const domain::Domain& domain, const std::vector<T>& values) {
    return fromValues(domain, Coord(domain.rank(), 0), values);
}

template <typename T>
FieldBuffer<T> FieldBuffer<T>::fromValues(const domain::Domain& domain, const Coord& radius,
                                          const std::vector<T>& values) {
    if (values.size() != domain.pointCount()) {
        throw core::InvalidField("expected " + std::to_string(domain.pointCount()) +
                                 " values, got " + std::to_string(values.size()));
    }
    FieldBuffer buffer(domain, radius);
    size_t i = 0;
    domain.region().forEachPoint([&](const Coord& c) {
        buffer.m_data[buffer.m_storage.linearIndex(c)] = values[i++];
    });
    return buffer;
}

template <typename T>
std::vector<T> FieldBuffer<T>::toValues() const {
    std::vector<T> values;
    values.reserve(m_domain.pointCount());
    m_domain.region().forEachPoint([&](const Coord& c) {
        values.push_back(m_data[m_storage.linearIndex(c)]);
    });
    return values;
}

template <typename T>
T FieldBuffer<T>::get(const Coord& coord) const {
    if (!m_storage.contains(coord)) {
        throw std::out_of_range("coordinate outside field storage " + m_storage.toString());
    }
    if (!m_domain.contains(coord) && !m_haloValid) {
        throw core::StaleHaloRead("halo cell read before refreshHalo()");
    }
    return m_data[m_storage.linearIndex(coord)];
}

template <typename T>
void FieldBuffer<T>::set(const Coord& coord, T value) {
    if (!m_domain.contains(coord)) {
        throw std::out_of_range("write outside domain " + m_domain.region().toString());
    }
    at(coord) = value;
}

template <typename T>
void FieldBuffer<T>::fill(T value) {
    std::fill(m_data.begin(), m_data.end(), value);
    m_haloValid = false;
}

template <typename T>
void FieldBuffer<T>::setValues(const std::function<T(const Coord&)>& generator) {
    m_domain.region().forEachPoint([&](const Coord& c) {
        m_data[m_storage.linearIndex(c)] = generator(c);
    });
    m_haloValid = false;
}

template <typename T>
void FieldBuffer<T>::refreshHalo() {
    Coord resolved;
    m_storage.forEachPoint([&](const Coord& c) {
        if (m_domain.contains(c)) {
            return;
        }
        double value = 0.0;
        T& cell = m_data[m_storage.linearIndex(c)];
        if (m_domain.resolve(c, resolved, value)) {
            cell = m_data[m_storage.linearIndex(resolved)];
        } else {
            cell = static_cast<T>(value);
        }
    });
    m_haloValid = true;
}

template <typename T>
bool FieldBuffer<T>::sameShape(const FieldBuffer& other) const {
    return m_domain.sameExtents(other.m_domain) && m_radius == other.m_radius;
}

template class FieldBuffer<float>;
template class FieldBuffer<double>;
template class FieldBuffer<int32_t>;
template class FieldBuffer<int64_t>;

} // namespace field
