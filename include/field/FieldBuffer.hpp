#pragma once

#include "domain/Domain.hpp"
#include "domain/Region.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace field {

using domain::Coord;

/**
 * @brief Dense storage for one time slice of the field, with a halo margin
 *
 * Storage covers the domain expanded by the halo radius and is addressed by
 * domain coordinates (halo cells sit at negative/overflow indices).
 * The halo is stale until refreshHalo() fills it from the boundary policy;
 * any mutable access to interior values marks it stale again.
 */
template <typename T>
class FieldBuffer {
public:
    /**
     * Allocate a zero-initialized buffer
     * @param domain Domain the buffer covers
     * @param radius Halo width per dimension (must match the domain rank)
     * @throws core::InvalidField on rank mismatch or negative radius
     */
    FieldBuffer(const domain::Domain& domain, const Coord& radius);

    /**
     * Build a buffer from interior values in domain order (no halo)
     * @throws core::InvalidField if values.size() differs from the domain point count
     */
    static FieldBuffer fromValues(const domain::Domain& domain, const std::vector<T>& values);

    /// As above, with a halo of the given radius
    static FieldBuffer fromValues(const domain::Domain& domain, const Coord& radius,
                                  const std::vector<T>& values);

    /// Interior values in domain order (row-major, last dimension fastest)
    std::vector<T> toValues() const;

    const domain::Domain& getDomain() const { return m_domain; }
    const Coord& radius() const { return m_radius; }
    const domain::Region& storageRegion() const { return m_storage; }
    size_t storageSize() const { return m_data.size(); }

    /// Unchecked access; coord must lie in the storage region
    const T& at(const Coord& coord) const { return m_data[m_storage.linearIndex(coord)]; }

    /// Unchecked mutable access to an interior cell; marks the halo stale
    T& at(const Coord& coord) {
        m_haloValid = false;
        return m_data[m_storage.linearIndex(coord)];
    }

    /**
     * Checked read
     * @throws std::out_of_range outside the storage region
     * @throws core::StaleHaloRead for a halo cell while the halo is stale
     */
    T get(const Coord& coord) const;

    /// Checked write to an interior cell
    void set(const Coord& coord, T value);

    void fill(T value);

    /**
     * Set every interior cell from a generator
     * @param generator Callable (const Coord&) -> T
     */
    void setValues(const std::function<T(const Coord&)>& generator);

    /// Fill halo cells from interior values according to the domain boundaries
    void refreshHalo();
    void markHaloStale() { m_haloValid = false; }
    bool isHaloValid() const { return m_haloValid; }

    /// Same domain extents and halo radius
    bool sameShape(const FieldBuffer& other) const;

    /// Raw storage for the executor's hot loop
    T* data() { return m_data.data(); }
    const T* data() const { return m_data.data(); }

private:
    domain::Domain m_domain;
    Coord m_radius;
    domain::Region m_storage;
    std::vector<T> m_data;
    bool m_haloValid = false;
};

extern template class FieldBuffer<float>;
extern template class FieldBuffer<double>;
extern template class FieldBuffer<int32_t>;
extern template class FieldBuffer<int64_t>;

} // namespace field
