#include "stencil/StencilSpec.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <cmath>
#include <cstdint>
#include <set>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace stencil {

template <typename T>
T Coefficient<T>::at(const Coord& position, std::size_t step) const {
    if (const T* value = std::get_if<T>(&m_value)) {
        return *value;
    }
    T result = std::get<Function>(m_value)(position, step);
    if constexpr (std::is_floating_point_v<T>) {
        if (!std::isfinite(result)) {
            throw std::domain_error("coefficient function returned a non-finite value");
        }
    }
    return result;
}

template <typename T>
StencilSpec<T>::StencilSpec(std::vector<Term<T>> terms)
    : m_terms(std::move(terms)) {
    if (m_terms.empty()) {
        throw core::InvalidStencil("offset set is empty");
    }

    const size_t rank = m_terms.front().offset.size();
    if (rank == 0) {
        throw core::InvalidStencil("offsets must have at least one dimension");
    }

    m_radius.assign(rank, 0);
    std::set<Coord> seen;
    for (const auto& term : m_terms) {
        if (term.offset.size() != rank) {
            throw core::InvalidStencil("offsets disagree in rank");
        }
        if (!seen.insert(term.offset).second) {
            throw core::InvalidStencil("duplicate offset " + domain::Region(term.offset, term.offset).toString());
        }
        if constexpr (std::is_floating_point_v<T>) {
            if (term.coefficient.isConstant() && !std::isfinite(term.coefficient.at(term.offset, 0))) {
                throw core::InvalidStencil("constant coefficient is not finite");
            }
        }
        for (size_t d = 0; d < rank; ++d) {
            const int64_t magnitude = term.offset[d] < 0 ? -term.offset[d] : term.offset[d];
            if (magnitude > m_radius[d]) {
                m_radius[d] = magnitude;
            }
        }
    }

    LOG_DEBUG("StencilSpec created: {}", describe());
}

template <typename T>
bool StencilSpec<T>::isHomogeneous() const {
    for (const auto& term : m_terms) {
        if (!term.coefficient.isConstant()) {
            return false;
        }
    }
    return true;
}

template <typename T>
T StencilSpec<T>::coefficientSum(const Coord& position, std::size_t step) const {
    T sum = T(0);
    for (const auto& term : m_terms) {
        sum = detail::multiplyAdd(sum, term.coefficient.at(position, step), T(1));
    }
    return sum;
}

template <typename T>
std::string StencilSpec<T>::describe() const {
    std::ostringstream ss;
    ss << m_terms.size() << " terms, rank " << rank() << ", radius (";
    for (size_t d = 0; d < m_radius.size(); ++d) {
        if (d > 0) {
            ss << ", ";
        }
        ss << m_radius[d];
    }
    ss << ")" << (isHomogeneous() ? ", homogeneous" : ", non-homogeneous");
    return ss.str();
}

template class Coefficient<float>;
template class Coefficient<double>;
template class Coefficient<int32_t>;
template class Coefficient<int64_t>;

template class StencilSpec<float>;
template class StencilSpec<double>;
template class StencilSpec<int32_t>;
template class StencilSpec<int64_t>;

} // namespace stencil
