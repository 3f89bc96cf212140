#pragma once

#include "domain/Region.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace stencil {

using domain::Coord;

/**
 * @brief Weight of one stencil term: a constant or a pure function of (position, step)
 *
 * Function coefficients must be safe to call concurrently; they report
 * failures by throwing.
 */
template <typename T>
class Coefficient {
public:
    using Function = std::function<T(const Coord& position, std::size_t step)>;

    Coefficient(T value) : m_value(std::in_place_index<0>, value) {}

    template <typename Fn,
              typename = std::enable_if_t<std::is_invocable_r_v<T, Fn&, const Coord&, std::size_t>>>
    Coefficient(Fn fn) : m_value(std::in_place_index<1>, Function(std::move(fn))) {}

    static Coefficient constant(T value) { return Coefficient(value); }
    static Coefficient function(Function fn) { return Coefficient(std::move(fn)); }

    bool isConstant() const { return std::holds_alternative<T>(m_value); }

    /**
     * Coefficient at a grid position and time step
     * @throws std::domain_error if a function yields a non-finite floating value
     */
    T at(const Coord& position, std::size_t step) const;

private:
    std::variant<T, Function> m_value;
};

namespace detail {

/// sum + coefficient * value; integer overflow throws std::overflow_error
template <typename T>
T multiplyAdd(T sum, T coefficient, T value) {
    if constexpr (std::is_integral_v<T>) {
        T product{};
        if (__builtin_mul_overflow(coefficient, value, &product) ||
            __builtin_add_overflow(sum, product, &sum)) {
            throw std::overflow_error("integer overflow while applying stencil");
        }
        return sum;
    } else {
        return sum + coefficient * value;
    }
}

} // namespace detail

/**
 * @brief One (offset, coefficient) pair
 */
template <typename T>
struct Term {
    Coord offset;
    Coefficient<T> coefficient;
};

/**
 * @brief Immutable set of neighbor offsets with their coefficients
 *
 * The new value at p is the sum over terms of coefficient(p, step) * u(p + offset).
 * Terms are summed in construction order, so evaluation is reproducible.
 */
template <typename T>
class StencilSpec {
public:
    /**
     * @throws core::InvalidStencil if the term list is empty, offsets are duplicated,
     *         offsets disagree in rank, or a constant coefficient is not finite
     */
    explicit StencilSpec(std::vector<Term<T>> terms);

    size_t rank() const { return m_radius.size(); }
    size_t size() const { return m_terms.size(); }
    const std::vector<Term<T>>& terms() const { return m_terms; }

    /// Largest absolute offset component per dimension
    const Coord& radius() const { return m_radius; }

    /// True if every coefficient is a constant
    bool isHomogeneous() const;

    /**
     * Apply the stencil at one position
     * @param position Grid position being computed
     * @param step Time step index passed to coefficient functions
     * @param lookup Callable (const Coord&) -> T resolving a neighbor value
     * @param scratch Reusable storage for neighbor positions
     * @throws std::overflow_error if an integer sum overflows
     * @throws std::domain_error if a floating sum or coefficient is not finite
     */
    template <typename Lookup>
    T evaluate(const Coord& position, std::size_t step, Lookup&& lookup, Coord& scratch) const {
        scratch.resize(position.size());
        T sum = T(0);
        for (const auto& term : m_terms) {
            for (size_t d = 0; d < position.size(); ++d) {
                scratch[d] = position[d] + term.offset[d];
            }
            sum = detail::multiplyAdd(sum, term.coefficient.at(position, step),
                                      static_cast<T>(lookup(static_cast<const Coord&>(scratch))));
        }
        if constexpr (std::is_floating_point_v<T>) {
            if (!std::isfinite(sum)) {
                throw std::domain_error("stencil sum is not finite");
            }
        }
        return sum;
    }

    template <typename Lookup>
    T evaluate(const Coord& position, std::size_t step, Lookup&& lookup) const {
        Coord scratch;
        return evaluate(position, step, std::forward<Lookup>(lookup), scratch);
    }

    /// Sum of all coefficients at a position and step
    T coefficientSum(const Coord& position, std::size_t step) const;

    std::string describe() const;

private:
    std::vector<Term<T>> m_terms;
    Coord m_radius;
};

extern template class Coefficient<float>;
extern template class Coefficient<double>;
extern template class Coefficient<int32_t>;
extern template class Coefficient<int64_t>;

extern template class StencilSpec<float>;
extern template class StencilSpec<double>;
extern template class StencilSpec<int32_t>;
extern template class StencilSpec<int64_t>;

} // namespace stencil
