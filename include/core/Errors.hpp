#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace core {

/**
 * @brief Base class of every error raised by StencilLoom
 */
class StencilError : public std::runtime_error {
public:
    explicit StencilError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Malformed domain bounds or boundary configuration
class InvalidDomain : public StencilError {
public:
    explicit InvalidDomain(const std::string& message)
        : StencilError("InvalidDomain: " + message) {}
};

/// Empty or degenerate stencil offset set
class InvalidStencil : public StencilError {
public:
    explicit InvalidStencil(const std::string& message)
        : StencilError("InvalidStencil: " + message) {}
};

/// Non-positive tile extents or rank mismatch between plan inputs
class InvalidPlanConfig : public StencilError {
public:
    explicit InvalidPlanConfig(const std::string& message)
        : StencilError("InvalidPlanConfig: " + message) {}
};

/**
 * @brief Cyclic or unsatisfiable chunk DAG
 *
 * Always a defect of the strategy that produced the plan.
 */
class PlanIntegrityError : public StencilError {
public:
    explicit PlanIntegrityError(const std::string& message)
        : StencilError("PlanIntegrityError: " + message) {}
};

/// Field values that do not match their domain
class InvalidField : public StencilError {
public:
    explicit InvalidField(const std::string& message)
        : StencilError("InvalidField: " + message) {}
};

/// A halo cell was read while the halo was stale
class StaleHaloRead : public StencilError {
public:
    explicit StaleHaloRead(const std::string& message)
        : StencilError("StaleHaloRead: " + message) {}
};

/// Malformed run configuration (script layer)
class ConfigError : public StencilError {
public:
    explicit ConfigError(const std::string& message)
        : StencilError("ConfigError: " + message) {}
};

/**
 * @brief A coefficient or neighbor lookup failed while a chunk was evaluated
 *
 * Identifies the failing chunk by index, time step and region bounds.
 */
class EvaluationError : public StencilError {
public:
    EvaluationError(const std::string& message,
                    std::size_t chunkIndex,
                    std::size_t step,
                    std::vector<int64_t> regionLo,
                    std::vector<int64_t> regionHi);

    std::size_t chunkIndex() const { return m_chunkIndex; }
    std::size_t step() const { return m_step; }
    const std::vector<int64_t>& regionLo() const { return m_regionLo; }
    const std::vector<int64_t>& regionHi() const { return m_regionHi; }

    /// Message of the underlying failure, without the chunk identity
    const std::string& cause() const { return m_cause; }

private:
    std::string m_cause;
    std::size_t m_chunkIndex;
    std::size_t m_step;
    std::vector<int64_t> m_regionLo;
    std::vector<int64_t> m_regionHi;
};

} // namespace core
