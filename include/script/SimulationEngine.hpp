#pragma once

#include "domain/Domain.hpp"
#include "field/FieldBuffer.hpp"
#include "graph/Executor.hpp"
#include "graph/Plan.hpp"
#include "graph/PlanStrategy.hpp"
#include "script/RunConfig.hpp"
#include "stencil/StencilSpec.hpp"

#include <memory>
#include <optional>
#include <string>

namespace script {

/**
 * @brief High-level driver for configured runs
 *
 * Turns a RunConfig into domain, stencil, strategy, plan and executor,
 * loads the initial field and persists the result.
 */
class SimulationEngine {
public:
    /**
     * Validate the configuration and build domain, stencil and strategy
     * @throws core::InvalidDomain, core::InvalidStencil, core::InvalidPlanConfig
     */
    explicit SimulationEngine(RunConfig config);

    ~SimulationEngine();

    /**
     * Generate the plan (cached after the first call)
     */
    const graph::Plan& plan();

    /**
     * Build the initial field from inline values or the input file
     * @throws core::ConfigError if neither is configured
     */
    field::FieldBuffer<double> initialField() const;

    /**
     * Run all configured steps and save the result if an output path is set
     * @return Final field
     */
    field::FieldBuffer<double> run();

    /**
     * Export the chunk DAG to GraphViz DOT format
     */
    std::string exportPlanDOT();

    const RunConfig& getConfig() const { return m_config; }
    const domain::Domain& getDomain() const { return *m_domain; }
    const stencil::StencilSpec<double>& getStencil() const { return *m_stencil; }
    const graph::RunStats& lastRunStats() const { return m_executor->lastRunStats(); }

private:
    RunConfig m_config;
    std::unique_ptr<domain::Domain> m_domain;
    std::unique_ptr<stencil::StencilSpec<double>> m_stencil;
    std::unique_ptr<graph::PlanStrategy> m_strategy;
    std::unique_ptr<graph::Executor<double>> m_executor;
    std::optional<graph::Plan> m_plan;
};

} // namespace script
