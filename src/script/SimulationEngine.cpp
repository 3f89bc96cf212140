#include "script/SimulationEngine.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "io/FieldIO.hpp"

#include <fstream>
#include <utility>

namespace script {

SimulationEngine::SimulationEngine(RunConfig config)
    : m_config(std::move(config)) {
    LOG_INFO("Initializing SimulationEngine ({} steps, strategy '{}')",
             m_config.steps,
             graph::toString(m_config.strategy.kind));

    try {
        m_domain = std::make_unique<domain::Domain>(m_config.extents, m_config.boundaries);
        m_stencil = std::make_unique<stencil::StencilSpec<double>>(m_config.terms);
        m_strategy = graph::makeStrategy(m_config.strategy);

        graph::ExecutorConfig execConfig;
        execConfig.threadCount = m_config.threads;
        m_executor = std::make_unique<graph::Executor<double>>(*m_stencil, execConfig);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to initialize SimulationEngine: {}", e.what());
        throw;
    }

    LOG_INFO("SimulationEngine initialized: domain {}, stencil {}",
             m_domain->describe(), m_stencil->describe());
}

SimulationEngine::~SimulationEngine() {
    LOG_DEBUG("SimulationEngine destroyed");
}

const graph::Plan& SimulationEngine::plan() {
    if (!m_plan) {
        m_plan.emplace(graph::Plan::generate(*m_strategy, *m_domain, *m_stencil, m_config.steps));
    }
    return *m_plan;
}

field::FieldBuffer<double> SimulationEngine::initialField() const {
    if (!m_config.initialValues.empty()) {
        return field::FieldBuffer<double>::fromValues(*m_domain, m_config.initialValues);
    }
    if (!m_config.inputPath.empty()) {
        return io::FieldIO::load(m_config.inputPath, *m_domain);
    }
    throw core::ConfigError("no initial field: set 'initial' or 'input'");
}

field::FieldBuffer<double> SimulationEngine::run() {
    const graph::Plan& p = plan();

    if (!m_config.dotPath.empty()) {
        std::ofstream dot(m_config.dotPath);
        if (!dot) {
            throw core::ConfigError("cannot write DOT file " + m_config.dotPath);
        }
        dot << p.exportDOT();
        LOG_INFO("Chunk DAG written to {}", m_config.dotPath);
    }

    auto result = m_executor->run(p, initialField());

    if (!m_config.outputPath.empty()) {
        io::FieldIO::save(m_config.outputPath, result);
    }
    return result;
}

std::string SimulationEngine::exportPlanDOT() {
    return plan().exportDOT();
}

} // namespace script
