#pragma once

#include "domain/Domain.hpp"
#include "graph/PlanStrategy.hpp"
#include "stencil/StencilSpec.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace script {

/**
 * @brief Everything needed to set up one run, as read from a script
 */
struct RunConfig {
    std::vector<domain::Extent> extents;
    std::vector<domain::Boundary> boundaries;
    std::vector<stencil::Term<double>> terms;
    graph::StrategyConfig strategy;
    std::size_t steps = 1;
    std::size_t threads = 0;

    // Initial field: inline values take precedence over the input file
    std::vector<double> initialValues;
    std::string inputPath;

    std::string outputPath;   // empty = do not save
    std::string dotPath;      // empty = do not export the chunk DAG
    std::string logLevel = "info";
};

} // namespace script
