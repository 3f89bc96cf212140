#include "graph/Plan.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cstdint>
#include <queue>
#include <sstream>
#include <utility>

namespace graph {

Plan::Plan(const domain::Domain& domain,
           const Coord& radius,
           std::size_t stepCount,
           std::string strategyName,
           std::vector<Chunk> chunks)
    : m_domain(domain),
      m_radius(radius),
      m_stepCount(stepCount),
      m_strategyName(std::move(strategyName)),
      m_chunks(std::move(chunks)),
      m_dependents(m_chunks.size()) {
    for (size_t i = 0; i < m_chunks.size(); ++i) {
        for (size_t p : m_chunks[i].predecessors) {
            if (p >= m_chunks.size()) {
                throw core::PlanIntegrityError("chunk " + std::to_string(i) +
                                               " references missing predecessor " + std::to_string(p));
            }
            m_dependents[p].push_back(i);
        }
    }
}

Plan Plan::generate(const PlanStrategy& strategy,
                    const domain::Domain& domain,
                    const Coord& radius,
                    std::size_t stepCount) {
    LOG_INFO("Generating '{}' plan: {} steps over {}", strategy.name(), stepCount, domain.describe());

    if (radius.size() != domain.rank()) {
        throw core::InvalidPlanConfig("stencil rank " + std::to_string(radius.size()) +
                                      " does not match domain rank " + std::to_string(domain.rank()));
    }
    for (auto r : radius) {
        if (r < 0) {
            throw core::InvalidPlanConfig("stencil radius must be non-negative");
        }
    }

    Plan plan(domain, radius, stepCount, strategy.name(), strategy.decompose(domain, radius, stepCount));

    try {
        plan.validate();
    } catch (const core::PlanIntegrityError& e) {
        LOG_ERROR("Strategy '{}' produced a malformed plan: {}", strategy.name(), e.what());
        throw;
    }

    LOG_INFO("Plan generated: {} chunks, max parallel width {}", plan.chunkCount(), plan.maxParallelWidth());
    return plan;
}

Plan Plan::fromChunks(const domain::Domain& domain,
                      const Coord& radius,
                      std::size_t stepCount,
                      std::string strategyName,
                      std::vector<Chunk> chunks) {
    return Plan(domain, radius, stepCount, std::move(strategyName), std::move(chunks));
}

std::vector<std::size_t> Plan::topologicalOrder() const {
    // Kahn's algorithm for topological sort
    std::vector<size_t> inDegree(m_chunks.size());
    std::queue<size_t> queue;
    for (size_t i = 0; i < m_chunks.size(); ++i) {
        inDegree[i] = m_chunks[i].predecessors.size();
        if (inDegree[i] == 0) {
            queue.push(i);
        }
    }

    std::vector<size_t> order;
    order.reserve(m_chunks.size());
    while (!queue.empty()) {
        size_t current = queue.front();
        queue.pop();
        order.push_back(current);
        for (size_t dependent : m_dependents[current]) {
            if (--inDegree[dependent] == 0) {
                queue.push(dependent);
            }
        }
    }

    if (order.size() != m_chunks.size()) {
        LOG_ERROR("Circular dependency detected! Only {} of {} chunks schedulable",
                  order.size(), m_chunks.size());
        throw core::PlanIntegrityError("cycle in chunk DAG: only " + std::to_string(order.size()) +
                                       " of " + std::to_string(m_chunks.size()) + " chunks can complete");
    }
    return order;
}

void Plan::checkFeasibility() const {
    topologicalOrder();

    std::vector<bool> stepPresent(m_stepCount, false);

    for (size_t i = 0; i < m_chunks.size(); ++i) {
        const Chunk& c = m_chunks[i];
        if (c.step >= m_stepCount) {
            throw core::PlanIntegrityError("chunk " + std::to_string(i) + " has step " +
                                           std::to_string(c.step) + " beyond step count " +
                                           std::to_string(m_stepCount));
        }
        if (!m_domain.region().containsRegion(c.region)) {
            throw core::PlanIntegrityError("chunk " + std::to_string(i) + " region " +
                                           c.region.toString() + " leaves the domain");
        }
        stepPresent[c.step] = true;
        if (c.step == 0 && !c.predecessors.empty()) {
            throw core::PlanIntegrityError("chunk " + std::to_string(i) +
                                           " at step 0 must read only the initial field");
        }
        for (size_t p : c.predecessors) {
            if (m_chunks[p].step + 1 != c.step) {
                throw core::PlanIntegrityError("chunk " + std::to_string(i) + " (step " +
                                               std::to_string(c.step) + ") depends on chunk " +
                                               std::to_string(p) + " (step " +
                                               std::to_string(m_chunks[p].step) + ")");
            }
        }
    }

    for (size_t s = 0; s < m_stepCount; ++s) {
        if (!stepPresent[s]) {
            throw core::PlanIntegrityError("no chunk computes step " + std::to_string(s));
        }
    }
}

void Plan::validate() const {
    checkFeasibility();
    checkCoverage();
}

void Plan::checkCoverage() const {
    const domain::Region& whole = m_domain.region();
    std::vector<std::vector<size_t>> byStep(m_stepCount);
    for (size_t i = 0; i < m_chunks.size(); ++i) {
        byStep[m_chunks[i].step].push_back(i);
    }

    // Each step must partition the domain: disjoint chunks, no gaps
    std::vector<uint8_t> covered(m_domain.pointCount());
    for (size_t s = 0; s < m_stepCount; ++s) {
        std::fill(covered.begin(), covered.end(), 0);
        size_t count = 0;
        for (size_t i : byStep[s]) {
            const domain::Region& region = m_chunks[i].region;
            region.forEachPoint([&](const Coord& c) {
                uint8_t& mark = covered[whole.linearIndex(c)];
                if (mark != 0) {
                    throw core::PlanIntegrityError("chunk " + std::to_string(i) +
                                                   " overlaps another chunk at step " + std::to_string(s));
                }
                mark = 1;
            });
            count += region.volume();
        }
        if (count != m_domain.pointCount()) {
            throw core::PlanIntegrityError("step " + std::to_string(s) + " covers " + std::to_string(count) +
                                           " of " + std::to_string(m_domain.pointCount()) + " points");
        }
    }

    // Predecessors of one chunk share a step and are therefore disjoint,
    // so summed intersection volumes measure coverage exactly
    for (size_t i = 0; i < m_chunks.size(); ++i) {
        const Chunk& c = m_chunks[i];
        if (c.step == 0) {
            continue;
        }
        for (const auto& box : readFootprint(m_domain, c.region, m_radius)) {
            size_t volume = 0;
            for (size_t p : c.predecessors) {
                if (auto overlap = box.intersection(m_chunks[p].region)) {
                    volume += overlap->volume();
                }
            }
            if (volume != box.volume()) {
                throw core::PlanIntegrityError("chunk " + std::to_string(i) + " reads " + box.toString() +
                                               " which its predecessors do not cover");
            }
        }
    }
}

std::vector<std::size_t> Plan::chunksAtStep(std::size_t step) const {
    std::vector<size_t> result;
    for (size_t i = 0; i < m_chunks.size(); ++i) {
        if (m_chunks[i].step == step) {
            result.push_back(i);
        }
    }
    return result;
}

std::size_t Plan::maxParallelWidth() const {
    std::vector<size_t> perStep(m_stepCount, 0);
    for (const auto& c : m_chunks) {
        if (c.step < m_stepCount) {
            ++perStep[c.step];
        }
    }
    return perStep.empty() ? 0 : *std::max_element(perStep.begin(), perStep.end());
}

std::string Plan::exportDOT() const {
    std::stringstream ss;

    ss << "digraph ChunkDependencies {\n";
    ss << "    rankdir=LR;\n";
    ss << "    node [shape=box, style=rounded];\n\n";

    // Add nodes
    for (size_t i = 0; i < m_chunks.size(); ++i) {
        ss << "    c" << i << " [label=\"t" << m_chunks[i].step << " "
           << m_chunks[i].region.toString() << "\"];\n";
    }

    ss << "\n";

    // Add edges (dependencies)
    for (size_t i = 0; i < m_chunks.size(); ++i) {
        for (size_t p : m_chunks[i].predecessors) {
            ss << "    c" << p << " -> c" << i << ";\n";
        }
    }

    ss << "}\n";

    return ss.str();
}

} // namespace graph
