#include "core/Errors.hpp"

#include <sstream>
#include <utility>

namespace core {

namespace {

std::string describeChunk(const std::string& message,
                          std::size_t chunkIndex,
                          std::size_t step,
                          const std::vector<int64_t>& lo,
                          const std::vector<int64_t>& hi) {
    std::ostringstream ss;
    ss << "EvaluationError: chunk " << chunkIndex << " (step " << step << ", region [";
    for (size_t d = 0; d < lo.size(); ++d) {
        if (d > 0) {
            ss << ", ";
        }
        ss << lo[d] << ":" << hi[d];
    }
    ss << "]): " << message;
    return ss.str();
}

} // namespace

EvaluationError::EvaluationError(const std::string& message,
                                 std::size_t chunkIndex,
                                 std::size_t step,
                                 std::vector<int64_t> regionLo,
                                 std::vector<int64_t> regionHi)
    : StencilError(describeChunk(message, chunkIndex, step, regionLo, regionHi)),
      m_cause(message),
      m_chunkIndex(chunkIndex),
      m_step(step),
      m_regionLo(std::move(regionLo)),
      m_regionHi(std::move(regionHi)) {}

} // namespace core
