#pragma once

#include "domain/Domain.hpp"
#include "field/FieldBuffer.hpp"

#include <filesystem>
#include <vector>

namespace io {

/**
 * @brief Loads and saves field values as whitespace-separated text
 *
 * Values are stored in domain order (row-major, last dimension fastest).
 * Lines starting with '#' are comments.
 */
class FieldIO {
public:
    /**
     * Read raw values from disk
     * @param path Text file
     * @return Every value in file order
     * @throws core::InvalidField if the file is missing or holds a non-numeric token
     */
    static std::vector<double> readValues(const std::filesystem::path& path);

    /**
     * Load the initial field for a domain
     * @throws core::InvalidField if the value count does not match the domain
     */
    static field::FieldBuffer<double> load(const std::filesystem::path& path,
                                           const domain::Domain& domain);

    /**
     * Write the interior of a field, one row of the last dimension per line
     * @throws core::InvalidField if the file cannot be written
     */
    static void save(const std::filesystem::path& path, const field::FieldBuffer<double>& buffer);
};

} // namespace io
