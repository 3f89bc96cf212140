#include "io/FieldIO.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

namespace io {

std::vector<double> FieldIO::readValues(const std::filesystem::path& path) {
    LOG_INFO("Loading field values from: {}", path.string());

    if (!std::filesystem::exists(path)) {
        std::string msg = "field file not found: " + path.string();
        LOG_ERROR(msg);
        throw core::InvalidField(msg);
    }

    std::ifstream in(path);
    if (!in) {
        throw core::InvalidField("cannot open " + path.string());
    }

    std::vector<double> values;
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        std::istringstream tokens(line);
        std::string token;
        while (tokens >> token) {
            size_t consumed = 0;
            double value = 0.0;
            try {
                value = std::stod(token, &consumed);
            } catch (const std::exception&) {
                consumed = 0;
            }
            if (consumed != token.size()) {
                std::string msg = path.string() + ":" + std::to_string(lineNumber) +
                                  ": not a number: '" + token + "'";
                LOG_ERROR(msg);
                throw core::InvalidField(msg);
            }
            values.push_back(value);
        }
    }

    LOG_DEBUG("Read {} values", values.size());
    return values;
}

field::FieldBuffer<double> FieldIO::load(const std::filesystem::path& path,
                                         const domain::Domain& domain) {
    return field::FieldBuffer<double>::fromValues(domain, readValues(path));
}

void FieldIO::save(const std::filesystem::path& path, const field::FieldBuffer<double>& buffer) {
    LOG_INFO("Saving field to: {}", path.string());

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream out(path);
    if (!out) {
        std::string msg = "cannot write " + path.string();
        LOG_ERROR(msg);
        throw core::InvalidField(msg);
    }

    const auto& dom = buffer.getDomain();
    const auto rowLength = static_cast<size_t>(dom.extent(dom.rank() - 1));

    out << "# " << dom.region().toString() << "\n";
    out << std::setprecision(std::numeric_limits<double>::max_digits10);

    const auto values = buffer.toValues();
    for (size_t i = 0; i < values.size(); ++i) {
        out << values[i] << ((i + 1) % rowLength == 0 ? '\n' : ' ');
    }

    if (!out) {
        throw core::InvalidField("write failed: " + path.string());
    }
}

} // namespace io
