// tools/create_test_field.cpp
// Writes a Gaussian initial field for StencilLoom runs

#include "domain/Domain.hpp"
#include "field/FieldBuffer.hpp"
#include "io/FieldIO.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    if (argc < 3 || argc > 5) {
        std::cerr << "Usage: " << argv[0] << " <output.txt> <n0> [n1 [n2]]" << std::endl;
        return 1;
    }

    try {
        std::vector<domain::Extent> extents;
        std::vector<domain::BoundaryKind> boundaries;
        for (int i = 2; i < argc; ++i) {
            const int64_t n = std::stoll(argv[i]);
            extents.push_back({0, n - 1});
            boundaries.push_back(domain::BoundaryKind::Periodic);
        }
        domain::Domain dom(extents, boundaries);

        std::cout << "Creating test field over " << dom.region().toString() << "..." << std::endl;

        // Spike in the middle, width a 25th of each extent
        field::FieldBuffer<double> buffer(dom, domain::Coord(dom.rank(), 0));
        buffer.setValues([&](const domain::Coord& c) {
            double exponent = 0.0;
            for (size_t d = 0; d < dom.rank(); ++d) {
                const double n = static_cast<double>(dom.extent(d));
                const double sigma = n / 25.0;
                const double x = static_cast<double>(c[d]) - n / 2.0;
                exponent -= x * x / (2.0 * sigma * sigma);
            }
            return std::exp(exponent);
        });

        io::FieldIO::save(argv[1], buffer);

        std::cout << "Created " << argv[1] << " (" << dom.pointCount() << " values)" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
