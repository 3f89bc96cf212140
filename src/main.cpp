// src/main.cpp
// Command-line driver for StencilLoom

#include "script/LuaContext.hpp"
#include "script/SimulationEngine.hpp"
#include "core/Logger.hpp"

/*
  StencilLoom - Plan compiler and parallel executor for
  non-homogeneous linear stencils
*/

#include <filesystem>
#include <iostream>
#include <utility>

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            std::cerr << "Usage: " << argv[0] << " <config.lua>" << std::endl;
            std::cerr << "Example: " << argv[0] << " examples/heat_1d.lua" << std::endl;
            return 1;
        }

        std::string scriptPath = argv[1];

        if (!std::filesystem::exists(scriptPath)) {
            std::cerr << "Error: Script file not found: " << scriptPath << std::endl;
            return 1;
        }

        std::cout << "StencilLoom - Non-homogeneous Linear Stencil Engine\n";
        std::cout << "===================================================\n\n";
        std::cout << "Loading configuration: " << scriptPath << "\n\n";

        // The Lua context owns coefficient functions, so it outlives the engine
        script::LuaContext lua;
        script::RunConfig config = lua.loadConfig(scriptPath);
        core::Logger::setLevel(core::Logger::parseLevel(config.logLevel));

        script::SimulationEngine engine(std::move(config));
        auto result = engine.run();

        const auto& stats = engine.lastRunStats();
        std::cout << "\nRun complete: " << stats.chunksExecuted << " chunks, "
                  << stats.pointsEvaluated << " point updates on "
                  << stats.workerCount << " workers in " << stats.seconds << " s\n";
        if (!engine.getConfig().outputPath.empty()) {
            std::cout << "Result written to " << engine.getConfig().outputPath << "\n";
        }

        core::Logger::shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}
