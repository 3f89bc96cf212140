#include "StencilFixture.hpp"
#include "core/Errors.hpp"
#include "io/FieldIO.hpp"
#include "script/LuaContext.hpp"
#include "script/SimulationEngine.hpp"

#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

/**
 * Test Suite: Lua configuration and SimulationEngine
 *
 * Verifies that scripted runs reach the core with the same semantics as
 * runs built in C++.
 */
TEST_CASE("Lua context executes code", "[script][lua]")
{
    script::LuaContext lua;

    lua.runCode("x = 6 * 7");
    REQUIRE(lua.getLuaState()["x"].get<int>() == 42);

    REQUIRE_THROWS_AS(lua.runCode("this is not lua"), core::ConfigError);
    REQUIRE_THROWS_AS(lua.runScript("no_such_script.lua"), core::ConfigError);
}

TEST_CASE("Run table is read into a configuration", "[script][config]")
{
    script::LuaContext lua;
    lua.runCode(R"(
        run = {
            domain = { {0, 9}, {-2, 2} },
            boundaries = { "periodic", {"constant", 1.5} },
            stencil = {
                { offset = {0, 0}, coefficient = 0.5 },
                { offset = {1, 0}, coefficient = function(pos, step) return pos[1] + step end },
            },
            strategy = "spatial_tiled",
            tile = { 5, 5 },
            steps = 3,
            threads = 2,
            output = "out.txt",
            log_level = "warn",
        }
    )");

    auto config = lua.readConfig();

    REQUIRE(config.extents.size() == 2);
    REQUIRE(config.extents[1].lo == -2);
    REQUIRE(config.boundaries[0].kind == domain::BoundaryKind::Periodic);
    REQUIRE(config.boundaries[1].kind == domain::BoundaryKind::Constant);
    REQUIRE(config.boundaries[1].value == 1.5);
    REQUIRE(config.terms.size() == 2);
    REQUIRE(config.terms[0].coefficient.isConstant());
    REQUIRE_FALSE(config.terms[1].coefficient.isConstant());
    REQUIRE(config.terms[1].coefficient.at({4, 0}, 2) == Approx(6.0));
    REQUIRE(config.strategy.kind == graph::StrategyKind::SpatialTiled);
    REQUIRE(config.strategy.tileExtent == std::vector<int64_t>{5, 5});
    REQUIRE(config.steps == 3);
    REQUIRE(config.threads == 2);
    REQUIRE(config.outputPath == "out.txt");
    REQUIRE(config.logLevel == "warn");
}

TEST_CASE("Trapezoid strategy is configurable from Lua", "[script][config]")
{
    script::LuaContext lua;
    lua.runCode(R"(
        run = {
            domain = { {0, 15} },
            boundaries = { "edge" },
            stencil = {
                { offset = {-1}, coefficient = 0.25 },
                { offset = {0},  coefficient = 0.5 },
                { offset = {1},  coefficient = 0.25 },
            },
            strategy = "trapezoid",
            height = 3,
            steps = 5,
            initial = { 0, 0, 0, 0, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 0 },
        }
    )");

    auto config = lua.readConfig();
    REQUIRE(config.strategy.kind == graph::StrategyKind::Trapezoid);
    REQUIRE(config.strategy.height == 3);

    script::SimulationEngine engine(config);
    auto result = engine.run();
    REQUIRE(engine.plan().strategyName() == "trapezoid");

    auto dom = fixture::line(0, 15, domain::BoundaryKind::EdgeClamp);
    fixture::requireClose(result.toValues(),
                          fixture::runDirect(dom, fixture::threePoint(0.25, 0.5, 0.25), 5, config.initialValues));
}

TEST_CASE("Malformed run tables are rejected", "[script][config]")
{
    script::LuaContext lua;

    SECTION("missing run table")
    {
        REQUIRE_THROWS_AS(lua.readConfig(), core::ConfigError);
    }

    SECTION("unknown boundary")
    {
        lua.runCode(R"(run = { domain = {{0, 4}}, boundaries = {"reflect"},
                               stencil = {{offset = {0}, coefficient = 1}} })");
        REQUIRE_THROWS_AS(lua.readConfig(), core::ConfigError);
    }

    SECTION("coefficient of the wrong type")
    {
        lua.runCode(R"(run = { domain = {{0, 4}}, boundaries = {"zero"},
                               stencil = {{offset = {0}, coefficient = "half"}} })");
        REQUIRE_THROWS_AS(lua.readConfig(), core::ConfigError);
    }

    SECTION("negative trapezoid height")
    {
        lua.runCode(R"(run = { domain = {{0, 4}}, boundaries = {"zero"},
                               stencil = {{offset = {0}, coefficient = 1}},
                               strategy = "trapezoid", height = -2 })");
        REQUIRE_THROWS_AS(lua.readConfig(), core::ConfigError);
    }

    SECTION("negative step count")
    {
        lua.runCode(R"(run = { domain = {{0, 4}}, boundaries = {"zero"},
                               stencil = {{offset = {0}, coefficient = 1}}, steps = -1 })");
        REQUIRE_THROWS_AS(lua.readConfig(), core::ConfigError);
    }
}

TEST_CASE("Scripted periodic diffusion", "[script][engine]")
{
    script::LuaContext lua;
    lua.runCode(R"(
        local function quarter(pos, step) return 0.25 end
        run = {
            domain = { {0, 4} },
            boundaries = { "periodic" },
            stencil = {
                { offset = {-1}, coefficient = quarter },
                { offset = {0},  coefficient = 0.5 },
                { offset = {1},  coefficient = quarter },
            },
            strategy = "spatial_tiled",
            tile = { 2 },
            steps = 1,
            threads = 4,
            initial = { 1, 0, 0, 0, 0 },
        }
    )");

    script::SimulationEngine engine(lua.readConfig());
    auto result = engine.run();

    fixture::requireClose(result.toValues(), {0.5, 0.25, 0, 0, 0.25});
    REQUIRE(engine.plan().chunkCount() == 3);
    REQUIRE(engine.lastRunStats().chunksExecuted == 3);
}

TEST_CASE("Engine writes output and chunk graph", "[script][engine][io]")
{
    auto dir = std::filesystem::temp_directory_path() / "stencilloom_script_tests";
    std::filesystem::create_directories(dir);
    auto input = dir / "initial.txt";
    auto output = dir / "final.txt";
    auto dot = dir / "plan.dot";
    {
        std::ofstream out(input);
        out << "# 2 x 3\n0 0 0\n0 1 0\n";
    }

    script::RunConfig config;
    config.extents = {{0, 1}, {0, 2}};
    config.boundaries = {domain::Boundary(domain::BoundaryKind::ZeroClamp),
                         domain::Boundary(domain::BoundaryKind::ZeroClamp)};
    config.terms = {{{0, -1}, 0.5}, {{0, 1}, 0.5}};
    config.steps = 1;
    config.inputPath = input.string();
    config.outputPath = output.string();
    config.dotPath = dot.string();

    script::SimulationEngine engine(config);
    engine.run();

    auto saved = io::FieldIO::readValues(output);
    REQUIRE(saved == std::vector<double>{0, 0, 0, 0.5, 0, 0.5});

    std::ifstream dotFile(dot);
    std::stringstream contents;
    contents << dotFile.rdbuf();
    REQUIRE(contents.str() == engine.exportPlanDOT());
}

TEST_CASE("Engine needs an initial field", "[script][engine]")
{
    script::RunConfig config;
    config.extents = {{0, 3}};
    config.boundaries = {domain::Boundary(domain::BoundaryKind::Periodic)};
    config.terms = {{{0}, 1.0}};

    script::SimulationEngine engine(config);
    REQUIRE_THROWS_AS(engine.run(), core::ConfigError);
}

TEST_CASE("Invalid configurations surface core errors", "[script][engine]")
{
    script::RunConfig config;
    config.extents = {{0, 3}};
    config.boundaries = {domain::Boundary(domain::BoundaryKind::Periodic)};
    config.terms = {{{0}, 1.0}};

    SECTION("tile of zero")
    {
        config.strategy = {graph::StrategyKind::SpatialTiled, {0}};
        REQUIRE_THROWS_AS(script::SimulationEngine(config), core::InvalidPlanConfig);
    }

    SECTION("inverted bounds")
    {
        config.extents = {{3, 0}};
        REQUIRE_THROWS_AS(script::SimulationEngine(config), core::InvalidDomain);
    }
}

TEST_CASE("Lua coefficient errors abort the run", "[script][engine][error]")
{
    script::LuaContext lua;
    lua.runCode(R"(
        run = {
            domain = { {0, 7} },
            boundaries = { "edge" },
            stencil = {
                { offset = {0}, coefficient = function(pos, step)
                    if pos[1] == 5 then error("bad coefficient") end
                    return 1.0
                end },
            },
            initial = { 1, 2, 3, 4, 5, 6, 7, 8 },
        }
    )");

    script::SimulationEngine engine(lua.readConfig());
    REQUIRE_THROWS_AS(engine.run(), core::EvaluationError);
}
