#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <catch2/catch.hpp>
#include <string>

/**
 * Test Suite: Core Infrastructure
 *
 * Verifies the logging system and the error hierarchy.
 */
TEST_CASE("Logger initialization", "[core][logger]")
{
    LOG_INFO("Logger test message");
    LOG_DEBUG("Debug message");
    LOG_WARN("Warning message");

    REQUIRE(core::Logger::get() != nullptr);
    REQUIRE(core::Logger::get()->name() == "StencilLoom");
}

TEST_CASE("Logger level parsing", "[core][logger]")
{
    REQUIRE(core::Logger::parseLevel("debug") == spdlog::level::debug);
    REQUIRE(core::Logger::parseLevel("warn") == spdlog::level::warn);
    REQUIRE(core::Logger::parseLevel("off") == spdlog::level::off);
    REQUIRE_THROWS_AS(core::Logger::parseLevel("verbose"), std::runtime_error);
}

TEST_CASE("LOG_CHECK throws on failed condition", "[core][logger]")
{
    auto check = [](bool condition) { LOG_CHECK(condition, "expected failure"); };

    REQUIRE_NOTHROW(check(1 + 1 == 2));
    REQUIRE_THROWS_WITH(check(false), Catch::Contains("CHECK FAILED: expected failure"));
}

TEST_CASE("Errors share the StencilError base", "[core][errors]")
{
    REQUIRE_THROWS_AS(throw core::InvalidDomain("x"), core::StencilError);
    REQUIRE_THROWS_AS(throw core::InvalidStencil("x"), core::StencilError);
    REQUIRE_THROWS_AS(throw core::InvalidPlanConfig("x"), core::StencilError);
    REQUIRE_THROWS_AS(throw core::PlanIntegrityError("x"), core::StencilError);
    REQUIRE_THROWS_WITH(throw core::InvalidDomain("bad bounds"), "InvalidDomain: bad bounds");
}

TEST_CASE("EvaluationError identifies the failing chunk", "[core][errors]")
{
    core::EvaluationError error("overflow", 7, 3, {0, 4}, {9, 8});

    REQUIRE(error.chunkIndex() == 7);
    REQUIRE(error.step() == 3);
    REQUIRE(error.regionLo() == std::vector<int64_t>{0, 4});
    REQUIRE(error.regionHi() == std::vector<int64_t>{9, 8});
    REQUIRE(error.cause() == "overflow");
    REQUIRE(std::string(error.what()) == "EvaluationError: chunk 7 (step 3, region [0:9, 4:8]): overflow");
}
