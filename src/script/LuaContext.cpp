#include "script/LuaContext.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"

#include <sol/sol.hpp>
#include <stdexcept>

namespace script {

namespace {

template <typename V>
std::vector<V> readList(const sol::table& table, const std::string& what) {
    std::vector<V> values;
    for (size_t i = 1; i <= table.size(); ++i) {
        sol::optional<V> v = table[i];
        if (!v) {
            throw core::ConfigError(what + "[" + std::to_string(i) + "] has the wrong type");
        }
        values.push_back(*v);
    }
    return values;
}

sol::table requireTable(const sol::table& parent, const std::string& key) {
    sol::optional<sol::table> t = parent[key];
    if (!t) {
        throw core::ConfigError("run." + key + " must be a table");
    }
    return *t;
}

} // namespace

LuaContext::LuaContext()
    : m_callMutex(std::make_shared<std::mutex>()) {
    LOG_INFO("Initializing Lua context");

    // Open standard libraries
    m_lua.open_libraries(
        sol::lib::base,
        sol::lib::math,
        sol::lib::string,
        sol::lib::table);

    LOG_DEBUG("Lua standard libraries loaded");
}

LuaContext::~LuaContext() {
    LOG_DEBUG("Lua context destroyed");
}

void LuaContext::runScript(const std::filesystem::path& path) {
    LOG_INFO("Running Lua script: {}", path.string());

    if (!std::filesystem::exists(path)) {
        std::string error = "Script file not found: " + path.string();
        LOG_ERROR(error);
        throw core::ConfigError(error);
    }

    sol::protected_function_result result = m_lua.safe_script_file(path.string(), sol::script_pass_on_error);
    if (!result.valid()) {
        sol::error err = result;
        std::string errorMsg = err.what();
        LOG_ERROR("Lua script error: {}", errorMsg);
        throw core::ConfigError(errorMsg);
    }

    LOG_INFO("Script executed successfully");
}

void LuaContext::runCode(const std::string& code) {
    LOG_DEBUG("Running Lua code snippet");

    sol::protected_function_result result = m_lua.safe_script(code, sol::script_pass_on_error);
    if (!result.valid()) {
        sol::error err = result;
        std::string errorMsg = err.what();
        LOG_ERROR("Lua code error: {}", errorMsg);
        throw core::ConfigError(errorMsg);
    }
}

RunConfig LuaContext::loadConfig(const std::filesystem::path& path) {
    runScript(path);
    return readConfig();
}

RunConfig LuaContext::readConfig() {
    sol::optional<sol::table> maybeRun = m_lua["run"];
    if (!maybeRun) {
        throw core::ConfigError("script did not define a global 'run' table");
    }
    sol::table run = *maybeRun;

    RunConfig config;
    readDomain(run, config);
    readStencil(run, config);
    readStrategy(run, config);

    sol::optional<int64_t> steps = run["steps"];
    if (steps) {
        if (*steps < 0) {
            throw core::ConfigError("run.steps must be non-negative");
        }
        config.steps = static_cast<size_t>(*steps);
    }

    sol::optional<int64_t> threads = run["threads"];
    if (threads) {
        if (*threads < 0) {
            throw core::ConfigError("run.threads must be non-negative");
        }
        config.threads = static_cast<size_t>(*threads);
    }

    sol::optional<sol::table> initial = run["initial"];
    if (initial) {
        config.initialValues = readList<double>(*initial, "run.initial");
    }
    config.inputPath = run.get_or<std::string>("input", "");
    config.outputPath = run.get_or<std::string>("output", "");
    config.dotPath = run.get_or<std::string>("dot", "");
    config.logLevel = run.get_or<std::string>("log_level", "info");

    LOG_INFO("Configuration read: rank {}, {} stencil terms, {} steps",
             config.extents.size(), config.terms.size(), config.steps);
    return config;
}

void LuaContext::readDomain(const sol::table& run, RunConfig& config) {
    sol::table dom = requireTable(run, "domain");
    for (size_t i = 1; i <= dom.size(); ++i) {
        sol::optional<sol::table> pair = dom[i];
        if (!pair || pair->size() != 2) {
            throw core::ConfigError("run.domain[" + std::to_string(i) + "] must be {lo, hi}");
        }
        auto bounds = readList<int64_t>(*pair, "run.domain[" + std::to_string(i) + "]");
        config.extents.push_back({bounds[0], bounds[1]});
    }

    sol::table boundaries = requireTable(run, "boundaries");
    for (size_t i = 1; i <= boundaries.size(); ++i) {
        sol::object entry = boundaries[i];
        try {
            if (entry.is<std::string>()) {
                config.boundaries.emplace_back(domain::parseBoundaryKind(entry.as<std::string>()));
            } else if (entry.is<sol::table>()) {
                // {"constant", value}
                sol::table t = entry.as<sol::table>();
                sol::optional<std::string> kind = t[1];
                sol::optional<double> value = t[2];
                if (!kind) {
                    throw core::ConfigError("boundary table needs a kind name");
                }
                config.boundaries.emplace_back(domain::parseBoundaryKind(*kind), value.value_or(0.0));
            } else {
                throw core::ConfigError("boundary must be a name or {name, value}");
            }
        } catch (const std::invalid_argument& e) {
            throw core::ConfigError("run.boundaries[" + std::to_string(i) + "]: " + e.what());
        }
    }
}

void LuaContext::readStencil(const sol::table& run, RunConfig& config) {
    sol::table terms = requireTable(run, "stencil");
    for (size_t i = 1; i <= terms.size(); ++i) {
        const std::string where = "run.stencil[" + std::to_string(i) + "]";
        sol::optional<sol::table> term = terms[i];
        if (!term) {
            throw core::ConfigError(where + " must be a table");
        }
        sol::optional<sol::table> offset = (*term)["offset"];
        if (!offset) {
            throw core::ConfigError(where + ".offset must be a table");
        }

        stencil::Term<double> t{readList<int64_t>(*offset, where + ".offset"), 0.0};
        sol::object coefficient = (*term)["coefficient"];
        if (coefficient.is<double>()) {
            t.coefficient = coefficient.as<double>();
        } else if (coefficient.is<sol::protected_function>()) {
            t.coefficient = wrapFunction(coefficient.as<sol::protected_function>());
        } else {
            throw core::ConfigError(where + ".coefficient must be a number or a function");
        }
        config.terms.push_back(std::move(t));
    }
}

void LuaContext::readStrategy(const sol::table& run, RunConfig& config) {
    config.strategy.kind = graph::parseStrategyKind(run.get_or<std::string>("strategy", "direct"));
    sol::optional<sol::table> tile = run["tile"];
    if (tile) {
        config.strategy.tileExtent = readList<int64_t>(*tile, "run.tile");
    }
    sol::optional<int64_t> height = run["height"];
    if (height) {
        if (*height < 0) {
            throw core::ConfigError("run.height must be non-negative");
        }
        config.strategy.height = static_cast<size_t>(*height);
    }
}

stencil::Coefficient<double> LuaContext::wrapFunction(sol::protected_function fn) {
    auto callMutex = m_callMutex;
    return stencil::Coefficient<double>::function(
        [fn, callMutex](const domain::Coord& position, std::size_t step) -> double {
            std::lock_guard<std::mutex> lock(*callMutex);
            sol::protected_function_result result = fn(sol::as_table(position), step);
            if (!result.valid()) {
                sol::error err = result;
                throw std::runtime_error(std::string("Lua coefficient error: ") + err.what());
            }
            sol::optional<double> value = result;
            if (!value) {
                throw std::runtime_error("Lua coefficient did not return a number");
            }
            return *value;
        });
}

} // namespace script
