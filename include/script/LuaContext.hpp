#pragma once

#include "script/RunConfig.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <sol/sol.hpp>

namespace script {

/**
 * @brief Lua configuration runtime
 *
 * Evaluates a configuration script and reads its global `run` table into a
 * RunConfig. Coefficient functions defined in Lua stay bound to this state,
 * so the context must outlive every stencil built from its configuration.
 */
class LuaContext {
public:
    /**
     * Initialize Lua context with standard libraries
     */
    LuaContext();

    /**
     * Cleanup Lua state
     */
    ~LuaContext();

    /**
     * Execute a Lua script file
     * @param path Path to .lua script
     * @throws core::ConfigError on missing files or script errors
     */
    void runScript(const std::filesystem::path& path);

    /**
     * Execute Lua code directly
     * @param code Lua source code
     * @throws core::ConfigError on execution errors
     */
    void runCode(const std::string& code);

    /**
     * Convert the global `run` table into a RunConfig
     * @throws core::ConfigError if the table is missing or malformed
     */
    RunConfig readConfig();

    /**
     * runScript() followed by readConfig()
     */
    RunConfig loadConfig(const std::filesystem::path& path);

    /**
     * Get the underlying Lua state (for advanced usage)
     */
    sol::state& getLuaState() { return m_lua; }

private:
    sol::state m_lua;

    // Lua states are single-threaded; coefficient calls from workers take this lock
    std::shared_ptr<std::mutex> m_callMutex;

    void readDomain(const sol::table& run, RunConfig& config);
    void readStencil(const sol::table& run, RunConfig& config);
    void readStrategy(const sol::table& run, RunConfig& config);

    stencil::Coefficient<double> wrapFunction(sol::protected_function fn);
};

} // namespace script
