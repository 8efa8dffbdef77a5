/**
 * @file ChronoLensApp.hpp
 * @brief Command-line front end for the selection engine.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "application/SelectionEngine.hpp"

namespace chronolens::app {

/**
 * @class ChronoLensApp
 * @brief Parses arguments, wires the engine to its adapters and runs one command.
 */
class ChronoLensApp {
public:
    explicit ChronoLensApp(std::vector<std::string> args);

    /**
     * @brief Runs the requested command.
     * @return Process exit code (0 success, 1 usage or configuration error, 2 no image selected).
     */
    int Run();

    static void PrintUsage();

private:
    /**
     * @brief Loads configuration and builds the composition root.
     * @return True if the engine is ready.
     */
    bool Init();

    int RunSelect(const std::vector<std::string>& params);
    int RunEngagement(const std::vector<std::string>& params);
    int RunStats();
    int RunEvict();
    int RunClearCache();

    std::vector<std::string> m_args;
    std::string m_configPath;
    std::string m_command;
    std::vector<std::string> m_params;
    std::unique_ptr<application::SelectionEngine> m_engine;
};

} // namespace chronolens::app
