#ifndef FACEWATCH_CLI_COMMON_H
#define FACEWATCH_CLI_COMMON_H

/**
 * CLI Common Utilities and Includes
 *
 * Provides shared headers and utilities for CLI commands
 */

#include <iostream>
#include <string>
#include <vector>
#include <fstream>
#include <iomanip>

#include "../config.h"
#include "../logger.h"
#include "config_paths.h"

namespace facewatch {
namespace cli {

/**
 * Load configuration from CONFIG_DIR/facewatch.conf
 *
 * A missing file is not an error: every key has a default.
 * Validation problems are printed, the values that parsed are kept.
 *
 * @return Reference to Config singleton with loaded values
 */
inline Config& loadDefaultConfig() {
    Config& config = Config::getInstance();
    std::string config_path = std::string(CONFIG_DIR) + "/facewatch.conf";
    std::ifstream config_file(config_path);
    if (config_file.good() && !config.load(config_path)) {
        for (const auto& error : config.getValidationErrors()) {
            std::cerr << "Config: " << error << std::endl;
        }
    }
    return config;
}

/**
 * Route log output to the terminal at the given level
 */
inline void setupConsoleLogging(bool verbose) {
    auto& logger = Logger::getInstance();
    logger.setConsoleOutput(true);
    logger.setLogLevel(verbose ? LogLevel::DEBUG : LogLevel::WARNING);
}

/**
 * Get the classifiers directory (config value or compiled-in default)
 */
inline std::string getClassifiersDir() {
    return Config::getInstance().getString("recognition", "classifiers_dir").value_or(CLASSIFIERS_DIR);
}

} // namespace cli
} // namespace facewatch

#endif // FACEWATCH_CLI_COMMON_H
