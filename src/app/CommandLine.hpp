/**
 * @file CommandLine.hpp
 * @brief Command-line parsing for the streamscribe executable.
 */

#pragma once

#include "infrastructure/StreamConfig.hpp"
#include <string>

namespace streamscribe::app {

/**
 * @struct CommandLineOptions
 * @brief Parsed invocation: the assembled configuration plus one-shot actions.
 */
struct CommandLineOptions {
    infrastructure::StreamConfig config;
    std::string configPath;     ///< Value of --config, if any.
    bool showHelp = false;
    bool showVersion = false;
    bool listModels = false;
};

/**
 * @brief Parses argv over the built-in defaults and the optional --config file.
 *
 * Precedence is defaults < config file < flags. Both "--name value" and
 * "--name=value" are accepted.
 * @param defaults Starting configuration, normally DefaultStreamConfig().
 * @param error Populated on failure.
 * @return False on unknown options, bad values or a failed validation.
 */
bool ParseCommandLine(int argc, const char* const* argv,
                      const infrastructure::StreamConfig& defaults,
                      CommandLineOptions& options, std::string& error);

/** @brief Checks ranges and the model identifier of an assembled configuration. */
bool ValidateStreamConfig(const infrastructure::StreamConfig& config, std::string& error);

std::string UsageText(const std::string& program);

} // namespace streamscribe::app
