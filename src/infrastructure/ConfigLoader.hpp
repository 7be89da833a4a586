/**
 * @file ConfigLoader.hpp
 * @brief Loads stream settings from a JSON file.
 *
 * Keys mirror the long command-line options (step_s, model, language,
 * max_duration, ...). Keys that are absent keep their current value.
 */

#pragma once

#include "infrastructure/StreamConfig.hpp"
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace streamscribe::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads a settings file over an existing configuration.
     * @param path JSON file.
     * @param config Updated in place.
     * @param error Populated on failure.
     * @return False if the file is unreadable, malformed or holds values of the wrong type.
     */
    static bool LoadStreamConfig(const std::string& path, StreamConfig& config, std::string& error);

    /** @brief Applies the recognized keys of an already-parsed object. */
    static bool ApplyJson(const nlohmann::json& j, StreamConfig& config, std::string& error);

    /** @brief Serializes a configuration with the same keys LoadStreamConfig reads. */
    static nlohmann::json ToJson(const StreamConfig& config);
};

} // namespace streamscribe::infrastructure
