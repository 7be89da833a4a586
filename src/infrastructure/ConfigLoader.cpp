/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace streamscribe::infrastructure {

StreamConfig DefaultStreamConfig() {
    StreamConfig config;
    config.engine.engineRoot = PathUtils::GetDefaultEngineRoot();
    config.scratchDir = PathUtils::GetScratchDir();
    return config;
}

bool ConfigLoader::LoadStreamConfig(const std::string& path, StreamConfig& config, std::string& error) {
    if (!std::filesystem::exists(path)) {
        error = "config file not found: " + path;
        return false;
    }

    nlohmann::json j;
    try {
        std::ifstream f(path);
        f >> j;
    } catch (const std::exception& e) {
        error = "error reading " + path + ": " + e.what();
        return false;
    }

    if (!j.is_object()) {
        error = path + ": expected a JSON object";
        return false;
    }
    return ApplyJson(j, config, error);
}

bool ConfigLoader::ApplyJson(const nlohmann::json& j, StreamConfig& config, std::string& error) {
    try {
        auto& session = config.session;
        if (j.contains("stream_url")) session.sourceLocator = j["stream_url"].get<std::string>();
        if (j.contains("step_s")) session.step = std::chrono::seconds(j["step_s"].get<int>());
        if (j.contains("max_duration")) session.maxDuration = std::chrono::seconds(j["max_duration"].get<int>());
        if (j.contains("model")) session.model = j["model"].get<std::string>();
        if (j.contains("language")) session.language = j["language"].get<std::string>();
        if (j.contains("verbosity")) session.verbosity = j["verbosity"].get<int>();
        if (j.contains("print_openai")) {
            const bool structured = j["print_openai"].is_boolean() ? j["print_openai"].get<bool>()
                                                                   : j["print_openai"].get<int>() != 0;
            session.outputMode = structured ? domain::OutputMode::Structured : domain::OutputMode::PlainText;
        }
        if (j.contains("extraction_retries")) session.extractionRetries = j["extraction_retries"].get<int>();
        if (j.contains("retry_backoff_ms")) session.retryBackoff = std::chrono::milliseconds(j["retry_backoff_ms"].get<int>());

        if (j.contains("whispercpp_root_path")) config.engine.engineRoot = j["whispercpp_root_path"].get<std::string>();
        if (j.contains("threads")) config.engine.threads = j["threads"].get<int>();
        if (j.contains("engine_timeout_s")) config.engine.timeout = std::chrono::seconds(j["engine_timeout_s"].get<int>());
        if (j.contains("scratch_dir")) config.scratchDir = j["scratch_dir"].get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        error = std::string("invalid configuration value: ") + e.what();
        return false;
    }
    return true;
}

nlohmann::json ConfigLoader::ToJson(const StreamConfig& config) {
    const auto& session = config.session;
    return {
        {"stream_url", session.sourceLocator},
        {"step_s", std::chrono::duration_cast<std::chrono::seconds>(session.step).count()},
        {"max_duration", std::chrono::duration_cast<std::chrono::seconds>(session.maxDuration).count()},
        {"model", session.model},
        {"language", session.language},
        {"verbosity", session.verbosity},
        {"print_openai", session.outputMode == domain::OutputMode::Structured ? 1 : 0},
        {"extraction_retries", session.extractionRetries},
        {"retry_backoff_ms", session.retryBackoff.count()},
        {"whispercpp_root_path", config.engine.engineRoot.string()},
        {"threads", config.engine.threads},
        {"engine_timeout_s", std::chrono::duration_cast<std::chrono::seconds>(config.engine.timeout).count()},
        {"scratch_dir", config.scratchDir.string()}
    };
}

} // namespace streamscribe::infrastructure
