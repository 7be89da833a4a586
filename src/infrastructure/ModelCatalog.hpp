/**
 * @file ModelCatalog.hpp
 * @brief Known whisper.cpp model identifiers and where their files live.
 */

#pragma once
#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace streamscribe::infrastructure {

/**
 * @class ModelCatalog
 * @brief Validates model identifiers before a session starts.
 */
class ModelCatalog {
public:
    static const std::vector<std::string>& Known() {
        static const std::vector<std::string> models = {
            "tiny.en", "tiny",
            "base.en", "base",
            "small.en", "small",
            "medium.en", "medium",
            "large-v1", "large-v2", "large-v3", "large-v3-turbo"
        };
        return models;
    }

    static bool IsKnown(const std::string& model) {
        const auto& models = Known();
        return std::find(models.begin(), models.end(), model) != models.end();
    }

    /** @brief <root>/models/ggml-<model>.bin */
    static std::filesystem::path ModelPath(const std::filesystem::path& engineRoot, const std::string& model) {
        return engineRoot / "models" / ("ggml-" + model + ".bin");
    }

    /** @brief Space-separated list for usage and error messages. */
    static std::string Describe() {
        std::string out;
        for (const auto& model : Known()) {
            if (!out.empty()) out += " ";
            out += model;
        }
        return out;
    }
};

} // namespace streamscribe::infrastructure
