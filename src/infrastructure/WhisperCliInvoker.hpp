#pragma once

#include "domain/TranscriptionInvoker.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace streamscribe::infrastructure {

/**
 * @brief Engine settings fixed for the whole session.
 */
struct EngineConfig {
    std::filesystem::path engineRoot;           ///< whisper.cpp checkout with build/bin and models/.
    int threads = 8;
    std::chrono::milliseconds timeout{0};       ///< Soft deadline per segment; 0 = unbounded.
};

/**
 * @class WhisperCliInvoker
 * @brief Runs whisper-cli on one segment file and captures its output.
 */
class WhisperCliInvoker : public domain::TranscriptionInvoker {
public:
    explicit WhisperCliInvoker(EngineConfig config);
    ~WhisperCliInvoker() override = default;

    domain::EngineOutput invoke(domain::SegmentArtifact artifact, const domain::TranscriptionRequest& request) override;

    std::vector<std::string> buildCommand(const std::string& segmentPath, const domain::TranscriptionRequest& request) const;

private:
    EngineConfig m_config;
};

} // namespace streamscribe::infrastructure
