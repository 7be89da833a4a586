/**
 * @file StreamConfig.hpp
 * @brief Complete startup configuration, assembled once and passed down.
 */

#pragma once

#include "domain/StreamSession.hpp"
#include "infrastructure/WhisperCliInvoker.hpp"
#include <filesystem>

namespace streamscribe::infrastructure {

struct StreamConfig {
    domain::StreamSession session;
    EngineConfig engine;
    std::filesystem::path scratchDir;
};

/** @brief Defaults: $HOME/whisper.cpp engine root and the system temp directory. */
StreamConfig DefaultStreamConfig();

} // namespace streamscribe::infrastructure
