/**
 * @file StreamSession.hpp
 * @brief Parameters of one end-to-end transcription run.
 */

#pragma once
#include "domain/TranscriptionRecord.hpp"
#include <chrono>
#include <string>

namespace streamscribe::domain {

/**
 * @struct StreamSession
 * @brief Fixed at session start and owned by the orchestrator for its lifetime.
 */
struct StreamSession {
    std::string sourceLocator;                        ///< Opaque stream URL.
    std::chrono::milliseconds step{15000};            ///< Segment duration and tick cadence.
    std::chrono::milliseconds maxDuration{60000};     ///< 0 = unbounded.
    std::string model = "small";
    std::string language = "ru";
    OutputMode outputMode = OutputMode::Structured;
    int verbosity = 0;

    int extractionRetries = 5;                        ///< Extra attempts per window; 0 = stop on first failure.
    std::chrono::milliseconds retryBackoff{500};      ///< First retry delay, doubled per attempt, capped at one step.
};

} // namespace streamscribe::domain
