/**
 * @file TranscriptionInvoker.hpp
 * @brief Interface for handing one segment to the external speech-to-text engine.
 */

#pragma once

#include "domain/SegmentArtifact.hpp"
#include "domain/TranscriptionRecord.hpp"
#include <string>

namespace streamscribe::domain {

/**
 * @struct TranscriptionRequest
 * @brief Per-session engine parameters.
 */
struct TranscriptionRequest {
    std::string model;
    std::string language;
    OutputMode outputMode = OutputMode::Structured;
};

/**
 * @struct EngineOutput
 * @brief Both output channels of one engine run plus how it ended.
 */
struct EngineOutput {
    std::string primaryOutput;      ///< stdout: the transcription result.
    std::string diagnosticOutput;   ///< stderr: progress and log lines.
    int exitCode = -1;
    bool launched = false;          ///< False when the engine could not be started at all.
    bool timedOut = false;          ///< The soft deadline elapsed and the run was killed.
    std::string failureReason;      ///< Set when launched is false.

    bool succeeded() const { return launched && !timedOut && exitCode == 0; }
};

/**
 * @class TranscriptionInvoker
 * @brief Abstract interface over the transcription engine.
 */
class TranscriptionInvoker {
public:
    virtual ~TranscriptionInvoker() = default;

    /**
     * @brief Synchronously transcribes one segment.
     *
     * The artifact is consumed: its backing file is gone when the call
     * returns, regardless of the outcome. May block for longer than the
     * segment itself lasts.
     * @param artifact Segment to transcribe.
     * @param request Model, language and output mode.
     * @return Captured channels and exit status. Failures are reported, never retried.
     */
    virtual EngineOutput invoke(SegmentArtifact artifact, const TranscriptionRequest& request) = 0;
};

} // namespace streamscribe::domain
