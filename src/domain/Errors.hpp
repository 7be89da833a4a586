/**
 * @file Errors.hpp
 * @brief Error taxonomy of a streaming transcription session.
 *
 * Only CaptureStartError is thrown; extraction and invocation failures are
 * returned as values and parse failures are recorded as a record status.
 */

#pragma once
#include "domain/SegmentWindow.hpp"
#include <stdexcept>
#include <string>

namespace streamscribe::domain {

/**
 * @class CaptureStartError
 * @brief The long-running capture process could not be started. Fatal for the session.
 */
class CaptureStartError : public std::runtime_error {
public:
    explicit CaptureStartError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @enum ExtractionFailure
 * @brief Why a window could not be turned into a SegmentArtifact.
 */
enum class ExtractionFailure {
    SinkMissing,      ///< The live capture file does not exist.
    CaptureLag,       ///< The window is not fully captured yet.
    ToolFailed,       ///< The extraction tool could not run or exited non-zero.
    InvalidArtifact   ///< The produced file is short or has the wrong format.
};

std::string ToString(ExtractionFailure failure);

/**
 * @struct ExtractionError
 * @brief Reported by a SegmentExtractor; retry policy belongs to the caller.
 */
struct ExtractionError {
    SegmentWindow window;
    ExtractionFailure failure = ExtractionFailure::ToolFailed;
    std::string cause;
};

/**
 * @struct InvocationError
 * @brief The transcription engine failed, timed out or could not be launched.
 */
struct InvocationError {
    SegmentWindow window;
    std::string cause;
    std::string diagnosticOutput;
};

} // namespace streamscribe::domain
