/**
 * @file TranscriptionRecord.hpp
 * @brief Canonical, immutable result for one attempted segment.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace streamscribe::domain {

/**
 * @enum OutputMode
 * @brief Shape of the engine output and of what the session prints.
 */
enum class OutputMode {
    Structured,   ///< One JSON object per segment.
    PlainText     ///< Log lines followed by one authoritative text line.
};

/**
 * @enum RecordStatus
 */
enum class RecordStatus {
    Ok,
    ParseError,
    InvocationError
};

std::string ToString(RecordStatus status);

/**
 * @struct TranscriptionRecord
 * @brief Result appended to the session's output sequence.
 */
struct TranscriptionRecord {
    std::size_t sequenceIndex = 0;                 ///< Back-reference to the SegmentWindow.
    RecordStatus status = RecordStatus::Ok;
    std::string text;                              ///< Transcribed text (empty on failure).
    std::optional<nlohmann::json> structured;      ///< Engine JSON object in structured mode.
    std::string rawOutput;                         ///< Primary channel as received; kept for diagnostics.
    std::string error;                             ///< Failure description when status != Ok.
    std::vector<std::string> unparsedLines;        ///< Structured mode: primary lines that were not the result object.
};

} // namespace streamscribe::domain
