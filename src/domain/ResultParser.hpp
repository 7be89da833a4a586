#pragma once

#include "domain/TranscriptionRecord.hpp"
#include <cstddef>
#include <string>

namespace streamscribe::domain {

/**
 * @brief Normalizes raw engine output into a TranscriptionRecord.
 * Stateless; malformed input produces a ParseError record, never an exception.
 */
class ResultParser {
public:
    /**
     * @brief Parses the primary output channel of one engine run.
     * @param sequenceIndex Index of the segment the output belongs to.
     * @param primaryOutput Engine stdout. Diagnostic output is never passed here.
     * @param mode Structured (one JSON object) or plain text (last non-empty line).
     *
     * In structured mode the whole output is tried as one document first; failing that,
     * the last line holding a JSON object is the result and every other non-empty line
     * is kept in unparsedLines.
     */
    static TranscriptionRecord Parse(std::size_t sequenceIndex, const std::string& primaryOutput, OutputMode mode);

    static TranscriptionRecord ParseStructured(std::size_t sequenceIndex, const std::string& primaryOutput);
    static TranscriptionRecord ParsePlainText(std::size_t sequenceIndex, const std::string& primaryOutput);
};

} // namespace streamscribe::domain
