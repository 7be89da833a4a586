/**
 * @file SegmentExtractor.hpp
 * @brief Interface for cutting one window out of the growing capture sink.
 */

#pragma once

#include "domain/Errors.hpp"
#include "domain/SegmentArtifact.hpp"
#include <string>

namespace streamscribe::domain {

/**
 * @struct ExtractionResult
 * @brief Either a fully written artifact or the reason there is none.
 */
struct ExtractionResult {
    bool success = false;
    SegmentArtifact artifact;
    ExtractionError error;
};

/**
 * @class SegmentExtractor
 * @brief Produces a SegmentArtifact for a SegmentWindow.
 *
 * Implementations never return a short or partially written artifact and
 * perform no retries of their own.
 */
class SegmentExtractor {
public:
    virtual ~SegmentExtractor() = default;

    virtual ExtractionResult extract(const SegmentWindow& window) = 0;

    /** @brief Path of the processed-segment scratch file, removed at session end. */
    virtual std::string scratchPath() const = 0;
};

} // namespace streamscribe::domain
