/**
 * @file TranscriptSink.hpp
 * @brief Destination of transcription records as they are produced.
 */

#pragma once

#include "domain/TranscriptionRecord.hpp"

namespace streamscribe::domain {

class TranscriptSink {
public:
    virtual ~TranscriptSink() = default;

    /** @brief Called once per record, in sequence order, as soon as it exists. */
    virtual void emit(const TranscriptionRecord& record) = 0;
};

} // namespace streamscribe::domain
