/**
 * @file ConsoleTranscriptSink.hpp
 * @brief Writes transcription records to the primary output stream.
 */

#pragma once

#include "domain/TranscriptSink.hpp"
#include "domain/TranscriptionRecord.hpp"
#include <ostream>

namespace streamscribe::infrastructure {

/**
 * @class ConsoleTranscriptSink
 * @brief One pretty-printed JSON object or one text line per record, flushed immediately.
 *
 * invocation_error records are not written; they only appear on the diagnostic stream.
 */
class ConsoleTranscriptSink : public domain::TranscriptSink {
public:
    ConsoleTranscriptSink(std::ostream& out, domain::OutputMode mode);

    void emit(const domain::TranscriptionRecord& record) override;

    /** @brief Number of records actually written. */
    std::size_t written() const { return m_written; }

private:
    void emitStructured(const domain::TranscriptionRecord& record);
    void emitPlainText(const domain::TranscriptionRecord& record);

    std::ostream& m_out;
    domain::OutputMode m_mode;
    std::size_t m_written = 0;
};

} // namespace streamscribe::infrastructure
