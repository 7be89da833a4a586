#include "infrastructure/ConsoleTranscriptSink.hpp"

namespace streamscribe::infrastructure {

ConsoleTranscriptSink::ConsoleTranscriptSink(std::ostream& out, domain::OutputMode mode)
    : m_out(out), m_mode(mode) {}

void ConsoleTranscriptSink::emit(const domain::TranscriptionRecord& record) {
    if (record.status == domain::RecordStatus::InvocationError) {
        return;
    }

    if (m_mode == domain::OutputMode::Structured) {
        emitStructured(record);
    } else {
        emitPlainText(record);
    }
    m_out.flush();
    ++m_written;
}

void ConsoleTranscriptSink::emitStructured(const domain::TranscriptionRecord& record) {
    nlohmann::json j;
    if (record.status == domain::RecordStatus::Ok && record.structured) {
        j = *record.structured;
    } else if (record.status == domain::RecordStatus::Ok) {
        j = {{"index", record.sequenceIndex}, {"text", record.text}};
    } else {
        j = {
            {"index", record.sequenceIndex},
            {"status", domain::ToString(record.status)},
            {"error", record.error},
            {"raw", record.rawOutput}
        };
    }
    // Engine text may contain broken UTF-8 at segment cuts.
    m_out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

void ConsoleTranscriptSink::emitPlainText(const domain::TranscriptionRecord& record) {
    if (record.status == domain::RecordStatus::Ok) {
        m_out << record.text << "\n";
        return;
    }
    m_out << "[" << domain::ToString(record.status) << "] " << record.sequenceIndex;
    if (!record.error.empty()) {
        m_out << " " << record.error;
    }
    m_out << "\n";
}

} // namespace streamscribe::infrastructure
