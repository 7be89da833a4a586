/**
 * @file StreamOrchestrator.hpp
 * @brief Control-flow spine of a streaming transcription session.
 */

#pragma once

#include "domain/CaptureProcess.hpp"
#include "domain/Errors.hpp"
#include "domain/SegmentClock.hpp"
#include "domain/SegmentExtractor.hpp"
#include "domain/StreamSession.hpp"
#include "domain/TranscriptSink.hpp"
#include "domain/TranscriptionInvoker.hpp"
#include "domain/TranscriptionRecord.hpp"
#include "infrastructure/DiagnosticLog.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace streamscribe::application {

class CaptureSupervisor;

enum class SessionState {
    Starting,
    Buffering,
    Running,
    Stopping,
    Terminated,
    Aborted
};

std::string ToString(SessionState state);

/// Exit status of a session that could not start its capture process.
constexpr int kAbortedExitStatus = 2;

/**
 * @struct SessionOutcome
 * @brief Everything a finished session reports back to its caller.
 */
struct SessionOutcome {
    SessionState finalState = SessionState::Starting;
    int exitStatus = 0;
    std::vector<domain::TranscriptionRecord> records;   ///< In emission order.
    std::size_t ticks = 0;                              ///< Windows attempted.
    std::vector<SessionState> history;                  ///< Every state entered, in order.
    bool stopRequested = false;
    std::optional<domain::ExtractionError> extractionError;
    std::optional<domain::InvocationError> invocationError;
    std::string abortReason;
};

/**
 * @class StreamOrchestrator
 * @brief Drives STARTING -> BUFFERING -> RUNNING -> STOPPING -> TERMINATED.
 *
 * One segment is in flight at a time: extraction and transcription of
 * window i complete before window i+1 is requested, and records are
 * emitted in sequence order as soon as they are parsed. The capture
 * process is terminated and the scratch files removed on every exit path.
 */
class StreamOrchestrator {
public:
    StreamOrchestrator(domain::StreamSession session,
                       std::shared_ptr<domain::CaptureProcess> capture,
                       std::shared_ptr<domain::SegmentExtractor> extractor,
                       std::shared_ptr<domain::TranscriptionInvoker> invoker,
                       std::shared_ptr<domain::TranscriptSink> sink,
                       infrastructure::DiagnosticLog& log);

    /** @brief Runs the session to completion. Not re-entrant. */
    SessionOutcome run();

    /**
     * @brief Asks the session to stop at the next tick boundary.
     * Only stores a flag; safe to call from a signal handler or another thread.
     */
    void requestStop() { m_stopRequested.store(true); }

    SessionState state() const { return m_state.load(); }

private:
    void enter(SessionState state, SessionOutcome& outcome);

    /** @brief Sleeps until the deadline in short slices. False if a stop was requested. */
    bool waitUntil(std::chrono::steady_clock::time_point deadline) const;

    domain::ExtractionResult extractWithRetry(const domain::SegmentWindow& window, CaptureSupervisor& supervisor);

    domain::TranscriptionRecord toInvocationError(const domain::SegmentWindow& window,
                                                  const domain::EngineOutput& output,
                                                  SessionOutcome& outcome);

    domain::StreamSession m_session;
    domain::SegmentClock m_clock;
    std::shared_ptr<domain::CaptureProcess> m_capture;
    std::shared_ptr<domain::SegmentExtractor> m_extractor;
    std::shared_ptr<domain::TranscriptionInvoker> m_invoker;
    std::shared_ptr<domain::TranscriptSink> m_sink;
    infrastructure::DiagnosticLog& m_log;

    std::atomic<bool> m_stopRequested{false};
    std::atomic<SessionState> m_state{SessionState::Starting};
};

} // namespace streamscribe::application
