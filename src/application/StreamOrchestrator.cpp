/**
 * @file StreamOrchestrator.cpp
 * @brief Implementation of the session state machine.
 */

#include "application/StreamOrchestrator.hpp"
#include "application/CaptureSupervisor.hpp"
#include "domain/ResultParser.hpp"
#include <algorithm>
#include <filesystem>
#include <thread>

namespace streamscribe::application {

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(50);

/// Removes the live capture sink and the segment scratch file when the session ends.
class ScratchCleanup {
public:
    ScratchCleanup(std::vector<std::string> paths, infrastructure::DiagnosticLog& log)
        : m_paths(std::move(paths)), m_log(log) {}
    ~ScratchCleanup() { run(); }

    void run() {
        if (m_done) return;
        m_done = true;
        for (const auto& path : m_paths) {
            if (path.empty()) continue;
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec) {
                m_log.error("StreamOrchestrator", "Could not remove " + path + ": " + ec.message());
            }
        }
    }

private:
    std::vector<std::string> m_paths;
    infrastructure::DiagnosticLog& m_log;
    bool m_done = false;
};

std::string WindowLabel(const domain::SegmentWindow& window) {
    return "window " + std::to_string(window.index) + " [" + domain::FormatSeconds(window.start) + "s, " +
           domain::FormatSeconds(window.end()) + "s)";
}

} // namespace

std::string ToString(SessionState state) {
    switch (state) {
        case SessionState::Starting: return "STARTING";
        case SessionState::Buffering: return "BUFFERING";
        case SessionState::Running: return "RUNNING";
        case SessionState::Stopping: return "STOPPING";
        case SessionState::Terminated: return "TERMINATED";
        case SessionState::Aborted: return "ABORTED";
    }
    return "UNKNOWN";
}

StreamOrchestrator::StreamOrchestrator(domain::StreamSession session,
                                       std::shared_ptr<domain::CaptureProcess> capture,
                                       std::shared_ptr<domain::SegmentExtractor> extractor,
                                       std::shared_ptr<domain::TranscriptionInvoker> invoker,
                                       std::shared_ptr<domain::TranscriptSink> sink,
                                       infrastructure::DiagnosticLog& log)
    : m_session(std::move(session)),
      m_clock(m_session.step, m_session.maxDuration),
      m_capture(std::move(capture)),
      m_extractor(std::move(extractor)),
      m_invoker(std::move(invoker)),
      m_sink(std::move(sink)),
      m_log(log) {}

void StreamOrchestrator::enter(SessionState state, SessionOutcome& outcome) {
    m_state.store(state);
    outcome.history.push_back(state);
    outcome.finalState = state;
    m_log.debug("StreamOrchestrator", "State -> " + ToString(state));
}

bool StreamOrchestrator::waitUntil(std::chrono::steady_clock::time_point deadline) const {
    while (!m_stopRequested.load()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, kWaitSlice));
    }
    return false;
}

SessionOutcome StreamOrchestrator::run() {
    SessionOutcome outcome;

    // Declared before the supervisor so the capture is terminated before its sink is removed.
    ScratchCleanup scratch({m_capture->sinkPath(), m_extractor->scratchPath()}, m_log);
    CaptureSupervisor supervisor(m_capture, m_log);

    enter(SessionState::Starting, outcome);
    try {
        supervisor.start({m_session.sourceLocator, m_session.maxDuration});
    } catch (const domain::CaptureStartError& e) {
        m_log.error("StreamOrchestrator", std::string("Capture failed to start: ") + e.what());
        outcome.abortReason = e.what();
        supervisor.terminate();
        scratch.run();
        enter(SessionState::Aborted, outcome);
        outcome.exitStatus = kAbortedExitStatus;
        return outcome;
    }
    const auto captureStart = std::chrono::steady_clock::now();

    enter(SessionState::Buffering, outcome);
    bool keepGoing = waitUntil(captureStart + m_session.step);

    if (keepGoing) {
        enter(SessionState::Running, outcome);
        const domain::TranscriptionRequest request{m_session.model, m_session.language, m_session.outputMode};

        for (std::size_t i = 0;; ++i) {
            if (m_stopRequested.load()) break;
            if (m_clock.isExhausted(i)) {
                m_log.info("StreamOrchestrator", "Reached maximum duration after " + std::to_string(i) + " segments");
                break;
            }

            const domain::SegmentWindow window = m_clock.next(i);
            ++outcome.ticks;
            m_log.debug("StreamOrchestrator", "Processing " + WindowLabel(window));

            domain::ExtractionResult extracted = extractWithRetry(window, supervisor);
            if (!extracted.success) {
                // A stop that lands during retry backoff ends the session without a failure.
                if (m_stopRequested.load()) break;
                m_log.error("StreamOrchestrator", "Extraction of " + WindowLabel(window) + " failed (" +
                            domain::ToString(extracted.error.failure) + "): " + extracted.error.cause);
                outcome.extractionError = extracted.error;
                break;
            }

            const domain::EngineOutput output = m_invoker->invoke(std::move(extracted.artifact), request);
            if (!output.succeeded()) {
                domain::TranscriptionRecord record = toInvocationError(window, output, outcome);
                outcome.records.push_back(record);
                m_sink->emit(record);
                break;
            }
            if (!output.diagnosticOutput.empty() && m_log.enabled(infrastructure::LogLevel::Debug)) {
                m_log.forward(infrastructure::LogLevel::Debug, output.diagnosticOutput);
            }

            domain::TranscriptionRecord record = domain::ResultParser::Parse(i, output.primaryOutput, m_session.outputMode);
            if (record.status == domain::RecordStatus::ParseError) {
                m_log.error("StreamOrchestrator", "Parse error in " + WindowLabel(window) + ": " + record.error +
                            "; raw output: " + record.rawOutput);
            }
            for (const auto& line : record.unparsedLines) {
                m_log.info("StreamOrchestrator", "Ignored engine line in " + WindowLabel(window) + ": " + line);
            }
            outcome.records.push_back(record);
            m_sink->emit(record);

            if (m_clock.isExhausted(i + 1)) continue;
            // Window i+1 is complete one step after its own start.
            if (!waitUntil(captureStart + m_clock.next(i + 1).end())) break;
        }
    }

    outcome.stopRequested = m_stopRequested.load();
    if (outcome.stopRequested) {
        m_log.info("StreamOrchestrator", "Stop requested");
    }

    enter(SessionState::Stopping, outcome);
    supervisor.terminate();
    scratch.run();
    outcome.exitStatus = supervisor.sessionExitStatus();
    enter(SessionState::Terminated, outcome);
    m_log.info("StreamOrchestrator", "Session finished after " + std::to_string(outcome.ticks) +
               " segments, exit status " + std::to_string(outcome.exitStatus));
    return outcome;
}

domain::ExtractionResult StreamOrchestrator::extractWithRetry(const domain::SegmentWindow& window,
                                                              CaptureSupervisor& supervisor) {
    auto backoff = m_session.retryBackoff;
    for (int attempt = 0;; ++attempt) {
        domain::ExtractionResult result = m_extractor->extract(window);
        if (result.success) return result;

        if (result.error.failure == domain::ExtractionFailure::CaptureLag && !supervisor.isAlive()) {
            m_log.info("StreamOrchestrator", "Capture has ended; treating " + WindowLabel(window) + " as end of stream");
            return result;
        }
        if (attempt >= m_session.extractionRetries || m_stopRequested.load()) {
            return result;
        }

        m_log.info("StreamOrchestrator", "Extraction of " + WindowLabel(window) + " failed (" +
                   domain::ToString(result.error.failure) + "), retry " + std::to_string(attempt + 1) + "/" +
                   std::to_string(m_session.extractionRetries) + " in " + std::to_string(backoff.count()) + " ms");
        if (!waitUntil(std::chrono::steady_clock::now() + backoff)) {
            return result;
        }
        backoff = std::min(backoff * 2, m_session.step);
    }
}

domain::TranscriptionRecord StreamOrchestrator::toInvocationError(const domain::SegmentWindow& window,
                                                                  const domain::EngineOutput& output,
                                                                  SessionOutcome& outcome) {
    std::string cause;
    if (!output.launched) {
        cause = "engine could not be launched: " + output.failureReason;
    } else if (output.timedOut) {
        cause = "engine exceeded its time limit";
    } else {
        cause = "engine exited with status " + std::to_string(output.exitCode);
    }

    m_log.error("StreamOrchestrator", "Transcription of " + WindowLabel(window) + " failed: " + cause);
    if (!output.diagnosticOutput.empty()) {
        m_log.forward(infrastructure::LogLevel::Error, output.diagnosticOutput);
    }
    outcome.invocationError = domain::InvocationError{window, cause, output.diagnosticOutput};

    domain::TranscriptionRecord record;
    record.sequenceIndex = window.index;
    record.status = domain::RecordStatus::InvocationError;
    record.rawOutput = output.primaryOutput;
    record.error = cause;
    return record;
}

} // namespace streamscribe::application
