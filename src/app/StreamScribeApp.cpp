/**
 * @file StreamScribeApp.cpp
 * @brief Implementation of the StreamScribeApp class.
 */
#include "app/StreamScribeApp.hpp"

#include "application/StreamOrchestrator.hpp"
#include "infrastructure/ConsoleTranscriptSink.hpp"
#include "infrastructure/DiagnosticLog.hpp"
#include "infrastructure/FfmpegCaptureProcess.hpp"
#include "infrastructure/FfmpegSegmentExtractor.hpp"
#include "infrastructure/ModelCatalog.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/WhisperCliInvoker.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <memory>
#include <ostream>

#ifndef STREAMSCRIBE_VERSION
#define STREAMSCRIBE_VERSION "0.0.0"
#endif

namespace streamscribe::app {

namespace {

// Session the signal handler forwards to; set only while RunSession is active.
std::atomic<application::StreamOrchestrator*> g_activeSession{nullptr};

/// Routes SIGINT and SIGTERM to the running session while in scope.
class SignalScope {
public:
    using Handler = void (*)(int);

    explicit SignalScope(application::StreamOrchestrator& session) {
        g_activeSession.store(&session);
        m_previousInt = std::signal(SIGINT, &SignalScope::Forward);
        m_previousTerm = std::signal(SIGTERM, &SignalScope::Forward);
    }
    ~SignalScope() {
        std::signal(SIGINT, m_previousInt);
        std::signal(SIGTERM, m_previousTerm);
        g_activeSession.store(nullptr);
    }

    SignalScope(const SignalScope&) = delete;
    SignalScope& operator=(const SignalScope&) = delete;

private:
    static void Forward(int) {
        if (auto* session = g_activeSession.load()) {
            session->requestStop();
        }
    }

    Handler m_previousInt = SIG_DFL;
    Handler m_previousTerm = SIG_DFL;
};

} // namespace

StreamScribeApp::StreamScribeApp(std::ostream& out, std::ostream& err)
    : m_out(out), m_err(err) {}

int StreamScribeApp::Run(int argc, const char* const* argv) {
    const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "streamscribe";

    CommandLineOptions options;
    std::string error;
    if (!ParseCommandLine(argc, argv, infrastructure::DefaultStreamConfig(), options, error)) {
        m_err << "[StreamScribe] " << error << "\n"
              << "Run '" << program << " --help' for usage." << std::endl;
        return kUsageExitStatus;
    }

    if (options.showHelp) {
        m_out << UsageText(program);
        return 0;
    }
    if (options.showVersion) {
        m_out << "streamscribe " << STREAMSCRIBE_VERSION << std::endl;
        return 0;
    }
    if (options.listModels) {
        for (const auto& model : infrastructure::ModelCatalog::Known()) {
            m_out << model << "\n";
        }
        m_out.flush();
        return 0;
    }

    if (!CheckRequirements(options.config, error)) {
        m_err << "[StreamScribe] " << error << std::endl;
        return kUsageExitStatus;
    }

    return RunSession(options.config);
}

bool StreamScribeApp::CheckRequirements(const infrastructure::StreamConfig& config, std::string& error) const {
    const auto binary = infrastructure::PathUtils::GetEngineBinary(config.engine.engineRoot);
    if (!std::filesystem::exists(binary)) {
        error = "whisper-cli not found at " + binary.string() + " (build whisper.cpp or set --whispercpp_root_path)";
        return false;
    }
    const auto model = infrastructure::ModelCatalog::ModelPath(config.engine.engineRoot, config.session.model);
    if (!std::filesystem::exists(model)) {
        error = "model file not found: " + model.string();
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.scratchDir, ec);
    if (ec) {
        error = "cannot create scratch directory " + config.scratchDir.string() + ": " + ec.message();
        return false;
    }
    return true;
}

int StreamScribeApp::RunSession(const infrastructure::StreamConfig& config) {
    infrastructure::DiagnosticLog log(m_err, config.session.verbosity);

    const auto sinkPath = infrastructure::PathUtils::MakeScratchPath(config.scratchDir, "live").string();
    const auto segmentPath = infrastructure::PathUtils::MakeScratchPath(config.scratchDir, "segment").string();

    auto capture = std::make_shared<infrastructure::FfmpegCaptureProcess>(sinkPath);
    auto extractor = std::make_shared<infrastructure::FfmpegSegmentExtractor>(sinkPath, segmentPath, config.session.maxDuration);
    auto invoker = std::make_shared<infrastructure::WhisperCliInvoker>(config.engine);
    auto sink = std::make_shared<infrastructure::ConsoleTranscriptSink>(m_out, config.session.outputMode);

    application::StreamOrchestrator orchestrator(config.session, capture, extractor, invoker, sink, log);

    log.info("StreamScribe", "Transcribing " + config.session.sourceLocator + " with model " + config.session.model +
             " (" + config.session.language + "), step " + std::to_string(config.session.step.count() / 1000) + "s");

    SignalScope signals(orchestrator);
    const application::SessionOutcome outcome = orchestrator.run();

    return outcome.exitStatus;
}

} // namespace streamscribe::app
