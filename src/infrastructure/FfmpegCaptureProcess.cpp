#include "infrastructure/FfmpegCaptureProcess.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/AudioUtils.hpp"

namespace streamscribe::infrastructure {

namespace {
constexpr std::chrono::milliseconds kTerminationGrace{2000};
}

FfmpegCaptureProcess::FfmpegCaptureProcess(std::string sinkPath, std::string ffmpegPath)
    : m_sinkPath(std::move(sinkPath)), m_ffmpegPath(std::move(ffmpegPath)) {}

std::vector<std::string> FfmpegCaptureProcess::buildCommand(const domain::CaptureRequest& request) const {
    std::vector<std::string> argv = {
        m_ffmpegPath,
        "-loglevel", "quiet",
        "-y",
        "-re",
        "-probesize", "32",
        "-i", request.sourceLocator,
        "-ar", std::to_string(AudioUtils::kSampleRate),
        "-ac", std::to_string(AudioUtils::kChannels),
        "-c:a", "pcm_s16le",
    };
    if (request.maxDuration.count() > 0) {
        argv.push_back("-t");
        argv.push_back(domain::FormatSeconds(request.maxDuration));
    }
    argv.push_back(m_sinkPath);
    return argv;
}

void FfmpegCaptureProcess::start(const domain::CaptureRequest& request) {
    if (request.sourceLocator.empty()) {
        throw domain::CaptureStartError("no stream locator given");
    }

    m_terminationRequested = false;
    std::string error;
    if (!m_process.start(buildCommand(request), error)) {
        throw domain::CaptureStartError("failed to start ffmpeg: " + error);
    }
}

bool FfmpegCaptureProcess::isAlive() {
    return m_process.isAlive();
}

std::optional<int> FfmpegCaptureProcess::exitStatus() {
    // Only an exit the capture reached on its own is reported.
    if (m_terminationRequested) return std::nullopt;
    if (m_process.isAlive()) return std::nullopt;
    return m_process.exitStatus();
}

void FfmpegCaptureProcess::requestTermination() {
    if (m_terminationRequested) return;
    if (m_process.isAlive()) {
        m_terminationRequested = true;
        m_process.terminate(kTerminationGrace);
    }
}

} // namespace streamscribe::infrastructure
