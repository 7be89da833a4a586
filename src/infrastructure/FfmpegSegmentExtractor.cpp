#include "infrastructure/FfmpegSegmentExtractor.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "infrastructure/ProcessRunner.hpp"

#include <filesystem>
#include <system_error>

namespace streamscribe::infrastructure {

namespace fs = std::filesystem;

namespace {
// ffmpeg may round the cut to a frame boundary.
constexpr std::chrono::milliseconds kLengthTolerance{20};
constexpr std::chrono::milliseconds kExtractionTimeout{60000};
}

FfmpegSegmentExtractor::FfmpegSegmentExtractor(std::string sinkPath,
                                               std::string scratchPath,
                                               std::chrono::milliseconds captureBound,
                                               std::string ffmpegPath)
    : m_sinkPath(std::move(sinkPath))
    , m_scratchPath(std::move(scratchPath))
    , m_captureBound(captureBound)
    , m_ffmpegPath(std::move(ffmpegPath))
{}

std::chrono::milliseconds FfmpegSegmentExtractor::effectiveEnd(const domain::SegmentWindow& window) const {
    if (m_captureBound.count() > 0 && window.end() > m_captureBound) {
        return m_captureBound;
    }
    return window.end();
}

std::vector<std::string> FfmpegSegmentExtractor::buildCommand(const domain::SegmentWindow& window,
                                                              const std::string& outputPath) const {
    return {
        m_ffmpegPath,
        "-loglevel", "error",
        "-noaccurate_seek",
        "-i", m_sinkPath,
        "-y",
        "-ar", std::to_string(AudioUtils::kSampleRate),
        "-ac", std::to_string(AudioUtils::kChannels),
        "-c:a", "pcm_s16le",
        "-ss", domain::FormatSeconds(window.start),
        "-t", domain::FormatSeconds(effectiveEnd(window) - window.start),
        "-f", "wav",
        outputPath,
    };
}

domain::ExtractionResult FfmpegSegmentExtractor::fail(const domain::SegmentWindow& window,
                                                      domain::ExtractionFailure failure,
                                                      const std::string& cause) const {
    domain::ExtractionResult result;
    result.success = false;
    result.error.window = window;
    result.error.failure = failure;
    result.error.cause = cause;
    return result;
}

domain::ExtractionResult FfmpegSegmentExtractor::extract(const domain::SegmentWindow& window) {
    std::error_code ec;
    if (!fs::exists(m_sinkPath, ec)) {
        return fail(window, domain::ExtractionFailure::SinkMissing, "capture sink not found: " + m_sinkPath);
    }

    // Never cut a window whose end has not been captured yet.
    const auto required = effectiveEnd(window);
    const auto captured = AudioUtils::EstimateCapturedDuration(m_sinkPath);
    if (captured + kLengthTolerance < required) {
        return fail(window, domain::ExtractionFailure::CaptureLag,
                    "window ends at " + domain::FormatSeconds(required) + "s but only "
                    + domain::FormatSeconds(captured) + "s captured");
    }

    // Write next to the scratch file and rename once complete, so the
    // consumer never sees a partially written segment.
    const std::string partialPath = m_scratchPath + ".partial";
    fs::remove(partialPath, ec);

    ProcessResult run = ProcessRunner::Run(buildCommand(window, partialPath), kExtractionTimeout);
    if (!run.succeeded()) {
        fs::remove(partialPath, ec);
        std::string cause;
        if (!run.launched) {
            cause = "could not run ffmpeg: " + run.error;
        } else if (run.timedOut) {
            cause = "ffmpeg timed out";
        } else {
            cause = "ffmpeg exited with status " + std::to_string(run.exitCode);
        }
        if (!run.diagnosticOutput.empty()) cause += ": " + run.diagnosticOutput;
        return fail(window, domain::ExtractionFailure::ToolFailed, cause);
    }

    WavInfo info;
    std::string inspectError;
    if (!AudioUtils::InspectWav(partialPath, info, inspectError)) {
        fs::remove(partialPath, ec);
        return fail(window, domain::ExtractionFailure::InvalidArtifact, inspectError);
    }

    const auto expected = effectiveEnd(window) - window.start;
    if (info.sampleRate != AudioUtils::kSampleRate || info.channels != AudioUtils::kChannels
        || info.bitsPerSample != 8 * AudioUtils::kBytesPerSample || !info.isSignedInt) {
        fs::remove(partialPath, ec);
        return fail(window, domain::ExtractionFailure::InvalidArtifact,
                    "unexpected format: " + std::to_string(info.sampleRate) + " Hz, "
                    + std::to_string(info.channels) + " ch, " + std::to_string(info.bitsPerSample) + " bit");
    }
    if (info.duration() + kLengthTolerance < expected) {
        fs::remove(partialPath, ec);
        return fail(window, domain::ExtractionFailure::InvalidArtifact,
                    "short segment: " + domain::FormatSeconds(info.duration()) + "s of "
                    + domain::FormatSeconds(expected) + "s");
    }

    fs::rename(partialPath, m_scratchPath, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(partialPath, ec);
        return fail(window, domain::ExtractionFailure::ToolFailed, "could not move segment into place: " + reason);
    }

    domain::ExtractionResult result;
    result.success = true;
    result.artifact = domain::SegmentArtifact(m_scratchPath, window);
    return result;
}

} // namespace streamscribe::infrastructure
