#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "domain/SegmentArtifact.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "infrastructure/FfmpegSegmentExtractor.hpp"
#include "infrastructure/WhisperCliInvoker.hpp"

using namespace streamscribe;
using namespace streamscribe::infrastructure;
using std::chrono::milliseconds;

namespace fs = std::filesystem;

namespace {

void PutLE(std::ofstream& out, std::uint32_t value, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.put(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

// Canonical 44-byte header followed by silence.
void WriteWav(const fs::path& path, milliseconds length, int sampleRate = 16000, int channels = 1) {
    const std::uint32_t frames = static_cast<std::uint32_t>(length.count() * sampleRate / 1000);
    const std::uint32_t dataBytes = frames * channels * 2;

    std::ofstream out(path, std::ios::binary);
    out.write("RIFF", 4);
    PutLE(out, 36 + dataBytes, 4);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    PutLE(out, 16, 4);
    PutLE(out, 1, 2);                                      // PCM
    PutLE(out, static_cast<std::uint32_t>(channels), 2);
    PutLE(out, static_cast<std::uint32_t>(sampleRate), 4);
    PutLE(out, static_cast<std::uint32_t>(sampleRate * channels * 2), 4);
    PutLE(out, static_cast<std::uint32_t>(channels * 2), 2);
    PutLE(out, 16, 2);
    out.write("data", 4);
    PutLE(out, dataBytes, 4);
    const std::vector<char> silence(dataBytes, 0);
    out.write(silence.data(), static_cast<std::streamsize>(silence.size()));
}

fs::path WriteScript(const fs::path& path, const std::string& body) {
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body << "\n";
    }
    fs::permissions(path, fs::perms::owner_all);
    return path;
}

// Fake ffmpeg that copies a prepared file onto its last argument.
fs::path CopyingTool(const fs::path& root, const std::string& name, const fs::path& source) {
    return WriteScript(root / name, "for last; do :; done\ncp '" + source.string() + "' \"$last\"");
}

domain::SegmentWindow Window(std::size_t index, milliseconds step) {
    domain::SegmentWindow window;
    window.index = index;
    window.start = step * static_cast<long long>(index);
    window.duration = step;
    return window;
}

} // namespace

int main() {
    std::cout << "[Test] Starting MediaAdapters Test..." << std::endl;

    const fs::path root = fs::temp_directory_path() / "streamscribe_media_test";
    fs::remove_all(root);
    fs::create_directories(root);
    const fs::path sink = root / "live.wav";
    const fs::path scratch = root / "segment.wav";

    // WAV inspection through SDL.
    {
        WriteWav(root / "one-second.wav", milliseconds(1000));
        WavInfo info;
        std::string error;
        assert(AudioUtils::InspectWav((root / "one-second.wav").string(), info, error));
        assert(info.sampleRate == 16000);
        assert(info.channels == 1);
        assert(info.bitsPerSample == 16);
        assert(info.isSignedInt);
        assert(info.frames == 16000);
        assert(info.duration() == milliseconds(1000));
        assert(AudioUtils::EstimateCapturedDuration((root / "one-second.wav").string()) == milliseconds(1000));
        assert(AudioUtils::EstimateCapturedDuration((root / "missing.wav").string()) == milliseconds(0));

        assert(!AudioUtils::InspectWav((root / "missing.wav").string(), info, error));
        assert(!error.empty());
        std::cout << "[PASS] WAV format and captured duration." << std::endl;
    }

    // Extraction command line, clipped to the capture bound.
    {
        FfmpegSegmentExtractor extractor(sink.string(), scratch.string(), milliseconds(50000), "ffmpeg");
        const auto argv = extractor.buildCommand(Window(3, std::chrono::seconds(15)), "out.wav");
        const std::vector<std::string> expected = {
            "ffmpeg", "-loglevel", "error", "-noaccurate_seek", "-i", sink.string(), "-y",
            "-ar", "16000", "-ac", "1", "-c:a", "pcm_s16le",
            "-ss", "45.000", "-t", "5.000", "-f", "wav", "out.wav"
        };
        assert(argv == expected);
        std::cout << "[PASS] Extraction command line." << std::endl;
    }

    // Sink missing and capture lag are detected before running the tool.
    {
        FfmpegSegmentExtractor extractor(sink.string(), scratch.string(), milliseconds(0),
                                         (root / "never-run").string());
        domain::ExtractionResult missing = extractor.extract(Window(0, milliseconds(1000)));
        assert(!missing.success);
        assert(missing.error.failure == domain::ExtractionFailure::SinkMissing);

        WriteWav(sink, milliseconds(1000));
        domain::ExtractionResult lag = extractor.extract(Window(1, milliseconds(1000)));
        assert(!lag.success);
        assert(lag.error.failure == domain::ExtractionFailure::CaptureLag);
        assert(lag.error.window.index == 1);
        assert(!fs::exists(scratch));
        std::cout << "[PASS] Sink missing and capture lag." << std::endl;
    }

    // Successful extraction yields a complete, owned artifact.
    {
        WriteWav(sink, milliseconds(2000));
        WriteWav(root / "cut.wav", milliseconds(1000));
        const fs::path tool = CopyingTool(root, "fake-ffmpeg-ok", root / "cut.wav");
        FfmpegSegmentExtractor extractor(sink.string(), scratch.string(), milliseconds(0), tool.string());

        domain::ExtractionResult result = extractor.extract(Window(1, milliseconds(1000)));
        assert(result.success);
        assert(result.artifact.valid());
        assert(result.artifact.path() == scratch.string());
        assert(result.artifact.window().index == 1);
        assert(fs::exists(scratch));
        assert(!fs::exists(scratch.string() + ".partial"));
        assert(domain::SegmentArtifact::LiveCount() == 1);

        result.artifact.release();
        assert(!fs::exists(scratch));
        assert(domain::SegmentArtifact::LiveCount() == 0);
        std::cout << "[PASS] Extracted artifact is complete and owned." << std::endl;
    }

    // The last window is clipped to the capture bound.
    {
        WriteWav(sink, milliseconds(1500));
        WriteWav(root / "half.wav", milliseconds(500));
        const fs::path tool = CopyingTool(root, "fake-ffmpeg-half", root / "half.wav");
        FfmpegSegmentExtractor extractor(sink.string(), scratch.string(), milliseconds(1500), tool.string());

        domain::ExtractionResult result = extractor.extract(Window(1, milliseconds(1000)));
        assert(result.success);
        std::cout << "[PASS] Final window clipped to the capture bound." << std::endl;
    }

    // A sink a few milliseconds short of the window end still counts as captured.
    {
        WriteWav(root / "full.wav", milliseconds(1000));
        const fs::path tool = CopyingTool(root, "fake-ffmpeg-full", root / "full.wav");
        FfmpegSegmentExtractor extractor(sink.string(), scratch.string(), milliseconds(0), tool.string());

        WriteWav(sink, milliseconds(1990));
        domain::ExtractionResult result = extractor.extract(Window(1, milliseconds(1000)));
        assert(result.success);
        result.artifact.release();
        assert(!fs::exists(scratch));

        WriteWav(sink, milliseconds(1950));
        domain::ExtractionResult lag = extractor.extract(Window(1, milliseconds(1000)));
        assert(!lag.success);
        assert(lag.error.failure == domain::ExtractionFailure::CaptureLag);
        std::cout << "[PASS] Availability check allows the length tolerance." << std::endl;
    }

    // Short and malformed outputs are rejected.
    {
        WriteWav(sink, milliseconds(2000));
        WriteWav(root / "short.wav", milliseconds(200));
        const fs::path shortTool = CopyingTool(root, "fake-ffmpeg-short", root / "short.wav");
        FfmpegSegmentExtractor shortExtractor(sink.string(), scratch.string(), milliseconds(0), shortTool.string());
        domain::ExtractionResult shortResult = shortExtractor.extract(Window(0, milliseconds(1000)));
        assert(!shortResult.success);
        assert(shortResult.error.failure == domain::ExtractionFailure::InvalidArtifact);
        assert(!fs::exists(scratch));
        assert(!fs::exists(scratch.string() + ".partial"));

        WriteWav(root / "stereo.wav", milliseconds(1000), 44100, 2);
        const fs::path stereoTool = CopyingTool(root, "fake-ffmpeg-stereo", root / "stereo.wav");
        FfmpegSegmentExtractor stereoExtractor(sink.string(), scratch.string(), milliseconds(0), stereoTool.string());
        domain::ExtractionResult stereo = stereoExtractor.extract(Window(0, milliseconds(1000)));
        assert(!stereo.success);
        assert(stereo.error.failure == domain::ExtractionFailure::InvalidArtifact);

        const fs::path failing = WriteScript(root / "fake-ffmpeg-fail", "echo 'Invalid data found' >&2; exit 1");
        FfmpegSegmentExtractor failingExtractor(sink.string(), scratch.string(), milliseconds(0), failing.string());
        domain::ExtractionResult failed = failingExtractor.extract(Window(0, milliseconds(1000)));
        assert(!failed.success);
        assert(failed.error.failure == domain::ExtractionFailure::ToolFailed);
        assert(failed.error.cause.find("Invalid data found") != std::string::npos);
        std::cout << "[PASS] Short, malformed and failed extractions are reported." << std::endl;
    }

    // Engine command line.
    {
        EngineConfig config;
        config.engineRoot = root / "whisper.cpp";
        config.threads = 4;
        WhisperCliInvoker invoker(config);

        const auto structured = invoker.buildCommand("seg.wav", {"small", "ru", domain::OutputMode::Structured});
        const std::vector<std::string> expected = {
            (root / "whisper.cpp" / "build" / "bin" / "whisper-cli").string(),
            "-t", "4",
            "-m", (root / "whisper.cpp" / "models" / "ggml-small.bin").string(),
            "-f", "seg.wav", "--language", "ru", "-poai"
        };
        assert(structured == expected);

        const auto plain = invoker.buildCommand("seg.wav", {"base", "en", domain::OutputMode::PlainText});
        assert(plain.back() == "--no-timestamps");
        std::cout << "[PASS] Engine command line." << std::endl;
    }

    // Engine runs, the artifact is consumed either way.
    {
        const fs::path engineRoot = root / "whisper.cpp";
        fs::create_directories(engineRoot / "build" / "bin");
        fs::create_directories(engineRoot / "models");

        EngineConfig config;
        config.engineRoot = engineRoot;
        WhisperCliInvoker invoker(config);

        WriteWav(scratch, milliseconds(100));
        domain::EngineOutput missing = invoker.invoke(domain::SegmentArtifact(scratch.string(), Window(0, milliseconds(100))),
                                                      {"small", "ru", domain::OutputMode::Structured});
        assert(!missing.launched);
        assert(missing.failureReason.find("whisper-cli not found") != std::string::npos);
        assert(!fs::exists(scratch));

        WriteScript(engineRoot / "build" / "bin" / "whisper-cli",
                    "echo 'whisper_init_from_file: loading model' >&2\necho '{\"text\": \"hola\"}'");
        { std::ofstream model(engineRoot / "models" / "ggml-small.bin"); model << "ggml"; }

        WriteWav(scratch, milliseconds(100));
        domain::EngineOutput ok = invoker.invoke(domain::SegmentArtifact(scratch.string(), Window(0, milliseconds(100))),
                                                 {"small", "ru", domain::OutputMode::Structured});
        assert(ok.succeeded());
        assert(ok.primaryOutput == "{\"text\": \"hola\"}\n");
        assert(ok.diagnosticOutput.find("loading model") != std::string::npos);
        assert(!fs::exists(scratch));
        assert(domain::SegmentArtifact::LiveCount() == 0);

        config.timeout = milliseconds(200);
        WriteScript(engineRoot / "build" / "bin" / "whisper-cli", "sleep 10");
        WhisperCliInvoker slow(config);
        WriteWav(scratch, milliseconds(100));
        domain::EngineOutput hung = slow.invoke(domain::SegmentArtifact(scratch.string(), Window(0, milliseconds(100))),
                                                {"small", "ru", domain::OutputMode::Structured});
        assert(hung.launched);
        assert(hung.timedOut);
        assert(!hung.succeeded());
        assert(!fs::exists(scratch));
        std::cout << "[PASS] Engine output captured; artifact always consumed." << std::endl;
    }

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
