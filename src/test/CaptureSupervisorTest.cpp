#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "application/CaptureSupervisor.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/DiagnosticLog.hpp"
#include "infrastructure/FfmpegCaptureProcess.hpp"

using namespace streamscribe;
using streamscribe::application::CaptureSupervisor;
using std::chrono::milliseconds;

namespace fs = std::filesystem;

namespace {

class CountingCapture : public domain::CaptureProcess {
public:
    void start(const domain::CaptureRequest&) override {
        if (failStart) throw domain::CaptureStartError("spawn failed");
        running = true;
    }
    bool isAlive() override { return running; }
    std::optional<int> exitStatus() override {
        if (running || terminations > 0) return std::nullopt;
        return ownExit;
    }
    void requestTermination() override {
        ++terminations;
        running = false;
    }
    std::string sinkPath() const override { return "/tmp/unused.wav"; }

    bool failStart = false;
    bool running = false;
    int terminations = 0;
    std::optional<int> ownExit;
};

fs::path WriteScript(const fs::path& path, const std::string& body) {
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body << "\n";
    }
    fs::permissions(path, fs::perms::owner_all);
    return path;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CaptureSupervisor Test..." << std::endl;
    std::ostringstream logStream;
    infrastructure::DiagnosticLog log(logStream, 2);

    // Explicit terminate plus destructor: one request.
    {
        auto capture = std::make_shared<CountingCapture>();
        {
            CaptureSupervisor supervisor(capture, log);
            supervisor.start({"rtmp://x", milliseconds(0)});
            assert(supervisor.isAlive());
            supervisor.terminate();
            supervisor.terminate();
            assert(supervisor.terminated());
            assert(!supervisor.isAlive());
            assert(supervisor.sessionExitStatus() == 0);
        }
        assert(capture->terminations == 1);
        std::cout << "[PASS] Termination is requested exactly once." << std::endl;
    }

    // Scope exit alone terminates.
    {
        auto capture = std::make_shared<CountingCapture>();
        {
            CaptureSupervisor supervisor(capture, log);
            supervisor.start({"rtmp://x", milliseconds(0)});
        }
        assert(capture->terminations == 1);
        std::cout << "[PASS] Destructor terminates the capture." << std::endl;
    }

    // Failed start still ends with one termination request.
    {
        auto capture = std::make_shared<CountingCapture>();
        capture->failStart = true;
        bool threw = false;
        {
            CaptureSupervisor supervisor(capture, log);
            try {
                supervisor.start({"rtmp://x", milliseconds(0)});
            } catch (const domain::CaptureStartError&) {
                threw = true;
            }
        }
        assert(threw);
        assert(capture->terminations == 1);
        std::cout << "[PASS] Failed start is rethrown and still cleaned up." << std::endl;
    }

    // Independent death is not restarted; its status is reported.
    {
        auto capture = std::make_shared<CountingCapture>();
        CaptureSupervisor supervisor(capture, log);
        supervisor.start({"rtmp://x", milliseconds(0)});
        capture->running = false;
        capture->ownExit = 1;
        assert(!supervisor.isAlive());
        supervisor.terminate();
        assert(supervisor.sessionExitStatus() == 1);
        assert(capture->terminations == 1);
        std::cout << "[PASS] Capture's own exit status is kept." << std::endl;
    }

    // Real child process behind FfmpegCaptureProcess.
    const fs::path root = fs::temp_directory_path() / "streamscribe_capture_test";
    fs::create_directories(root);
    const std::string sink = (root / "live.wav").string();

    {
        infrastructure::FfmpegCaptureProcess capture(sink, "ffmpeg");
        const auto argv = capture.buildCommand({"rtmp://x", std::chrono::seconds(60)});
        const std::vector<std::string> expected = {
            "ffmpeg", "-loglevel", "quiet", "-y", "-re", "-probesize", "32", "-i", "rtmp://x",
            "-ar", "16000", "-ac", "1", "-c:a", "pcm_s16le", "-t", "60.000", sink
        };
        assert(argv == expected);

        const auto unbounded = capture.buildCommand({"rtmp://x", milliseconds(0)});
        assert(unbounded.back() == sink);
        assert(std::find(unbounded.begin(), unbounded.end(), "-t") == unbounded.end());
        std::cout << "[PASS] Capture command line." << std::endl;
    }

    {
        const fs::path tool = WriteScript(root / "fake-ffmpeg-live", "exec sleep 30");
        auto capture = std::make_shared<infrastructure::FfmpegCaptureProcess>(sink, tool.string());
        {
            CaptureSupervisor supervisor(capture, log);
            supervisor.start({"rtmp://x", milliseconds(0)});
            assert(supervisor.isAlive());
            assert(!capture->exitStatus());
        }
        assert(!capture->isAlive());
        assert(!capture->exitStatus());
        std::cout << "[PASS] Running capture is stopped by the supervisor." << std::endl;
    }

    {
        const fs::path tool = WriteScript(root / "fake-ffmpeg-dies", "exit 7");
        auto capture = std::make_shared<infrastructure::FfmpegCaptureProcess>(sink, tool.string());
        CaptureSupervisor supervisor(capture, log);
        supervisor.start({"rtmp://x", milliseconds(0)});
        for (int i = 0; i < 200 && capture->isAlive(); ++i) {
            std::this_thread::sleep_for(milliseconds(10));
        }
        supervisor.terminate();
        assert(supervisor.sessionExitStatus() == 7);
        std::cout << "[PASS] Capture exit status surfaces through the supervisor." << std::endl;
    }

    {
        infrastructure::FfmpegCaptureProcess missing(sink, (root / "no-such-ffmpeg").string());
        bool threw = false;
        try {
            missing.start({"rtmp://x", milliseconds(0)});
        } catch (const domain::CaptureStartError& e) {
            threw = std::string(e.what()).find("failed to start ffmpeg") != std::string::npos;
        }
        assert(threw);
        missing.requestTermination();

        infrastructure::FfmpegCaptureProcess noLocator(sink, "ffmpeg");
        threw = false;
        try {
            noLocator.start({"", milliseconds(0)});
        } catch (const domain::CaptureStartError&) {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] Capture start failures raise CaptureStartError." << std::endl;
    }

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
