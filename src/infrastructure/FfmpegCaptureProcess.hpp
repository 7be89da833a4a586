/**
 * @file FfmpegCaptureProcess.hpp
 * @brief Records a live stream to a growing 16 kHz mono WAV file with ffmpeg.
 */

#pragma once

#include "domain/CaptureProcess.hpp"
#include "infrastructure/BackgroundProcess.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace streamscribe::infrastructure {

class FfmpegCaptureProcess : public domain::CaptureProcess {
public:
    /**
     * @param sinkPath File the capture writes into.
     * @param ffmpegPath ffmpeg executable (PATH lookup when not absolute).
     */
    explicit FfmpegCaptureProcess(std::string sinkPath, std::string ffmpegPath = "ffmpeg");
    ~FfmpegCaptureProcess() override = default;

    void start(const domain::CaptureRequest& request) override;
    bool isAlive() override;
    std::optional<int> exitStatus() override;
    void requestTermination() override;
    std::string sinkPath() const override { return m_sinkPath; }

    /** @brief Capture command line for a request. */
    std::vector<std::string> buildCommand(const domain::CaptureRequest& request) const;

private:
    std::string m_sinkPath;
    std::string m_ffmpegPath;
    BackgroundProcess m_process;
    bool m_terminationRequested = false;
};

} // namespace streamscribe::infrastructure
