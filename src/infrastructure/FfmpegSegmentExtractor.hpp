/**
 * @file FfmpegSegmentExtractor.hpp
 * @brief Cuts fully captured windows out of the live WAV sink with ffmpeg.
 */

#pragma once

#include "domain/SegmentExtractor.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace streamscribe::infrastructure {

class FfmpegSegmentExtractor : public domain::SegmentExtractor {
public:
    /**
     * @param sinkPath Live capture file.
     * @param scratchPath Where the extracted segment is placed.
     * @param captureBound Total capture duration; 0 = unbounded.
     * @param ffmpegPath ffmpeg executable.
     */
    FfmpegSegmentExtractor(std::string sinkPath,
                           std::string scratchPath,
                           std::chrono::milliseconds captureBound,
                           std::string ffmpegPath = "ffmpeg");

    domain::ExtractionResult extract(const domain::SegmentWindow& window) override;
    std::string scratchPath() const override { return m_scratchPath; }

    /** @brief Extraction command line writing into outputPath. */
    std::vector<std::string> buildCommand(const domain::SegmentWindow& window, const std::string& outputPath) const;

    /** @brief Window end clipped to the capture bound. */
    std::chrono::milliseconds effectiveEnd(const domain::SegmentWindow& window) const;

private:
    domain::ExtractionResult fail(const domain::SegmentWindow& window,
                                  domain::ExtractionFailure failure,
                                  const std::string& cause) const;

    std::string m_sinkPath;
    std::string m_scratchPath;
    std::chrono::milliseconds m_captureBound;
    std::string m_ffmpegPath;
};

} // namespace streamscribe::infrastructure
