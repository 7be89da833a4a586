#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace streamscribe::infrastructure {

/**
 * @brief Format summary of a WAV file.
 */
struct WavInfo {
    int sampleRate = 0;
    int channels = 0;
    int bitsPerSample = 0;
    bool isSignedInt = false;
    std::size_t frames = 0;

    std::chrono::milliseconds duration() const;
};

/**
 * @brief Utilities for the 16 kHz mono s16 audio the pipeline exchanges.
 */
class AudioUtils {
public:
    static constexpr int kSampleRate = 16000;
    static constexpr int kChannels = 1;
    static constexpr int kBytesPerSample = 2;
    static constexpr std::size_t kWavHeaderBytes = 44;

    /**
     * @brief Loads a finished WAV file through SDL and reports its format.
     * @param fname Path to WAV file.
     * @param info Populated on success.
     * @param error Populated on failure.
     * @return True if the file could be decoded.
     */
    static bool InspectWav(const std::string& fname, WavInfo& info, std::string& error);

    /**
     * @brief Estimates how much audio a still-growing capture file holds.
     *
     * The header of a file that is still being written is not final, so the
     * estimate comes from the file size. Returns zero if the file is missing.
     */
    static std::chrono::milliseconds EstimateCapturedDuration(const std::string& sinkPath);
};

} // namespace streamscribe::infrastructure
