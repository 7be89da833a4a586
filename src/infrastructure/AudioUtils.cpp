#include "infrastructure/AudioUtils.hpp"
#include <SDL.h>
#include <filesystem>
#include <system_error>

namespace streamscribe::infrastructure {

std::chrono::milliseconds WavInfo::duration() const {
    if (sampleRate <= 0) return std::chrono::milliseconds(0);
    return std::chrono::milliseconds(static_cast<long long>(frames) * 1000 / sampleRate);
}

bool AudioUtils::InspectWav(const std::string& fname, WavInfo& info, std::string& error) {
    SDL_AudioSpec wavSpec;
    Uint32 wavLength = 0;
    Uint8* wavBuffer = nullptr;

    if (SDL_LoadWAV(fname.c_str(), &wavSpec, &wavBuffer, &wavLength) == NULL) {
        error = "SDL_LoadWAV failed: " + std::string(SDL_GetError());
        return false;
    }

    info.sampleRate = wavSpec.freq;
    info.channels = wavSpec.channels;
    info.bitsPerSample = SDL_AUDIO_BITSIZE(wavSpec.format);
    info.isSignedInt = SDL_AUDIO_ISSIGNED(wavSpec.format) && !SDL_AUDIO_ISFLOAT(wavSpec.format);

    const int bytesPerFrame = info.channels * (info.bitsPerSample / 8);
    info.frames = bytesPerFrame > 0 ? wavLength / static_cast<Uint32>(bytesPerFrame) : 0;

    SDL_FreeWAV(wavBuffer);
    return true;
}

std::chrono::milliseconds AudioUtils::EstimateCapturedDuration(const std::string& sinkPath) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(sinkPath, ec);
    if (ec || size <= kWavHeaderBytes) return std::chrono::milliseconds(0);

    const auto bytesPerSecond = static_cast<std::uintmax_t>(kSampleRate * kChannels * kBytesPerSample);
    const auto payload = size - kWavHeaderBytes;
    return std::chrono::milliseconds(static_cast<long long>(payload * 1000 / bytesPerSecond));
}

} // namespace streamscribe::infrastructure
