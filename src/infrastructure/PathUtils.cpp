#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace streamscribe::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDefaultEngineRoot() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / "whisper.cpp";
    }
    return fs::current_path() / "whisper.cpp"; // Fallback
}

fs::path PathUtils::GetScratchDir() {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) {
        return fs::path("/tmp");
    }
    return dir;
}

fs::path PathUtils::MakeScratchPath(const fs::path& dir, const std::string& stem) {
    return dir / ("streamscribe-" + stem + "-" + std::to_string(::getpid()) + ".wav");
}

fs::path PathUtils::GetEngineBinary(const fs::path& engineRoot) {
    return engineRoot / "build" / "bin" / "whisper-cli";
}

} // namespace streamscribe::infrastructure
