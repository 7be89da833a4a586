// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace streamscribe::infrastructure {

class PathUtils {
public:
    /** @brief $HOME/whisper.cpp, or ./whisper.cpp when HOME is unset. */
    static std::filesystem::path GetDefaultEngineRoot();
    static std::filesystem::path GetScratchDir();
    /** @brief <dir>/streamscribe-<stem>-<pid>.wav */
    static std::filesystem::path MakeScratchPath(const std::filesystem::path& dir, const std::string& stem);
    /** @brief <root>/build/bin/whisper-cli */
    static std::filesystem::path GetEngineBinary(const std::filesystem::path& engineRoot);
};

} // namespace streamscribe::infrastructure
