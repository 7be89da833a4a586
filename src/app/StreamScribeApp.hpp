/**
 * @file StreamScribeApp.hpp
 * @brief Entry point class for the streamscribe executable.
 */

#pragma once

#include "app/CommandLine.hpp"
#include <iosfwd>

namespace streamscribe::app {

/// Exit status for usage and configuration errors.
constexpr int kUsageExitStatus = 1;

/**
 * @class StreamScribeApp
 * @brief Parses the command line, wires the session together and runs it.
 */
class StreamScribeApp {
public:
    StreamScribeApp(std::ostream& out, std::ostream& err);

    /**
     * @brief Runs one session.
     * @return 0 on success or voluntary stop, 1 on usage errors, 2 when the
     *         capture could not start, otherwise the capture's own exit status.
     */
    int Run(int argc, const char* const* argv);

private:
    /**
     * @brief Checks that the engine binary and the model file exist.
     * @return False with a message naming the missing file.
     */
    bool CheckRequirements(const infrastructure::StreamConfig& config, std::string& error) const;

    int RunSession(const infrastructure::StreamConfig& config);

    std::ostream& m_out;
    std::ostream& m_err;
};

} // namespace streamscribe::app
