/**
 * @file ProcessRunner.hpp
 * @brief Runs external tools from a typed argument list and captures both output channels.
 *
 * No shell is involved: argv[0] is looked up on PATH and every other element
 * is passed through verbatim, so stream URLs and paths are never interpreted.
 */

#pragma once
#include <chrono>
#include <string>
#include <sys/types.h>
#include <vector>

namespace streamscribe::infrastructure {

/**
 * @struct ProcessResult
 */
struct ProcessResult {
    std::string primaryOutput;      ///< Everything the child wrote to stdout.
    std::string diagnosticOutput;   ///< Everything the child wrote to stderr.
    int exitCode = -1;              ///< Exit status, or 128 + signal number.
    bool launched = false;
    bool timedOut = false;
    std::string error;              ///< Spawn or I/O failure description.

    bool succeeded() const { return launched && !timedOut && error.empty() && exitCode == 0; }
};

class ProcessRunner {
public:
    /**
     * @brief Runs a command to completion.
     * @param argv Program followed by its arguments.
     * @param timeout Soft deadline; zero means wait indefinitely. On expiry the
     *        child's process group is killed and the result is marked timedOut.
     */
    static ProcessResult Run(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /**
     * @brief Spawns a child in its own process group with stdin on /dev/null.
     * @param stdoutFd Descriptor for the child's stdout, or -1 for /dev/null.
     * @param stderrFd Descriptor for the child's stderr, or -1 for /dev/null.
     */
    static bool Spawn(const std::vector<std::string>& argv, int stdoutFd, int stderrFd,
                      pid_t& pid, std::string& error);

    /** @brief Blocks until the child exits and decodes its status. */
    static int WaitForExit(pid_t pid);

    static int DecodeStatus(int status);
};

} // namespace streamscribe::infrastructure
