/**
 * @file BackgroundProcess.hpp
 * @brief Long-running child process with discarded output.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace streamscribe::infrastructure {

/**
 * @class BackgroundProcess
 * @brief Starts a child, reports its liveness and stops it on request.
 *
 * The destructor terminates a child that is still running.
 */
class BackgroundProcess {
public:
    BackgroundProcess() = default;
    ~BackgroundProcess();

    BackgroundProcess(const BackgroundProcess&) = delete;
    BackgroundProcess& operator=(const BackgroundProcess&) = delete;

    /**
     * @brief Spawns the child.
     * @param error Populated on failure.
     * @return True if the child was started.
     */
    bool start(const std::vector<std::string>& argv, std::string& error);

    /** @brief Non-blocking check; reaps the child if it has exited. */
    bool isAlive();

    /** @brief Exit status once the child has been reaped. */
    std::optional<int> exitStatus() const { return m_exitStatus; }

    /**
     * @brief Sends SIGTERM, waits up to grace, then SIGKILL. Reaps the child.
     * @return The child's exit status, or nullopt if nothing was started.
     */
    std::optional<int> terminate(std::chrono::milliseconds grace);

private:
    pid_t m_pid = -1;
    std::optional<int> m_exitStatus;
};

} // namespace streamscribe::infrastructure
