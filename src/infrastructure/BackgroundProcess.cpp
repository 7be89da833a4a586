#include "infrastructure/BackgroundProcess.hpp"
#include "infrastructure/ProcessRunner.hpp"

#include <cerrno>
#include <signal.h>
#include <sys/wait.h>
#include <thread>

namespace streamscribe::infrastructure {

BackgroundProcess::~BackgroundProcess() {
    terminate(std::chrono::milliseconds(500));
}

bool BackgroundProcess::start(const std::vector<std::string>& argv, std::string& error) {
    if (m_pid > 0 && isAlive()) {
        error = "process already running (pid " + std::to_string(m_pid) + ")";
        return false;
    }
    m_exitStatus.reset();
    return ProcessRunner::Spawn(argv, -1, -1, m_pid, error);
}

bool BackgroundProcess::isAlive() {
    if (m_pid <= 0 || m_exitStatus) return false;

    int status = 0;
    const pid_t rc = ::waitpid(m_pid, &status, WNOHANG);
    if (rc == 0) return true;
    if (rc == m_pid) {
        m_exitStatus = ProcessRunner::DecodeStatus(status);
        return false;
    }
    if (errno == EINTR) return true;
    // ECHILD: someone else reaped it; we can no longer learn its status.
    m_exitStatus = -1;
    return false;
}

std::optional<int> BackgroundProcess::terminate(std::chrono::milliseconds grace) {
    if (m_pid <= 0) return std::nullopt;
    if (!isAlive()) return m_exitStatus;

    ::kill(-m_pid, SIGTERM);

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!isAlive()) return m_exitStatus;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    ::kill(-m_pid, SIGKILL);
    m_exitStatus = ProcessRunner::WaitForExit(m_pid);
    return m_exitStatus;
}

} // namespace streamscribe::infrastructure
