/**
 * @file CaptureSupervisor.hpp
 * @brief Scoped ownership of the capture process lifetime.
 */

#pragma once

#include "domain/CaptureProcess.hpp"
#include "infrastructure/DiagnosticLog.hpp"
#include <memory>
#include <optional>

namespace streamscribe::application {

/**
 * @class CaptureSupervisor
 * @brief Starts the capture process and guarantees exactly one termination request.
 *
 * Termination happens on the first terminate() call or in the destructor,
 * whichever comes first, including after a failed start. A capture process
 * that dies on its own is not restarted.
 */
class CaptureSupervisor {
public:
    CaptureSupervisor(std::shared_ptr<domain::CaptureProcess> capture, infrastructure::DiagnosticLog& log);
    ~CaptureSupervisor();

    CaptureSupervisor(const CaptureSupervisor&) = delete;
    CaptureSupervisor& operator=(const CaptureSupervisor&) = delete;

    /** @throws domain::CaptureStartError */
    void start(const domain::CaptureRequest& request);

    /** @brief Requests termination once; later calls do nothing. */
    void terminate();

    bool isAlive();

    /** @brief Capture's own exit status, or 0 when the session ended it voluntarily. */
    int sessionExitStatus() const;

    bool terminated() const { return m_terminated; }

private:
    std::shared_ptr<domain::CaptureProcess> m_capture;
    infrastructure::DiagnosticLog& m_log;
    bool m_terminated = false;
    std::optional<int> m_ownExitStatus;
};

} // namespace streamscribe::application
