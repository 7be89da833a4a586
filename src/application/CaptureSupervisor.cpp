#include "application/CaptureSupervisor.hpp"
#include "domain/Errors.hpp"

namespace streamscribe::application {

CaptureSupervisor::CaptureSupervisor(std::shared_ptr<domain::CaptureProcess> capture, infrastructure::DiagnosticLog& log)
    : m_capture(std::move(capture)), m_log(log) {}

CaptureSupervisor::~CaptureSupervisor() {
    terminate();
}

void CaptureSupervisor::start(const domain::CaptureRequest& request) {
    m_log.debug("CaptureSupervisor", "Starting capture of " + request.sourceLocator);
    m_capture->start(request);
    m_log.info("CaptureSupervisor", "Capture started, writing to " + m_capture->sinkPath());
}

void CaptureSupervisor::terminate() {
    if (m_terminated) return;
    m_terminated = true;

    // Must be read before the termination request masks it.
    m_ownExitStatus = m_capture->exitStatus();
    if (m_ownExitStatus) {
        m_log.info("CaptureSupervisor", "Capture had already exited with status " + std::to_string(*m_ownExitStatus));
    } else {
        m_log.debug("CaptureSupervisor", "Requesting capture termination");
    }
    m_capture->requestTermination();
}

bool CaptureSupervisor::isAlive() {
    return !m_terminated && m_capture->isAlive();
}

int CaptureSupervisor::sessionExitStatus() const {
    return m_ownExitStatus.value_or(0);
}

} // namespace streamscribe::application
