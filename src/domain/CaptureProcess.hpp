/**
 * @file CaptureProcess.hpp
 * @brief Interface over the long-running process that records the live stream.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace streamscribe::domain {

/**
 * @struct CaptureRequest
 */
struct CaptureRequest {
    std::string sourceLocator;                  ///< Opaque stream URL handed to the capture tool.
    std::chrono::milliseconds maxDuration{0};   ///< 0 = unbounded.
};

/**
 * @class CaptureProcess
 * @brief Handle to the capture process. The process table owns the process;
 *        this handle can only start it, observe it and ask it to stop.
 */
class CaptureProcess {
public:
    virtual ~CaptureProcess() = default;

    /** @brief Spawns the capture process. @throws CaptureStartError */
    virtual void start(const CaptureRequest& request) = 0;

    virtual bool isAlive() = 0;

    /** @brief Exit status if the process ended on its own before termination was requested. */
    virtual std::optional<int> exitStatus() = 0;

    /** @brief Signals the process to stop. No-op when nothing is running. */
    virtual void requestTermination() = 0;

    /** @brief The continuously-growing file the process writes into. */
    virtual std::string sinkPath() const = 0;
};

} // namespace streamscribe::domain
