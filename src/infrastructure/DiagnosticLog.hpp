/**
 * @file DiagnosticLog.hpp
 * @brief Tagged, verbosity-gated log lines on the diagnostic stream.
 *
 * Lines look like "[Component] message" so they never mix with the
 * transcripts written to the primary stream.
 */

#pragma once
#include <mutex>
#include <ostream>
#include <string>

namespace streamscribe::infrastructure {

enum class LogLevel {
    Error = 0,
    Info = 1,
    Debug = 2
};

class DiagnosticLog {
public:
    /**
     * @param out Diagnostic stream (stderr in the application).
     * @param verbosity 0 = errors only, 1 = info, 2 and above = debug.
     */
    DiagnosticLog(std::ostream& out, int verbosity);

    void error(const std::string& tag, const std::string& msg);
    void info(const std::string& tag, const std::string& msg);
    void debug(const std::string& tag, const std::string& msg);

    /**
     * @brief Writes every non-empty line of an external tool's diagnostic
     *        output, each prefixed with "[stderr] ".
     */
    void forward(LogLevel level, const std::string& text);

    bool enabled(LogLevel level) const { return static_cast<int>(level) <= m_verbosity; }

private:
    void write(LogLevel level, const std::string& line);

    std::ostream& m_out;
    int m_verbosity;
    std::mutex m_mutex;
};

} // namespace streamscribe::infrastructure
