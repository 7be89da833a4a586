#include "infrastructure/DiagnosticLog.hpp"
#include <sstream>

namespace streamscribe::infrastructure {

DiagnosticLog::DiagnosticLog(std::ostream& out, int verbosity)
    : m_out(out), m_verbosity(verbosity) {}

void DiagnosticLog::error(const std::string& tag, const std::string& msg) {
    write(LogLevel::Error, "[" + tag + "] [ERROR] " + msg);
}

void DiagnosticLog::info(const std::string& tag, const std::string& msg) {
    write(LogLevel::Info, "[" + tag + "] " + msg);
}

void DiagnosticLog::debug(const std::string& tag, const std::string& msg) {
    write(LogLevel::Debug, "[" + tag + "] " + msg);
}

void DiagnosticLog::forward(LogLevel level, const std::string& text) {
    if (!enabled(level)) return;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        write(level, "[stderr] " + line);
    }
}

void DiagnosticLog::write(LogLevel level, const std::string& line) {
    if (!enabled(level)) return;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << line << std::endl;
}

} // namespace streamscribe::infrastructure
