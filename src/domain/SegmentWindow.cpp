#include "domain/SegmentWindow.hpp"
#include <cstdio>

namespace streamscribe::domain {

std::string FormatSeconds(std::chrono::milliseconds value) {
    const long long ms = value.count();
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%lld.%03lld", ms / 1000, ms % 1000);
    return buffer;
}

} // namespace streamscribe::domain
