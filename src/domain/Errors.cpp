#include "domain/Errors.hpp"

namespace streamscribe::domain {

std::string ToString(ExtractionFailure failure) {
    switch (failure) {
        case ExtractionFailure::SinkMissing: return "sink_missing";
        case ExtractionFailure::CaptureLag: return "capture_lag";
        case ExtractionFailure::ToolFailed: return "tool_failed";
        case ExtractionFailure::InvalidArtifact: return "invalid_artifact";
    }
    return "unknown";
}

} // namespace streamscribe::domain
