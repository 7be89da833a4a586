#include "domain/TranscriptionRecord.hpp"

namespace streamscribe::domain {

std::string ToString(RecordStatus status) {
    switch (status) {
        case RecordStatus::Ok: return "ok";
        case RecordStatus::ParseError: return "parse_error";
        case RecordStatus::InvocationError: return "invocation_error";
    }
    return "unknown";
}

} // namespace streamscribe::domain
