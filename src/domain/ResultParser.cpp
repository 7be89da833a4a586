#include "domain/ResultParser.hpp"
#include <optional>
#include <sstream>
#include <vector>

namespace streamscribe::domain {

namespace {
    std::string Trim(const std::string& s) {
        const char* ws = " \t\r\n";
        const auto first = s.find_first_not_of(ws);
        if (first == std::string::npos) return {};
        const auto last = s.find_last_not_of(ws);
        return s.substr(first, last - first + 1);
    }

    // Concatenates the "text" members of an array of segment objects.
    std::string JoinSegmentText(const nlohmann::json& segments) {
        std::string joined;
        for (const auto& segment : segments) {
            if (segment.is_object() && segment.contains("text") && segment["text"].is_string()) {
                joined += segment["text"].get<std::string>();
            }
        }
        return joined;
    }

    std::string ExtractText(const nlohmann::json& object) {
        if (object.contains("text") && object["text"].is_string()) {
            return Trim(object["text"].get<std::string>());
        }
        // whisper.cpp's full JSON layout nests segments under "transcription".
        for (const char* key : {"transcription", "segments"}) {
            if (object.contains(key) && object[key].is_array()) {
                return Trim(JoinSegmentText(object[key]));
            }
        }
        return {};
    }

    TranscriptionRecord Structured(std::size_t sequenceIndex, const std::string& raw, nlohmann::json object,
                                   std::vector<std::string> otherLines) {
        TranscriptionRecord record;
        record.sequenceIndex = sequenceIndex;
        record.status = RecordStatus::Ok;
        record.text = ExtractText(object);
        record.structured = std::move(object);
        record.rawOutput = raw;
        record.unparsedLines = std::move(otherLines);
        return record;
    }

    TranscriptionRecord Failed(std::size_t sequenceIndex, const std::string& raw, const std::string& error) {
        TranscriptionRecord record;
        record.sequenceIndex = sequenceIndex;
        record.status = RecordStatus::ParseError;
        record.rawOutput = raw;
        record.error = error;
        return record;
    }
}

TranscriptionRecord ResultParser::Parse(std::size_t sequenceIndex, const std::string& primaryOutput, OutputMode mode) {
    if (mode == OutputMode::Structured) {
        return ParseStructured(sequenceIndex, primaryOutput);
    }
    return ParsePlainText(sequenceIndex, primaryOutput);
}

TranscriptionRecord ResultParser::ParseStructured(std::size_t sequenceIndex, const std::string& primaryOutput) {
    const std::string trimmed = Trim(primaryOutput);
    if (trimmed.empty()) {
        return Failed(sequenceIndex, primaryOutput, "empty engine output");
    }

    // A single (possibly pretty-printed) document.
    std::string wholeError;
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(trimmed);
        if (parsed.is_object()) {
            return Structured(sequenceIndex, primaryOutput, std::move(parsed), {});
        }
        wholeError = "expected a JSON object, got " + std::string(parsed.type_name());
    } catch (const nlohmann::json::parse_error& e) {
        wholeError = std::string("invalid JSON: ") + e.what();
    }

    // Mixed output: segment lines interleaved with one JSON object per line.
    std::optional<nlohmann::json> found;
    std::vector<std::string> otherLines;
    std::istringstream stream(primaryOutput);
    std::string line;
    while (std::getline(stream, line)) {
        std::string candidate = Trim(line);
        if (candidate.empty()) continue;
        nlohmann::json object = nlohmann::json::parse(candidate, nullptr, false);
        if (!object.is_discarded() && object.is_object()) {
            if (found) otherLines.push_back(found->dump());
            found = std::move(object);
        } else {
            otherLines.push_back(std::move(candidate));
        }
    }

    if (!found) {
        return Failed(sequenceIndex, primaryOutput, wholeError);
    }
    return Structured(sequenceIndex, primaryOutput, std::move(*found), std::move(otherLines));
}

TranscriptionRecord ResultParser::ParsePlainText(std::size_t sequenceIndex, const std::string& primaryOutput) {
    // Progress lines come first; only the last non-empty line is the result.
    std::string lastLine;
    std::istringstream stream(primaryOutput);
    std::string line;
    while (std::getline(stream, line)) {
        std::string candidate = Trim(line);
        if (!candidate.empty()) lastLine = std::move(candidate);
    }

    if (lastLine.empty()) {
        return Failed(sequenceIndex, primaryOutput, "empty engine output");
    }

    TranscriptionRecord record;
    record.sequenceIndex = sequenceIndex;
    record.status = RecordStatus::Ok;
    record.text = std::move(lastLine);
    record.rawOutput = primaryOutput;
    return record;
}

} // namespace streamscribe::domain
