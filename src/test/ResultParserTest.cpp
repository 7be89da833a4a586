#include <cassert>
#include <iostream>
#include <string>

#include "domain/ResultParser.hpp"

using namespace streamscribe::domain;

int main() {
    std::cout << "[Test] Starting ResultParser Test..." << std::endl;

    // Structured: plain object with text.
    {
        TranscriptionRecord record = ResultParser::Parse(3, "{\"text\": \"hola\"}", OutputMode::Structured);
        assert(record.status == RecordStatus::Ok);
        assert(record.text == "hola");
        assert(record.sequenceIndex == 3);
        assert(record.structured && (*record.structured)["text"] == "hola");
        std::cout << "[PASS] Structured object yields ok record." << std::endl;
    }

    // Structured: malformed JSON keeps the raw text.
    {
        const std::string raw = "{\"text\": ";
        TranscriptionRecord record = ResultParser::Parse(1, raw, OutputMode::Structured);
        assert(record.status == RecordStatus::ParseError);
        assert(record.rawOutput == raw);
        assert(record.text.empty());
        assert(!record.structured);
        assert(record.error.find("invalid JSON") != std::string::npos);
        std::cout << "[PASS] Malformed JSON yields parse_error with raw text." << std::endl;
    }

    // Structured: whisper.cpp full layout, segments under "transcription".
    {
        const std::string raw = R"({
  "result": {"language": "ru"},
  "transcription": [
    {"timestamps": {"from": "00:00:00,000", "to": "00:00:05,000"}, "text": " Привет,"},
    {"timestamps": {"from": "00:00:05,000", "to": "00:00:09,000"}, "text": " мир."}
  ]
})";
        TranscriptionRecord record = ResultParser::Parse(0, raw, OutputMode::Structured);
        assert(record.status == RecordStatus::Ok);
        assert(record.text == "Привет, мир.");
        assert((*record.structured)["result"]["language"] == "ru");
        std::cout << "[PASS] Segment texts are joined; object kept as-is." << std::endl;
    }

    // Structured: empty output and non-object values.
    {
        assert(ResultParser::Parse(0, "", OutputMode::Structured).status == RecordStatus::ParseError);
        assert(ResultParser::Parse(0, "  \n", OutputMode::Structured).status == RecordStatus::ParseError);
        TranscriptionRecord array = ResultParser::Parse(0, "[1, 2]", OutputMode::Structured);
        assert(array.status == RecordStatus::ParseError);
        assert(array.rawOutput == "[1, 2]");
        std::cout << "[PASS] Empty and non-object output are parse errors." << std::endl;
    }

    // Structured: segment lines printed before the JSON object line.
    {
        const std::string raw = "[00:00:00.000 --> 00:00:05.000]   hola\n{\"text\": \"hola\"}\n";
        TranscriptionRecord record = ResultParser::Parse(5, raw, OutputMode::Structured);
        assert(record.status == RecordStatus::Ok);
        assert(record.text == "hola");
        assert(record.rawOutput == raw);
        assert(record.unparsedLines.size() == 1);
        assert(record.unparsedLines[0] == "[00:00:00.000 --> 00:00:05.000]   hola");
        std::cout << "[PASS] Mixed segment and JSON lines yield ok record." << std::endl;
    }

    // Structured: one JSON object per line, the last one is the result.
    {
        const std::string raw = "{\"progress\": 50}\n{\"text\": \"adios\"}\n";
        TranscriptionRecord record = ResultParser::Parse(6, raw, OutputMode::Structured);
        assert(record.status == RecordStatus::Ok);
        assert(record.text == "adios");
        assert(record.unparsedLines.size() == 1);
        assert(record.unparsedLines[0] == "{\"progress\":50}");

        TranscriptionRecord noObject = ResultParser::Parse(6, "progress 10%\nprogress 90%\n", OutputMode::Structured);
        assert(noObject.status == RecordStatus::ParseError);
        assert(noObject.unparsedLines.empty());
        std::cout << "[PASS] Several JSON lines take the last object; no object is a parse error." << std::endl;
    }

    // Plain text: last non-empty line wins.
    {
        TranscriptionRecord record = ResultParser::Parse(2, "loading model...\nprocessing...\nhello world", OutputMode::PlainText);
        assert(record.status == RecordStatus::Ok);
        assert(record.text == "hello world");
        assert(!record.structured);

        TranscriptionRecord trailing = ResultParser::Parse(2, "progress\n  final line  \n\n\n", OutputMode::PlainText);
        assert(trailing.text == "final line");
        std::cout << "[PASS] Plain text takes the last non-empty line." << std::endl;
    }

    // Plain text: empty output.
    {
        TranscriptionRecord record = ResultParser::Parse(4, "", OutputMode::PlainText);
        assert(record.status == RecordStatus::ParseError);
        assert(record.sequenceIndex == 4);
        assert(ResultParser::Parse(4, "\n \n", OutputMode::PlainText).status == RecordStatus::ParseError);
        std::cout << "[PASS] Empty plain text is a parse error." << std::endl;
    }

    assert(ToString(RecordStatus::Ok) == "ok");
    assert(ToString(RecordStatus::ParseError) == "parse_error");
    assert(ToString(RecordStatus::InvocationError) == "invocation_error");

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
