#include "app/CommandLine.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ModelCatalog.hpp"
#include <sstream>
#include <vector>

namespace streamscribe::app {

namespace {

bool ParseInt(const std::string& name, const std::string& value, int& out, std::string& error) {
    try {
        std::size_t pos = 0;
        const int parsed = std::stoi(value, &pos);
        if (pos != value.size()) {
            error = "invalid value for --" + name + ": '" + value + "'";
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        error = "invalid value for --" + name + ": '" + value + "'";
        return false;
    }
}

bool TakesValue(const std::string& name) {
    static const std::vector<std::string> flags = {"help", "version", "list_models"};
    for (const auto& flag : flags) {
        if (flag == name) return false;
    }
    return true;
}

/// Applies one "--name value" pair to the configuration.
bool ApplyOption(const std::string& name, const std::string& value,
                 infrastructure::StreamConfig& config, std::string& error) {
    auto& session = config.session;
    int number = 0;

    if (name == "model") {
        session.model = value;
    } else if (name == "language") {
        session.language = value;
    } else if (name == "whispercpp_root_path") {
        config.engine.engineRoot = value;
    } else if (name == "scratch_dir") {
        config.scratchDir = value;
    } else if (name == "config") {
        // Loaded before the other flags are applied.
    } else {
        if (!ParseInt(name, value, number, error)) return false;

        if (name == "step_s") session.step = std::chrono::seconds(number);
        else if (name == "max_duration") session.maxDuration = std::chrono::seconds(number);
        else if (name == "verbosity") session.verbosity = number;
        else if (name == "print_openai") session.outputMode = number != 0 ? domain::OutputMode::Structured : domain::OutputMode::PlainText;
        else if (name == "threads") config.engine.threads = number;
        else if (name == "engine_timeout_s") config.engine.timeout = std::chrono::seconds(number);
        else if (name == "extraction_retries") session.extractionRetries = number;
        else if (name == "retry_backoff_ms") session.retryBackoff = std::chrono::milliseconds(number);
        else {
            error = "unknown option --" + name;
            return false;
        }
    }
    return true;
}

} // namespace

bool ParseCommandLine(int argc, const char* const* argv,
                      const infrastructure::StreamConfig& defaults,
                      CommandLineOptions& options, std::string& error) {
    options = CommandLineOptions{};
    options.config = defaults;

    std::vector<std::pair<std::string, std::string>> flags;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h") arg = "--help";

        if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
            positional.push_back(arg);
            continue;
        }

        std::string name = arg.substr(2);
        std::string value;
        const auto eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        } else if (TakesValue(name)) {
            if (i + 1 >= argc) {
                error = "missing value for --" + name;
                return false;
            }
            value = argv[++i];
        }

        if (name == "help") options.showHelp = true;
        else if (name == "version") options.showVersion = true;
        else if (name == "list_models") options.listModels = true;
        else if (name == "config") options.configPath = value;
        flags.emplace_back(name, value);
    }

    if (options.showHelp || options.showVersion || options.listModels) {
        return true;
    }

    if (!options.configPath.empty() &&
        !infrastructure::ConfigLoader::LoadStreamConfig(options.configPath, options.config, error)) {
        return false;
    }

    for (const auto& [name, value] : flags) {
        if (!ApplyOption(name, value, options.config, error)) return false;
    }

    if (positional.size() > 1) {
        error = "unexpected argument '" + positional[1] + "'";
        return false;
    }
    if (positional.size() == 1) {
        options.config.session.sourceLocator = positional[0];
    }
    if (options.config.session.sourceLocator.empty()) {
        error = "missing stream_url";
        return false;
    }

    return ValidateStreamConfig(options.config, error);
}

bool ValidateStreamConfig(const infrastructure::StreamConfig& config, std::string& error) {
    const auto& session = config.session;
    if (session.step.count() <= 0) {
        error = "--step_s must be greater than 0";
    } else if (session.maxDuration.count() < 0) {
        error = "--max_duration must be 0 (unbounded) or positive";
    } else if (session.verbosity < 0) {
        error = "--verbosity must not be negative";
    } else if (config.engine.threads <= 0) {
        error = "--threads must be greater than 0";
    } else if (config.engine.timeout.count() < 0) {
        error = "--engine_timeout_s must not be negative";
    } else if (session.extractionRetries < 0) {
        error = "--extraction_retries must not be negative";
    } else if (session.retryBackoff.count() < 0) {
        error = "--retry_backoff_ms must not be negative";
    } else if (session.language.empty()) {
        error = "--language must not be empty";
    } else if (!infrastructure::ModelCatalog::IsKnown(session.model)) {
        error = "unknown model '" + session.model + "' (valid: " + infrastructure::ModelCatalog::Describe() + ")";
    } else {
        return true;
    }
    return false;
}

std::string UsageText(const std::string& program) {
    std::ostringstream out;
    out << "usage: " << program << " [options] stream_url\n"
        << "\n"
        << "Transcribes a live audio stream in fixed-length segments with whisper.cpp.\n"
        << "\n"
        << "options:\n"
        << "  --step_s N                segment length in seconds (default 15)\n"
        << "  --model NAME              whisper model (default small)\n"
        << "  --language CODE           spoken language (default ru)\n"
        << "  --max_duration N          total seconds to capture, 0 = unbounded (default 60)\n"
        << "  --verbosity N             0 = errors, 1 = info, 2 = debug (default 0)\n"
        << "  --print_openai 0|1        1 = one JSON object per segment, 0 = plain text (default 1)\n"
        << "  --whispercpp_root_path P  whisper.cpp checkout (default $HOME/whisper.cpp)\n"
        << "  --threads N               engine threads (default 8)\n"
        << "  --engine_timeout_s N      per-segment engine time limit, 0 = none (default 0)\n"
        << "  --extraction_retries N    retries for a segment that is not ready (default 5)\n"
        << "  --retry_backoff_ms N      first retry delay in milliseconds (default 500)\n"
        << "  --scratch_dir DIR         directory for temporary audio (default system temp)\n"
        << "  --config FILE             JSON file with any of the options above\n"
        << "  --list_models             print the known models and exit\n"
        << "  --version                 print the version and exit\n"
        << "  -h, --help                show this help\n";
    return out.str();
}

} // namespace streamscribe::app
