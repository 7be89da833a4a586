#include "infrastructure/WhisperCliInvoker.hpp"
#include "infrastructure/ModelCatalog.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ProcessRunner.hpp"

#include <system_error>

namespace streamscribe::infrastructure {

namespace fs = std::filesystem;

WhisperCliInvoker::WhisperCliInvoker(EngineConfig config)
    : m_config(std::move(config)) {}

std::vector<std::string> WhisperCliInvoker::buildCommand(const std::string& segmentPath,
                                                         const domain::TranscriptionRequest& request) const {
    std::vector<std::string> argv = {
        PathUtils::GetEngineBinary(m_config.engineRoot).string(),
        "-t", std::to_string(m_config.threads),
        "-m", ModelCatalog::ModelPath(m_config.engineRoot, request.model).string(),
        "-f", segmentPath,
        "--language", request.language,
    };
    if (request.outputMode == domain::OutputMode::Structured) {
        argv.push_back("-poai");
    } else {
        argv.push_back("--no-timestamps");
    }
    return argv;
}

domain::EngineOutput WhisperCliInvoker::invoke(domain::SegmentArtifact artifact,
                                               const domain::TranscriptionRequest& request) {
    domain::EngineOutput output;

    std::error_code ec;
    const fs::path binary = PathUtils::GetEngineBinary(m_config.engineRoot);
    if (!fs::exists(binary, ec)) {
        output.failureReason = "whisper-cli not found at " + binary.string();
        return output;
    }
    const fs::path model = ModelCatalog::ModelPath(m_config.engineRoot, request.model);
    if (!fs::exists(model, ec)) {
        output.failureReason = "model file not found: " + model.string();
        return output;
    }

    ProcessResult run = ProcessRunner::Run(buildCommand(artifact.path(), request), m_config.timeout);
    artifact.release();

    output.primaryOutput = std::move(run.primaryOutput);
    output.diagnosticOutput = std::move(run.diagnosticOutput);
    output.exitCode = run.exitCode;
    output.launched = run.launched && run.error.empty();
    output.timedOut = run.timedOut;
    output.failureReason = run.error;
    return output;
}

} // namespace streamscribe::infrastructure
