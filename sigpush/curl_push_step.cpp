#include "curl_push_step.hpp"
#include "logger.hpp"
#include "signature_uploader.hpp"
#include <exception>

CurlPushStep::CurlPushStep(HttpTransport& transport)
    : transport_(transport) {}

std::vector<std::string> CurlPushStep::RequiredConfigKeys() {
    return {kServerUrlKey, kServerUsernameKey, kServerPasswordKey};
}

StepResult CurlPushStep::Run(const StepConfig& config, const WorkflowResults& previous) const {
    StepResult result(kStepName, kImplementerName);

    std::vector<std::string> missing = config.MissingKeys(RequiredConfigKeys());
    if (!missing.empty()) {
        std::string message = "Missing required step configuration:";
        for (const auto& key : missing) {
            message += " " + key;
        }
        result.set_success(false);
        result.set_message(message);
        return result;
    }

    auto file_path = previous.GetResultValue(kSignatureFilePathResult);
    if (!file_path) {
        result.set_success(false);
        result.set_message(std::string("Missing ") + kSignatureFilePathResult);
        return result;
    }

    auto signature_name = previous.GetResultValue(kSignatureNameResult);
    if (!signature_name) {
        result.set_success(false);
        result.set_message(std::string("Missing ") + kSignatureNameResult);
        return result;
    }

    UploadRequest request;
    request.file_path = *file_path;
    request.object_name = *signature_name;
    request.server_url = *config.Get(kServerUrlKey);
    request.username = *config.Get(kServerUsernameKey);
    request.password = *config.Get(kServerPasswordKey);

    SignatureUploader uploader(transport_);
    UploadResult upload = uploader.Upload(request);

    result.AddArtifact(kSignatureUrlResult, upload.url);
    result.AddArtifact(kSignatureMd5Result, upload.md5);
    result.AddArtifact(kSignatureSha1Result, upload.sha1);
    return result;
}

StepResult RunPushStep(const std::string& config_path, const WorkflowResults& previous,
                       bool verbose, const TransportFactory& make_transport) {
    StepResult step_result(CurlPushStep::kStepName, CurlPushStep::kImplementerName);
    try {
        Config::Instance().Load(config_path);
        const auto& config = Config::Instance().Get();
        verbose = verbose || config.verbose;
        Logger::SetLevel(verbose ? LogLevel::DEBUG : Logger::ParseLevel(config.log_level));

        std::unique_ptr<HttpTransport> transport = make_transport(verbose);
        CurlPushStep step(*transport);

        Logger::Info(std::string("Running step ") + CurlPushStep::kStepName);
        step_result = step.Run(config.step_config, previous);
    } catch (const std::exception& e) {
        Logger::Fatal(e.what());
        step_result.set_success(false);
        step_result.set_message(e.what());
    }
    return step_result;
}
