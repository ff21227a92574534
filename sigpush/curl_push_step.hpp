#ifndef CURL_PUSH_STEP_HPP
#define CURL_PUSH_STEP_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "http_transport.hpp"
#include "step_result.hpp"

// Results read from the sign-container-image step.
constexpr const char* kSignatureFilePathResult = "container-image-signature-file-path";
constexpr const char* kSignatureNameResult = "container-image-signature-name";

// Results produced by this step.
constexpr const char* kSignatureUrlResult = "container-image-signature-url";
constexpr const char* kSignatureMd5Result = "container-image-signature-file-md5";
constexpr const char* kSignatureSha1Result = "container-image-signature-file-sha1";

// push-container-signature step: uploads the signature produced by an
// earlier step to the signature server.
class CurlPushStep {
public:
    static constexpr const char* kStepName = "push-container-signature";
    static constexpr const char* kImplementerName = "CurlPush";

    explicit CurlPushStep(HttpTransport& transport);

    static std::vector<std::string> RequiredConfigKeys();

    // Missing configuration or previous results produce a failed result.
    // SignatureFileError and TransportError propagate.
    StepResult Run(const StepConfig& config, const WorkflowResults& previous) const;

private:
    HttpTransport& transport_;
};

// Creates the transport once configuration is known; the flag requests a
// transfer trace.
using TransportFactory = std::function<std::unique_ptr<HttpTransport>(bool verbose)>;

// Loads `config_path` into Config::Instance(), applies its log settings and
// runs the step. Every error, configuration included, becomes a failed result.
StepResult RunPushStep(const std::string& config_path, const WorkflowResults& previous,
                       bool verbose, const TransportFactory& make_transport);

#endif // CURL_PUSH_STEP_HPP
