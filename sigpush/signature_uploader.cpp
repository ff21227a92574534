#include "signature_uploader.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

namespace {

// Server error pages are only echoed up to this many bytes.
constexpr size_t kMaxErrorBodyBytes = 512;

} // namespace

std::string BuildSignatureUrl(const std::string& server_url, const std::string& object_name) {
    std::string base = server_url;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + object_name;
}

std::string ReadSignatureFile(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw SignatureFileError(path, "is a directory");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw SignatureFileError(path, std::strerror(errno));
    }

    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw SignatureFileError(path, "read failed");
    }
    return contents;
}

SignatureUploader::SignatureUploader(HttpTransport& transport)
    : transport_(transport) {}

UploadResult SignatureUploader::Upload(const UploadRequest& request) {
    std::string contents = ReadSignatureFile(request.file_path);
    FileDigests digests = ComputeFileDigests(contents);
    std::string url = BuildSignatureUrl(request.server_url, request.object_name);

    HttpPutRequest put;
    put.url = url;
    put.headers.push_back("X-Checksum-Sha1:" + digests.sha1);
    put.headers.push_back("X-Checksum-MD5:" + digests.md5);
    put.username = request.username;
    put.password = request.password;
    put.body = std::move(contents);

    Logger::Info("Uploading signature file " + request.file_path + " (" +
                 std::to_string(put.body.size()) + " bytes) to " + url);

    HttpResponse response = transport_.Put(put);
    if (response.status_code < 200 || response.status_code >= 300) {
        std::string cause = "server returned HTTP " + std::to_string(response.status_code);
        if (!response.body.empty()) {
            cause += ": " + response.body.substr(0, kMaxErrorBodyBytes);
        }
        throw TransportError(url, cause);
    }

    Logger::Info("Signature uploaded to " + url + " (HTTP " + std::to_string(response.status_code) + ")");
    return UploadResult{url, digests.md5, digests.sha1};
}
