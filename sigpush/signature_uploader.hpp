#ifndef SIGNATURE_UPLOADER_HPP
#define SIGNATURE_UPLOADER_HPP

#include <string>
#include "http_transport.hpp"

struct UploadRequest {
    std::string file_path;
    std::string object_name;
    std::string server_url;
    std::string username;
    std::string password;
};

struct UploadResult {
    const std::string url;
    const std::string md5;
    const std::string sha1;
};

// Joins the server url and object name. Exactly one trailing '/' is removed
// from server_url; object_name is appended unescaped.
std::string BuildSignatureUrl(const std::string& server_url, const std::string& object_name);

// Reads the whole file in binary mode. Throws SignatureFileError.
std::string ReadSignatureFile(const std::string& path);

class SignatureUploader {
public:
    explicit SignatureUploader(HttpTransport& transport);

    // Hashes the file, then PUTs it to BuildSignatureUrl(...) with
    // X-Checksum-Sha1 / X-Checksum-MD5 headers and basic auth.
    // Throws SignatureFileError before any network call if the file cannot
    // be read, and TransportError if the PUT fails or returns non-2xx.
    UploadResult Upload(const UploadRequest& request);

private:
    HttpTransport& transport_;
};

#endif // SIGNATURE_UPLOADER_HPP
