#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base for every error raised by sigpush.
class SigpushError : public std::runtime_error {
public:
    explicit SigpushError(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid or unreadable configuration / results file.
class ConfigError : public SigpushError {
public:
    explicit ConfigError(const std::string& message)
        : SigpushError("Configuration error: " + message) {}
};

// Signature file missing or unreadable. Raised before any network activity.
class SignatureFileError : public SigpushError {
public:
    SignatureFileError(const std::string& path, const std::string& reason)
        : SigpushError("Failed to read signature file " + path + ": " + reason),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// The PUT exchange did not complete with a 2xx response.
class TransportError : public SigpushError {
public:
    TransportError(const std::string& url, const std::string& cause)
        : SigpushError("Unexpected error uploading signature file to signature server (" + url + "): " + cause),
          url_(url), cause_(cause) {}

    const std::string& url() const { return url_; }
    const std::string& cause() const { return cause_; }

private:
    std::string url_;
    std::string cause_;
};

#endif // ERRORS_HPP
