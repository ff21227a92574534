#include "curl_transport.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <sstream>

namespace {

struct ReadState {
    const std::string* body;
    size_t offset;
};

// Feeds the in-memory request body to libcurl.
size_t ReadCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    ReadState* state = static_cast<ReadState*>(userdata);
    size_t remaining = state->body->size() - state->offset;
    size_t n = std::min(size * nmemb, remaining);
    std::memcpy(ptr, state->body->data() + state->offset, n);
    state->offset += n;
    return n;
}

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

// Mirrors the -v trace of the command line tool, one log record per line.
int DebugCallback(CURL*, curl_infotype type, char* data, size_t size, void*) {
    const char* prefix = nullptr;
    switch (type) {
        case CURLINFO_TEXT: prefix = "* "; break;
        case CURLINFO_HEADER_OUT: prefix = "> "; break;
        case CURLINFO_HEADER_IN: prefix = "< "; break;
        default: return 0;
    }

    std::istringstream lines(std::string(data, size));
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        if (type == CURLINFO_HEADER_OUT && line.compare(0, 14, "Authorization:") == 0) {
            line = "Authorization: <redacted>";
        }
        Logger::Debug(prefix + line, "curl");
    }
    return 0;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

} // namespace

CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        throw std::runtime_error("Failed to initialise libcurl");
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

CurlTransport::CurlTransport(bool verbose)
    : verbose_(verbose) {}

HttpResponse CurlTransport::Put(const HttpPutRequest& request) {
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw TransportError(request.url, "failed to create curl handle");
    }

    HeaderList headers(nullptr, curl_slist_free_all);
    for (const auto& line : request.headers) {
        curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
        if (!appended) {
            throw TransportError(request.url, "failed to build request headers");
        }
        headers.release();
        headers.reset(appended);
    }

    ReadState read_state{&request.body, 0};
    HttpResponse response;
    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, ReadCallback);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &read_state);
    curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, (curl_off_t)request.body.size());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, (long)CURLAUTH_BASIC);
    curl_easy_setopt(curl.get(), CURLOPT_USERNAME, request.username.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, request.password.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    if (verbose_) {
        curl_easy_setopt(curl.get(), CURLOPT_VERBOSE, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_DEBUGFUNCTION, DebugCallback);
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string cause = curl_easy_strerror(res);
        if (error_buffer[0] != '\0') {
            cause += " (" + std::string(error_buffer) + ")";
        }
        throw TransportError(request.url, cause);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}
