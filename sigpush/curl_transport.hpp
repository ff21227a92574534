#ifndef CURL_TRANSPORT_HPP
#define CURL_TRANSPORT_HPP

#include <string>
#include "http_transport.hpp"

// Process-wide libcurl initialisation. Create one in main before any
// transport is used, on a single thread.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

class CurlTransport : public HttpTransport {
public:
    // When verbose is set, libcurl's transfer trace is forwarded to the
    // logger at DEBUG level.
    explicit CurlTransport(bool verbose = false);

    // Each call uses its own easy handle, so one instance may be shared
    // between threads.
    HttpResponse Put(const HttpPutRequest& request) override;

private:
    bool verbose_;
};

#endif // CURL_TRANSPORT_HPP
