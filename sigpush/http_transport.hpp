#ifndef HTTP_TRANSPORT_HPP
#define HTTP_TRANSPORT_HPP

#include <string>
#include <vector>

struct HttpPutRequest {
    std::string url;
    // Raw header lines, sent exactly as given (e.g. "X-Checksum-MD5:abc").
    std::vector<std::string> headers;
    std::string username;
    std::string password;
    std::string body;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Performs a single PUT. Throws TransportError when the exchange cannot
    // complete; any HTTP status, including errors, is returned to the caller.
    virtual HttpResponse Put(const HttpPutRequest& request) = 0;
};

#endif // HTTP_TRANSPORT_HPP
