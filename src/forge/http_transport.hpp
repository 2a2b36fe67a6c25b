#pragma once

#include <string>
#include <vector>
#include <memory>

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;   // "Name: value"
    std::string body;                   // sent only when has_body
    bool has_body = false;
    int timeout_secs = 60;
};

// status == 0 means no HTTP response was received (DNS, connect, TLS,
// timeout); error then carries the transport message.
struct HttpResponse {
    long status = 0;
    std::string body;
    std::string error;

    bool ok() const { return status >= 200 && status < 300; }
};

// Seam between forge clients and the network.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Never throws for HTTP-level failures; non-2xx statuses are returned.
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

// libcurl-backed transport. One easy handle, reused across requests.
class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse perform(const HttpRequest& request) override;

    // Plain GET following redirects, streaming to a file. Used for release
    // downloads. Throws std::runtime_error on failure.
    void download_to_file(const std::string& url, const std::string& path,
                          int timeout_secs);

private:
    void* curl_ = nullptr;   // CURL*
};
