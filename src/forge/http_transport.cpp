#include "http_transport.hpp"
#include <core/log.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <cstdio>
#include <mutex>
#include <stdexcept>

namespace {

struct CurlSlist {
    curl_slist* list = nullptr;
    CurlSlist() = default;
    ~CurlSlist() { curl_slist_free_all(list); }
    void append(const std::string& s) { list = curl_slist_append(list, s.c_str()); }
    curl_slist* get() const { return list; }
    CurlSlist(const CurlSlist&) = delete;
    CurlSlist& operator=(const CurlSlist&) = delete;
};

size_t write_string(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

size_t write_file(void* contents, size_t size, size_t nmemb, void* userp) {
    return std::fwrite(contents, size, nmemb, static_cast<FILE*>(userp)) * size;
}

std::string curl_error(CURLcode code, const char* errbuf) {
    std::string msg = curl_easy_strerror(code);
    if (errbuf && errbuf[0] != '\0') msg += fmt::format(" - {}", errbuf);
    return msg;
}

} // namespace

CurlTransport::CurlTransport() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    curl_ = curl_easy_init();
    if (!curl_) throw std::runtime_error("Failed to init curl");
}

CurlTransport::~CurlTransport() {
    if (curl_) curl_easy_cleanup(static_cast<CURL*>(curl_));
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    CURL* curl = static_cast<CURL*>(curl_);
    curl_easy_reset(curl);

    HttpResponse response;
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeout_secs));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CurlSlist headers;
    for (const auto& h : request.headers) headers.append(h);
    headers.append("User-Agent: bridgectl");
    if (request.has_body) {
        headers.append("Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        response.status = 0;
        response.error = curl_error(res, errbuf);
        bridge_log(fmt::format("HTTP {} {} failed: {}", request.method, request.url, response.error));
        return response;
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    bridge_log(fmt::format("HTTP {} {} -> {} ({} bytes)", request.method, request.url,
                           response.status, response.body.size()));
    return response;
}

void CurlTransport::download_to_file(const std::string& url, const std::string& path,
                                     int timeout_secs) {
    FILE* out = std::fopen(path.c_str(), "wb");
    if (!out) throw std::runtime_error("Cannot open " + path + " for writing");

    CURL* curl = static_cast<CURL*>(curl_);
    curl_easy_reset(curl);
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_file);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, out);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_secs));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "bridgectl");

    CURLcode res = curl_easy_perform(curl);
    std::fclose(out);
    if (res != CURLE_OK) {
        std::remove(path.c_str());
        throw std::runtime_error(fmt::format("Download of {} failed: {}", url, curl_error(res, errbuf)));
    }
}
