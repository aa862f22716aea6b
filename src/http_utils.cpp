#include "http_utils.hpp"
#include <memory>

namespace http {

CurlInitGuard::CurlInitGuard() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK)
        throw std::runtime_error(std::string("curl_global_init failed: ") +
                                 curl_easy_strerror(rc));
}

CurlInitGuard::~CurlInitGuard() { curl_global_cleanup(); }

static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

Response perform(const Request& req) {
    easy_ptr curl(curl_easy_init());
    if (!curl.get())
        throw TransportError("curl_easy_init failed");

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    for (const auto& h : req.headers) {
        curl_slist* next = curl_slist_append(headers.get(), h.c_str());
        if (!next)
            throw TransportError("curl_slist_append failed");
        headers.release();
        headers.reset(next);
    }
    // Suppress "Expect: 100-continue" so the body goes out with the headers.
    if (req.post) {
        curl_slist* next = curl_slist_append(headers.get(), "Expect:");
        if (!next)
            throw TransportError("curl_slist_append failed");
        headers.release();
        headers.reset(next);
    }

    Response resp;
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (!req.proxy.empty())
        curl_easy_setopt(curl.get(), CURLOPT_PROXY, req.proxy.c_str());
    if (req.post) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
    }

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        std::string msg = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        throw TransportError(msg);
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

std::string escape(const std::string& s) {
    easy_ptr curl(curl_easy_init());
    if (!curl.get())
        throw TransportError("curl_easy_init failed");
    char* raw = curl_easy_escape(curl.get(), s.c_str(), static_cast<int>(s.size()));
    if (!raw)
        throw TransportError("curl_easy_escape failed");
    std::string out(raw);
    curl_free(raw);
    return out;
}

} // namespace http
