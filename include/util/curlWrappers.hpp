#pragma once

#include <curl/curl.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cw::util {

inline void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

inline size_t writeToString(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* buf = static_cast<std::string*>(userdata);
    buf->append(ptr, size * nmemb);
    return size * nmemb;
}

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        applyDefaults();
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    // Clears per-request options; live connections stay cached on the handle.
    void reset() {
        curl_easy_reset(h_);
        applyDefaults();
    }

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

private:
    CURL* h_;

    void applyDefaults() {
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
};

class SList {
public:
    SList() = default;
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;

    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
    }
    ~SList() { curl_slist_free_all(head_); }
    curl_slist* get() const { return head_; }

private:
    std::vector<std::string> store_;
    curl_slist*              head_ = nullptr;
};

struct Response {
    CURLcode curl  = CURLE_OK;
    long     code  = 0;   // HTTP status or last FTP reply
    std::string body;
    std::string error;

    // FTP replies 1xx-3xx are fine; HTTP needs 2xx
    [[nodiscard]] bool ok() const { return curl == CURLE_OK && code < 400; }
    [[nodiscard]] bool httpOk() const { return curl == CURLE_OK && code / 100 == 2; }
};

// Runs one transfer on a reused handle; setup applies the request options.
template <class SetupFn>
Response performCurl(CurlEasy& h, SetupFn&& setup) {
    h.reset();
    CURL* c = h;

    std::string bodyBuf;
    char errBuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &bodyBuf);
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errBuf);

    setup(c);

    Response r;
    r.curl = curl_easy_perform(c);
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &r.code);
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, nullptr);
    r.body.swap(bodyBuf);
    r.error = errBuf[0] ? std::string(errBuf) : std::string(curl_easy_strerror(r.curl));
    return r;
}

template <class SetupFn>
Response performCurl(SetupFn&& setup) {
    CurlEasy h;
    return performCurl(h, std::forward<SetupFn>(setup));
}

}
