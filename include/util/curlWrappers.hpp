#pragma once

#include <curl/curl.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace ts::util {

// One easy handle per transfer.
class CurlHandle {
public:
    CurlHandle() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h_, CURLOPT_ERRORBUFFER, err_);
    }
    ~CurlHandle() { curl_easy_cleanup(h_); }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    operator CURL*() { return h_; }

    void timeout(const std::chrono::seconds t) {
        curl_easy_setopt(h_, CURLOPT_TIMEOUT, static_cast<long>(t.count()));
        curl_easy_setopt(h_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(t.count()));
    }

    // GET carries no body; anything else is sent as a custom request with the body attached.
    // The body must outlive perform().
    void method(const std::string& verb, const std::string& body) {
        if (verb == "GET") {
            curl_easy_setopt(h_, CURLOPT_HTTPGET, 1L);
            return;
        }
        curl_easy_setopt(h_, CURLOPT_CUSTOMREQUEST, verb.c_str());
        curl_easy_setopt(h_, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(h_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    }

    [[nodiscard]] std::string lastError(const CURLcode code) const {
        return err_[0] ? std::string(err_) : std::string(curl_easy_strerror(code));
    }

private:
    CURL* h_;
    char err_[CURL_ERROR_SIZE] = {0};
};

class HeaderList {
public:
    HeaderList() = default;
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;
    ~HeaderList() { curl_slist_free_all(head_); }

    void add(const std::string& name, const std::string& value) {
        lines_.push_back(name + ": " + value);
        head_ = curl_slist_append(head_, lines_.back().c_str());
        if (!head_) throw std::runtime_error("curl_slist_append failed");
    }

    [[nodiscard]] curl_slist* get() const { return head_; }

private:
    std::vector<std::string> lines_;
    curl_slist* head_ = nullptr;
};

struct CurlResult {
    CURLcode code = CURLE_OK;
    long status = 0;
    std::string body;
    std::string rawHeaders;
    std::string error;
};

inline size_t appendToString(char* p, const size_t s, const size_t n, void* ud) {
    static_cast<std::string*>(ud)->append(p, s * n);
    return s * n;
}

// Collects body and header bytes into the result; the caller has already set URL, method and headers.
inline CurlResult perform(CurlHandle& h) {
    CurlResult r;
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, appendToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &r.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, appendToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &r.rawHeaders);

    r.code = curl_easy_perform(h);
    if (r.code == CURLE_OK) curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.status);
    else r.error = h.lastError(r.code);
    return r;
}

}
