#pragma once

#include <curl/curl.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace d8::util {

inline void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlEasy {
public:
    CurlEasy() : h_((ensureCurlGlobalInit(), curl_easy_init())) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 0L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

private:
    CURL* h_;
};

class SList {
public:
    SList() = default;
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;

    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
        if (!head_) throw std::runtime_error("curl_slist_append failed");
    }
    ~SList() { curl_slist_free_all(head_); }
    curl_slist* get() const { return head_; }
    bool empty() const { return head_ == nullptr; }

private:
    std::vector<std::string> store_;
    curl_slist*              head_ = nullptr;
};

// curl_blob that borrows a string for the duration of one transfer.
inline curl_blob blobOf(const std::string& s) {
    return curl_blob{const_cast<char*>(s.data()), s.size(), CURL_BLOB_COPY};
}

}
