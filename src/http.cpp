#include "pagezip/http.hpp"
#include "pagezip/errors.hpp"
#include "pagezip/util.hpp"

#include <curl/curl.h>
#include <memory>
#include <new>
#include <mutex>
#include <string>

namespace pagezip {

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

static std::once_flag g_curl_init;

static size_t curl_writebytes(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<Bytes*>(userdata);
    const auto* p = static_cast<const std::uint8_t*>(ptr);
    // Returning short makes curl abort with CURLE_WRITE_ERROR; nothing may unwind through curl.
    try {
        out->insert(out->end(), p, p + size * nmemb);
    } catch (const std::bad_alloc&) {
        return 0;
    }
    return size * nmemb;
}

HttpClient::HttpClient() {
    // curl_global_init is not thread-safe; worker threads only ever see an initialized library.
    std::call_once(g_curl_init, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw Error("curl global init failed");
        }
    });
}

Bytes HttpClient::fetch(const std::string& url) const {
    if (url.empty()) throw InvalidReference("<img> does not have attribute `src`");
    if (!is_http_url(url)) throw InvalidReference("not an http(s) URL: " + url);

    CurlHandle curl(curl_easy_init());
    if (!curl) throw FetchFailure(url, 0, "curl init failed");

    Bytes body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_writebytes);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());

    const CURLcode res = curl_easy_perform(curl.get());
    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);

    if (res == CURLE_URL_MALFORMAT) {
        throw InvalidReference("malformed URL: " + url);
    }
    if (res != CURLE_OK) {
        throw FetchFailure(url, code, "download failed: " + url + ": " + curl_easy_strerror(res));
    }
    if (code >= 400) {
        throw FetchFailure(url, code, "download failed (HTTP " + std::to_string(code) + "): " + url);
    }
    return body;
}

} // namespace pagezip
