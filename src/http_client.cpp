//
//  http_client.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <new>

#include "chaptify_version.hpp"
#include "logging.hpp"

namespace chaptify {

namespace {

// curl_global_init is not thread-safe; run it exactly once.
bool curl_ready() {
    static std::once_flag flag;
    static bool ok = false;
    std::call_once(flag, []() { ok = curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK; });
    return ok;
}

size_t append_body(void *contents, size_t size, size_t nmemb, void *userp) {
    const size_t n = size * nmemb;
    try {
        static_cast<std::string *>(userp)->append(static_cast<const char *>(contents), n);
    } catch (const std::bad_alloc &) {
        return 0;  // makes curl abort with CURLE_WRITE_ERROR
    }
    return n;
}

struct CurlHandleDeleter {
    void operator()(CURL *h) const { curl_easy_cleanup(h); }
};

struct SlistDeleter {
    void operator()(curl_slist *l) const { curl_slist_free_all(l); }
};

}  // namespace

CurlHttpTransport::CurlHttpTransport() {
    if (!curl_ready()) {
        CY_LOG("error", "libcurl global initialization failed");
    }
}

HttpResponse CurlHttpTransport::perform(const HttpRequest &request) {
    HttpResponse response;
    if (!curl_ready()) {
        response.error = "libcurl initialization failed";
        return response;
    }
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        response.error = "failed to create curl handle";
        return response;
    }

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto &[name, value] : request.headers) {
        const std::string line = name + ": " + value;
        curl_slist *appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            response.error = "failed to build request headers";
            return response;
        }
        header_list.release();
        header_list.reset(appended);
    }

    const std::string user_agent = std::string("Chaptify/") + CHAPTIFY_VERSION_DISPLAY;
    CURL *h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_TIMEOUT, request.timeout_s);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    if (header_list) {
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    }
    if (!request.basic_user.empty()) {
        curl_easy_setopt(h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(h, CURLOPT_USERNAME, request.basic_user.c_str());
        curl_easy_setopt(h, CURLOPT_PASSWORD, request.basic_password.c_str());
    }
    if (request.method == "POST") {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    CY_LOG("catalog", request.method << " " << request.url);
    const CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        response.error = std::string("libcurl error: ") + curl_easy_strerror(rc);
        CY_LOG("catalog", "request failed: " << response.error);
        return response;
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status_code);
    response.transport_ok = true;
    CY_LOG("catalog", "HTTP " << response.status_code << " bytes=" << response.body.size());
    return response;
}

std::string CurlHttpTransport::escape(const std::string &text) {
    if (!curl_ready()) {
        return text;
    }
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        return text;
    }
    char *escaped = curl_easy_escape(curl.get(), text.c_str(), static_cast<int>(text.size()));
    if (!escaped) {
        return text;
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

}  // namespace chaptify
