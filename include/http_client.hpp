//
//  http_client.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <map>
#include <string>

namespace chaptify {

struct HttpRequest {
    std::string method = "GET";  ///< GET or POST
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;  ///< POST body
    // Optional HTTP Basic credentials.
    std::string basic_user;
    std::string basic_password;
    long timeout_s = 30;
};

struct HttpResponse {
    bool transport_ok = false;  ///< false when no HTTP status was received at all
    long status_code = 0;
    std::string body;
    std::string error;  ///< transport error text when !transport_ok
};

/// Blocking HTTP capability; implementations must be safe to call from several threads.
class HttpTransport {
   public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest &request) = 0;
};

/// libcurl-backed transport; one easy handle per request.
class CurlHttpTransport : public HttpTransport {
   public:
    CurlHttpTransport();
    HttpResponse perform(const HttpRequest &request) override;

    /// Percent-encode a query component.
    static std::string escape(const std::string &text);
};

}  // namespace chaptify
