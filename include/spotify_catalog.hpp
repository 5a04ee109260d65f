//
//  spotify_catalog.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "catalog.hpp"
#include "http_client.hpp"
#include "status.hpp"

namespace chaptify {

struct SpotifyOptions {
    std::string api_base_url = "https://api.spotify.com/v1";
    std::string market = "US";
    int search_limit = 10;
    long timeout_s = 30;
};

/**
 * @brief Catalog adapter over the Spotify Web API audiobook endpoints.
 *
 * Consumes an already-issued bearer token. Responses are validated into CatalogWork /
 * CatalogTrack records here; anything that does not fit becomes CatalogMalformed.
 */
class SpotifyCatalog : public CatalogClient {
   public:
    SpotifyCatalog(HttpTransport &transport, std::string access_token,
                   SpotifyOptions options = {});

    Result<std::vector<CatalogWork>> search(const IdentityKey &key) override;
    Result<std::vector<CatalogTrack>> fetch_tracks(const std::string &work_id) override;

   private:
    Result<std::string> get_json(const std::string &url);

    HttpTransport &transport_;
    const std::string access_token_;
    const SpotifyOptions options_;
};

/// Map an HTTP response to a catalog error kind (None for 2xx).
ErrorKind classify_catalog_response(const HttpResponse &response);

/**
 * @brief Exchange client credentials for an access token (client-credentials flow).
 */
Result<std::string> fetch_access_token(HttpTransport &transport, const std::string &token_url,
                                       const std::string &client_id,
                                       const std::string &client_secret, long timeout_s = 30);

}  // namespace chaptify
