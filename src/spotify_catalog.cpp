//
//  spotify_catalog.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "spotify_catalog.hpp"

#include <nlohmann/json.hpp>

#include <utility>

#include "logging.hpp"

using json = nlohmann::json;

namespace chaptify {

namespace {

constexpr int kChapterPageLimit = 50;
// Upper bound on followed "next" links; protects against a server paging forever.
constexpr int kMaxPages = 200;
// About 11.5 days; anything longer is not an audiobook chapter.
constexpr int64_t kMaxTrackDurationMs = 1000000000;

Status catalog_error(const HttpResponse &response, const std::string &what) {
    const ErrorKind kind = classify_catalog_response(response);
    std::string msg = what + ": ";
    if (!response.transport_ok) {
        msg += response.error;
    } else {
        msg += "HTTP " + std::to_string(response.status_code);
    }
    std::vector<std::string> details;
    if (response.transport_ok && !response.body.empty()) {
        details.push_back(response.body.substr(0, 512));
    }
    return make_error(kind, msg, std::move(details));
}

Status malformed(const std::string &what) {
    return make_error(ErrorKind::CatalogMalformed, "unexpected catalog response: " + what);
}

CatalogWork parse_work(const json &item) {
    CatalogWork work;
    work.id = item.at("id").get<std::string>();
    work.title = item.at("name").get<std::string>();
    for (const auto &a : item.at("authors")) {
        work.authors.push_back(a.at("name").get<std::string>());
    }
    for (size_t i = 0; i < work.authors.size(); ++i) {
        if (i > 0) {
            work.author += ", ";
        }
        work.author += work.authors[i];
    }
    return work;
}

}  // namespace

ErrorKind classify_catalog_response(const HttpResponse &response) {
    if (!response.transport_ok) {
        return ErrorKind::CatalogTransient;
    }
    const long code = response.status_code;
    if (code >= 200 && code < 300) {
        return ErrorKind::None;
    }
    if (code == 401 || code == 403) {
        return ErrorKind::CatalogUnauthorized;
    }
    if (code == 404) {
        return ErrorKind::CatalogNotFound;
    }
    if (code == 408 || code == 429 || code >= 500) {
        return ErrorKind::CatalogTransient;
    }
    return ErrorKind::CatalogMalformed;
}

SpotifyCatalog::SpotifyCatalog(HttpTransport &transport, std::string access_token,
                               SpotifyOptions options)
    : transport_(transport), access_token_(std::move(access_token)), options_(std::move(options)) {}

Result<std::string> SpotifyCatalog::get_json(const std::string &url) {
    HttpRequest req;
    req.url = url;
    req.timeout_s = options_.timeout_s;
    req.headers["Authorization"] = "Bearer " + access_token_;
    req.headers["Accept"] = "application/json";
    HttpResponse resp = transport_.perform(req);
    if (classify_catalog_response(resp) != ErrorKind::None) {
        return make_failure<std::string>(catalog_error(resp, "GET " + url));
    }
    return make_result(std::move(resp.body));
}

Result<std::vector<CatalogWork>> SpotifyCatalog::search(const IdentityKey &key) {
    const std::string query = key.title + " " + key.author;
    const std::string url = options_.api_base_url + "/search?q=" +
                            CurlHttpTransport::escape(query) +
                            "&type=audiobook&limit=" + std::to_string(options_.search_limit) +
                            "&market=" + CurlHttpTransport::escape(options_.market);
    auto body = get_json(url);
    if (!body.ok()) {
        return make_failure<std::vector<CatalogWork>>(std::move(body.status));
    }

    std::vector<CatalogWork> works;
    try {
        const json j = json::parse(body.value);
        const json &items = j.at("audiobooks").at("items");
        if (!items.is_array()) {
            return make_failure<std::vector<CatalogWork>>(malformed("audiobooks.items"));
        }
        for (const auto &item : items) {
            // Spotify pads unavailable results with nulls.
            if (item.is_null()) {
                continue;
            }
            works.push_back(parse_work(item));
        }
    } catch (const json::exception &e) {
        return make_failure<std::vector<CatalogWork>>(malformed(std::string("search: ") + e.what()));
    }
    CY_LOG("catalog", "search '" << query << "' -> " << works.size() << " candidate(s)");
    return make_result(std::move(works));
}

Result<std::vector<CatalogTrack>> SpotifyCatalog::fetch_tracks(const std::string &work_id) {
    std::vector<CatalogTrack> tracks;
    std::string url = options_.api_base_url + "/audiobooks/" + CurlHttpTransport::escape(work_id) +
                      "/chapters?limit=" + std::to_string(kChapterPageLimit) +
                      "&market=" + CurlHttpTransport::escape(options_.market);
    int pages = 0;
    while (!url.empty()) {
        if (++pages > kMaxPages) {
            return make_failure<std::vector<CatalogTrack>>(
                malformed("chapter listing exceeds " + std::to_string(kMaxPages) + " pages"));
        }
        auto body = get_json(url);
        if (!body.ok()) {
            return make_failure<std::vector<CatalogTrack>>(std::move(body.status));
        }
        try {
            const json j = json::parse(body.value);
            for (const auto &item : j.at("items")) {
                if (item.is_null()) {
                    continue;
                }
                CatalogTrack t;
                t.index = static_cast<uint32_t>(tracks.size());
                t.name = item.value("name", std::string());
                t.nominal_duration_ms = item.at("duration_ms").get<int64_t>();
                if (t.nominal_duration_ms < 0) {
                    return make_failure<std::vector<CatalogTrack>>(
                        malformed("negative duration_ms for track " + std::to_string(t.index)));
                }
                if (t.nominal_duration_ms > kMaxTrackDurationMs) {
                    return make_failure<std::vector<CatalogTrack>>(
                        malformed("implausible duration_ms " +
                                  std::to_string(t.nominal_duration_ms) + " for track " +
                                  std::to_string(t.index)));
                }
                tracks.push_back(std::move(t));
            }
            const auto next = j.find("next");
            url = (next != j.end() && next->is_string()) ? next->get<std::string>() : "";
        } catch (const json::exception &e) {
            return make_failure<std::vector<CatalogTrack>>(
                malformed(std::string("chapters: ") + e.what()));
        }
        if (!url.empty()) {
            CY_LOG("catalog", "fetching next chapter page: " << url);
        }
    }
    CY_LOG("catalog", "work " << work_id << " -> " << tracks.size() << " track(s)");
    return make_result(std::move(tracks));
}

Result<std::string> fetch_access_token(HttpTransport &transport, const std::string &token_url,
                                       const std::string &client_id,
                                       const std::string &client_secret, long timeout_s) {
    HttpRequest req;
    req.method = "POST";
    req.url = token_url;
    req.timeout_s = timeout_s;
    req.headers["Content-Type"] = "application/x-www-form-urlencoded";
    req.body = "grant_type=client_credentials";
    req.basic_user = client_id;
    req.basic_password = client_secret;
    HttpResponse resp = transport.perform(req);
    if (classify_catalog_response(resp) != ErrorKind::None) {
        return make_failure<std::string>(catalog_error(resp, "token request"));
    }
    try {
        const json j = json::parse(resp.body);
        std::string token = j.at("access_token").get<std::string>();
        if (token.empty()) {
            return make_failure<std::string>(malformed("empty access_token"));
        }
        return make_result(std::move(token));
    } catch (const json::exception &e) {
        return make_failure<std::string>(malformed(std::string("token: ") + e.what()));
    }
}

}  // namespace chaptify
