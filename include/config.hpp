//
//  config.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "status.hpp"

namespace chaptify {

/// Tunables shared by every pipeline instance of a run.
struct ChaptifyConfig {
    double duration_tolerance = 0.15;       ///< catalog vs. file duration, relative
    int retry_attempts = 3;                 ///< total attempts for transient catalog errors
    uint32_t retry_backoff_ms = 500;        ///< first backoff, doubled per retry
    std::string ffmpeg_path = "ffmpeg";
    uint32_t remux_timeout_ms = 600000;
    int64_t remux_duration_tolerance_ms = 1000;
    std::string market = "US";
    int search_limit = 10;
    bool drop_trailing_track = false;
    uint32_t rate_limit_interval_ms = 100;  ///< minimum spacing between catalog calls
    std::string api_base_url = "https://api.spotify.com/v1";
    std::string token_url = "https://accounts.spotify.com/api/token";
    long http_timeout_s = 30;
};

/**
 * @brief Overlay a JSON object onto `config`.
 *
 * Unknown keys are ignored. Wrong types or out-of-range values fail with ErrorKind::Config and
 * leave `config` unchanged.
 */
Status apply_config_json(const std::string &json_text, ChaptifyConfig &config);

/// Read and apply a JSON config file.
Status load_config_file(const std::string &path, ChaptifyConfig &config);

/// Parse `KEY=VALUE` lines (`#` comments, optional `export`, optional quotes).
Result<std::map<std::string, std::string>> load_env_file(const std::string &path);

/// Catalog credentials: either a ready token or a client id/secret pair.
struct Credentials {
    std::string access_token;
    std::string client_id;
    std::string client_secret;
};

/**
 * @brief Resolve credentials from the process environment, falling back to `env_file` values.
 *
 * CHAPTIFY_ACCESS_TOKEN wins; otherwise CLIENT_ID and CLIENT_SECRET are required.
 */
Result<Credentials> resolve_credentials(const std::map<std::string, std::string> &env_file);

}  // namespace chaptify
