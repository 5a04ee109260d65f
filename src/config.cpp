//
//  config.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include "logging.hpp"

using json = nlohmann::json;

namespace chaptify {

namespace {

// Upper bounds keep the doubling backoff and the millisecond arithmetic far from overflow.
constexpr int64_t kMaxRetryAttempts = 10;
constexpr int64_t kMaxBackoffMs = 60 * 1000;
constexpr int64_t kMaxRemuxToleranceMs = 60 * 60 * 1000;
constexpr int64_t kMaxRateIntervalMs = 60 * 1000;
constexpr int64_t kMaxHttpTimeoutS = 3600;

Status config_error(const std::string &msg) { return make_error(ErrorKind::Config, msg); }

std::string trim(const std::string &s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string lookup(const char *key, const std::map<std::string, std::string> &fallback) {
    if (const char *v = std::getenv(key); v && *v) {
        return v;
    }
    const auto it = fallback.find(key);
    return it == fallback.end() ? std::string() : it->second;
}

// Integer keys are read as int64_t and range-checked before narrowing, so negative or oversized
// values are rejected instead of wrapping.
template <typename T>
Status read_integer(const json &j, const char *key, int64_t lo, int64_t hi, T &dst) {
    const auto it = j.find(key);
    if (it == j.end()) {
        return ok_status();
    }
    if (!it->is_number_integer()) {
        return config_error(std::string(key) + " must be an integer");
    }
    // Unsigned JSON numbers above INT64_MAX are out of range for every key.
    if (it->is_number_unsigned() && it->get<uint64_t>() > static_cast<uint64_t>(hi)) {
        return config_error(std::string(key) + " must be within [" + std::to_string(lo) + ", " +
                            std::to_string(hi) + "]");
    }
    const auto v = it->get<int64_t>();
    if (v < lo || v > hi) {
        return config_error(std::string(key) + " must be within [" + std::to_string(lo) + ", " +
                            std::to_string(hi) + "]");
    }
    dst = static_cast<T>(v);
    return ok_status();
}

}  // namespace

Status apply_config_json(const std::string &json_text, ChaptifyConfig &config) {
    ChaptifyConfig next = config;
    try {
        const json j = json::parse(json_text);
        if (!j.is_object()) {
            return config_error("configuration must be a JSON object");
        }
        next.duration_tolerance = j.value("duration_tolerance", next.duration_tolerance);
        next.ffmpeg_path = j.value("ffmpeg_path", next.ffmpeg_path);
        next.market = j.value("market", next.market);
        next.drop_trailing_track = j.value("drop_trailing_track", next.drop_trailing_track);
        next.api_base_url = j.value("api_base_url", next.api_base_url);
        next.token_url = j.value("token_url", next.token_url);

        const Status checks[] = {
            read_integer(j, "retry_attempts", 1, kMaxRetryAttempts, next.retry_attempts),
            read_integer(j, "retry_backoff_ms", 0, kMaxBackoffMs, next.retry_backoff_ms),
            read_integer(j, "remux_timeout_ms", 1, UINT32_MAX, next.remux_timeout_ms),
            read_integer(j, "remux_duration_tolerance_ms", 0, kMaxRemuxToleranceMs,
                         next.remux_duration_tolerance_ms),
            read_integer(j, "search_limit", 1, 50, next.search_limit),
            read_integer(j, "rate_limit_interval_ms", 0, kMaxRateIntervalMs,
                         next.rate_limit_interval_ms),
            read_integer(j, "http_timeout_s", 1, kMaxHttpTimeoutS, next.http_timeout_s),
        };
        for (const auto &st : checks) {
            if (!st.ok()) {
                return st;
            }
        }
    } catch (const json::exception &e) {
        return config_error(std::string("invalid configuration: ") + e.what());
    }

    if (next.duration_tolerance < 0.0 || next.duration_tolerance > 1.0) {
        return config_error("duration_tolerance must be within [0, 1]");
    }
    if (next.ffmpeg_path.empty() || next.market.empty() || next.api_base_url.empty()) {
        return config_error("ffmpeg_path, market and api_base_url must not be empty");
    }
    config = std::move(next);
    return ok_status();
}

Status load_config_file(const std::string &path, ChaptifyConfig &config) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return config_error("open failed for " + path + " (" +
                            std::generic_category().message(errno) + ")");
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    Status st = apply_config_json(ss.str(), config);
    if (st.ok()) {
        CY_LOG("debug", "loaded configuration from " << path);
    } else {
        st.message = path + ": " + st.message;
    }
    return st;
}

Result<std::map<std::string, std::string>> load_env_file(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return make_failure<std::map<std::string, std::string>>(config_error(
            "open failed for " + path + " (" + std::generic_category().message(errno) + ")"));
    }
    std::map<std::string, std::string> values;
    std::string line;
    int line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            CY_LOG("warn", path << ":" << line_no << ": ignoring line without KEY=VALUE");
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        values[key] = value;
    }
    return make_result(std::move(values));
}

Result<Credentials> resolve_credentials(const std::map<std::string, std::string> &env_file) {
    Credentials c;
    c.access_token = lookup("CHAPTIFY_ACCESS_TOKEN", env_file);
    if (!c.access_token.empty()) {
        return make_result(std::move(c));
    }
    c.client_id = lookup("CLIENT_ID", env_file);
    c.client_secret = lookup("CLIENT_SECRET", env_file);
    if (c.client_id.empty() || c.client_secret.empty()) {
        return make_failure<Credentials>(config_error(
            "set CHAPTIFY_ACCESS_TOKEN, or CLIENT_ID and CLIENT_SECRET (environment or --env-file)"));
    }
    return make_result(std::move(c));
}

}  // namespace chaptify
