//
//  main.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include <algorithm>
#include <cctype>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "catalog.hpp"
#include "chaptify.hpp"
#include "chaptify_version.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "logging.hpp"
#include "mp4_probe.hpp"
#include "remux_invoker.hpp"
#include "spotify_catalog.hpp"

namespace {

struct CliOptions {
    std::vector<std::string> inputs;
    std::string output_path;
    std::string output_dir;
    std::string config_path;
    std::string env_file;
    std::string ffmpeg_path;
    bool dry_run = false;
    bool drop_last = false;
    unsigned jobs = 1;
};

void print_usage() {
    std::cerr << "Chaptify " << CHAPTIFY_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2026 Till Toenshoff\n\n"
              << "usage:\n"
              << "  chaptify [chapterize] <book.m4b>... [options]\n"
              << "Options:\n"
              << "  -o, --output FILE     Write the chaptered copy to FILE (single input only).\n"
              << "  --output-dir DIR      Write <stem>_chapterized<ext> into DIR.\n"
              << "  -i LIST               Read input paths from LIST, one per line.\n"
              << "  -d DIR                Process every .m4b file in DIR.\n"
              << "  -j, --jobs N          Process up to N files in parallel (default: 1).\n"
              << "  --dry-run             Print the resolved chapter file; do not remux.\n"
              << "  --drop-last           Ignore the catalog's final track (trailers, credits).\n"
              << "  --config FILE         JSON configuration overrides.\n"
              << "  --env-file FILE       KEY=VALUE credentials (CLIENT_ID, CLIENT_SECRET,\n"
              << "                        CHAPTIFY_ACCESS_TOKEN); the environment wins.\n"
              << "  --ffmpeg PATH         ffmpeg executable (default: ffmpeg on PATH).\n"
              << "  --log-level LEVEL     error|warn|info|debug (default: info).\n"
              << "  -v, --version         Print the version.\n";
}

bool read_list_file(const std::string &path, std::vector<std::string> &out) {
    std::ifstream f(path);
    if (!f.is_open()) {
        CY_LOG("error", "the file '" << path << "' does not exist");
        return false;
    }
    std::string line;
    while (std::getline(f, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
            line.pop_back();
        }
        if (!line.empty()) {
            out.push_back(line);
        }
    }
    return true;
}

bool collect_directory(const std::string &dir, std::vector<std::string> &out) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        CY_LOG("error", "the directory '" << dir << "' does not exist");
        return false;
    }
    std::vector<std::string> found;
    for (const auto &entry : std::filesystem::directory_iterator(dir, ec)) {
        auto ext = entry.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (entry.is_regular_file() && ext == ".m4b") {
            found.push_back(entry.path().string());
        }
    }
    if (ec) {
        CY_LOG("error", "cannot list '" << dir << "': " << ec.message());
        return false;
    }
    std::sort(found.begin(), found.end());
    out.insert(out.end(), found.begin(), found.end());
    return true;
}

bool already_chapterized(const std::string &path) {
    const std::string stem = std::filesystem::path(path).stem().string();
    const std::string marker = "_chapterized";
    return stem.size() >= marker.size() &&
           stem.compare(stem.size() - marker.size(), marker.size(), marker) == 0;
}

std::string output_for(const CliOptions &cli, const std::string &input) {
    if (!cli.output_path.empty()) {
        return cli.output_path;
    }
    if (!cli.output_dir.empty()) {
        const std::filesystem::path in(input);
        return (std::filesystem::path(cli.output_dir) /
                (in.stem().string() + "_chapterized" + in.extension().string()))
            .string();
    }
    return {};
}

// Returns 0 on success, 2 on usage errors.
int parse_args(int argc, char **argv, CliOptions &cli) {
    std::vector<std::string> list_files;
    std::vector<std::string> dirs;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string &dst) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            dst = argv[++i];
            return true;
        };
        std::string v;
        if (arg == "-o" || arg == "--output") {
            if (!value(cli.output_path)) return 2;
        } else if (arg == "--output-dir" || arg == "-p") {
            if (!value(cli.output_dir)) return 2;
        } else if (arg == "-i") {
            if (!value(v)) return 2;
            list_files.push_back(v);
        } else if (arg == "-d" || arg == "--dir") {
            if (!value(v)) return 2;
            dirs.push_back(v);
        } else if (arg == "-j" || arg == "--jobs") {
            if (!value(v)) return 2;
            try {
                cli.jobs = static_cast<unsigned>(std::max(1, std::stoi(v)));
            } catch (const std::exception &) {
                std::cerr << "Invalid job count: " << v << "\n";
                return 2;
            }
        } else if (arg == "--dry-run") {
            cli.dry_run = true;
        } else if (arg == "--drop-last") {
            cli.drop_last = true;
        } else if (arg == "--config") {
            if (!value(cli.config_path)) return 2;
        } else if (arg == "--env-file") {
            if (!value(cli.env_file)) return 2;
        } else if (arg == "--ffmpeg") {
            if (!value(cli.ffmpeg_path)) return 2;
        } else if (arg == "--log-level") {
            if (!value(v)) return 2;
            chaptify::set_log_verbosity(chaptify::parse_log_verbosity(v));
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 2;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            cli.inputs.push_back(arg);
        }
    }
    if (!cli.inputs.empty() && cli.inputs.front() == "chapterize") {
        cli.inputs.erase(cli.inputs.begin());
    }
    for (const auto &l : list_files) {
        if (!read_list_file(l, cli.inputs)) return 2;
    }
    for (const auto &d : dirs) {
        if (!collect_directory(d, cli.inputs)) return 2;
    }
    if (cli.inputs.empty()) {
        print_usage();
        return 2;
    }
    if (!cli.output_path.empty() && cli.inputs.size() > 1) {
        std::cerr << "The -o/--output option can only be used with a single input file.\n";
        return 2;
    }
    return 0;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "Chaptify " << CHAPTIFY_VERSION_DISPLAY << "\n";
        return 0;
    }

    CliOptions cli;
    if (int rc = parse_args(argc, argv, cli); rc != 0) {
        return rc;
    }

    chaptify::ChaptifyConfig config;
    if (!cli.config_path.empty()) {
        auto st = chaptify::load_config_file(cli.config_path, config);
        if (!st.ok()) {
            CY_LOG("error", chaptify::describe(st));
            return 1;
        }
    }
    if (cli.drop_last) {
        config.drop_trailing_track = true;
    }
    if (!cli.ffmpeg_path.empty()) {
        config.ffmpeg_path = cli.ffmpeg_path;
    }

    std::map<std::string, std::string> env_values;
    if (!cli.env_file.empty()) {
        auto env = chaptify::load_env_file(cli.env_file);
        if (!env.ok()) {
            CY_LOG("error", chaptify::describe(env.status));
            return 1;
        }
        env_values = std::move(env.value);
    }
    auto creds = chaptify::resolve_credentials(env_values);
    if (!creds.ok()) {
        CY_LOG("error", chaptify::describe(creds.status));
        return 1;
    }

    chaptify::CurlHttpTransport transport;
    std::string token = creds.value.access_token;
    if (token.empty()) {
        auto issued = chaptify::fetch_access_token(transport, config.token_url,
                                                   creds.value.client_id,
                                                   creds.value.client_secret,
                                                   config.http_timeout_s);
        if (!issued.ok()) {
            CY_LOG("error", chaptify::describe(issued.status));
            return 1;
        }
        token = std::move(issued.value);
    }

    chaptify::SpotifyOptions spotify;
    spotify.api_base_url = config.api_base_url;
    spotify.market = config.market;
    spotify.search_limit = config.search_limit;
    spotify.timeout_s = config.http_timeout_s;
    chaptify::SpotifyCatalog catalog(transport, token, spotify);
    chaptify::RateLimitedCatalog limited(
        catalog, std::chrono::milliseconds(config.rate_limit_interval_ms));

    chaptify::Mp4Inspector inspector;
    chaptify::RemuxConfig remux;
    remux.ffmpeg_path = config.ffmpeg_path;
    remux.timeout = std::chrono::milliseconds(config.remux_timeout_ms);
    remux.duration_tolerance_ms = config.remux_duration_tolerance_ms;
    chaptify::FfmpegChapterWriter writer(remux, inspector);
    const chaptify::ChapterPipeline pipeline(limited, inspector, writer, config);

    std::atomic<size_t> next{0};
    std::atomic<int> failures{0};
    std::mutex out_mutex;
    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < cli.inputs.size(); i = next.fetch_add(1)) {
            const std::string &input = cli.inputs[i];
            if (already_chapterized(input)) {
                CY_LOG("info", "skipping already chapterized file: " << input);
                continue;
            }
            chaptify::PipelineOptions opts;
            opts.output_path = output_for(cli, input);
            opts.dry_run = cli.dry_run;
            const auto res = pipeline.process(input, opts);
            std::lock_guard<std::mutex> lock(out_mutex);
            if (!res.status.ok()) {
                ++failures;
                std::cerr << input << ": " << chaptify::describe(res.status) << "\n";
                for (const auto &d : res.status.details) {
                    std::cerr << "    " << d << "\n";
                }
                continue;
            }
            if (cli.dry_run) {
                std::cout << "# " << input << " -> " << res.work.title << " by "
                          << res.work.author << "\n"
                          << res.control_text << "\n";
            } else {
                std::cout << "Chapters added (" << res.markers.size() << "): "
                          << (opts.output_path.empty() ? input : opts.output_path) << "\n";
            }
        }
    };

    const unsigned jobs =
        std::min<unsigned>(cli.jobs, static_cast<unsigned>(cli.inputs.size()));
    std::vector<std::thread> threads;
    for (unsigned j = 1; j < jobs; ++j) {
        threads.emplace_back(worker);
    }
    worker();
    for (auto &t : threads) {
        t.join();
    }
    return failures.load() == 0 ? 0 : 1;
}
