//
//  ffmetadata_writer.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "ffmetadata_writer.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

#include "logging.hpp"

namespace chaptify {

std::string escape_ffmetadata_value(const std::string &value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '=' || c == ';' || c == '#' || c == '\\' || c == '\n') {
            out.push_back('\\');
        }
        if (c == '\r') {
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string build_ffmetadata(const std::vector<ChapterMarker> &markers) {
    std::ostringstream out;
    out << ";FFMETADATA1\n";
    for (const auto &m : markers) {
        out << "\n[CHAPTER]\n"
            << "TIMEBASE=1/1000\n"
            << "START=" << m.start_ms << "\n"
            << "END=" << m.end_ms << "\n"
            << "title=" << escape_ffmetadata_value(m.title) << "\n";
    }
    return out.str();
}

bool write_ffmetadata(const std::string &path, const std::vector<ChapterMarker> &markers) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        CY_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    const std::string text = build_ffmetadata(markers);
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    f.close();
    if (!f) {
        CY_LOG("error", "write failed for " << path);
        return false;
    }
    CY_LOG("remux", "wrote " << markers.size() << " chapter(s) to " << path);
    return true;
}

}  // namespace chaptify
