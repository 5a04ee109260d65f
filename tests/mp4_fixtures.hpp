//
//  mp4_fixtures.hpp
//  Chaptify
//
//  Test-only helpers to build tiny MP4/M4B files for probe and remux tests.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <string>
#include <vector>

namespace mp4_fixtures {

constexpr uint32_t fcc(const char (&s)[5]) {
    return (uint32_t(uint8_t(s[0])) << 24) | (uint32_t(uint8_t(s[1])) << 16) |
           (uint32_t(uint8_t(s[2])) << 8) | uint32_t(uint8_t(s[3]));
}

inline void write_u32_be(std::vector<uint8_t> &buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void write_u64_be(std::vector<uint8_t> &buf, uint64_t v) {
    write_u32_be(buf, static_cast<uint32_t>((v >> 32) & 0xFFFFFFFF));
    write_u32_be(buf, static_cast<uint32_t>(v & 0xFFFFFFFF));
}

inline void append_atom(std::vector<uint8_t> &buf, uint32_t type,
                        const std::vector<uint8_t> &payload) {
    uint32_t size = static_cast<uint32_t>(payload.size() + 8);
    write_u32_be(buf, size);
    write_u32_be(buf, type);
    buf.insert(buf.end(), payload.begin(), payload.end());
}

inline std::vector<uint8_t> atom(uint32_t type, const std::vector<uint8_t> &payload) {
    std::vector<uint8_t> out;
    append_atom(out, type, payload);
    return out;
}

inline std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> parts) {
    std::vector<uint8_t> out;
    for (const auto &p : parts) {
        out.insert(out.end(), p.begin(), p.end());
    }
    return out;
}

inline std::vector<uint8_t> make_mdhd(uint32_t timescale, uint32_t duration) {
    std::vector<uint8_t> p;
    p.reserve(24);
    p.push_back(0); p.push_back(0); p.push_back(0); p.push_back(0);  // version/flags
    write_u32_be(p, 0);      // creation
    write_u32_be(p, 0);      // modification
    write_u32_be(p, timescale);
    write_u32_be(p, duration);
    write_u32_be(p, 0);      // language + pre-defined
    return p;
}

inline std::vector<uint8_t> make_mdhd_v1(uint32_t timescale, uint64_t duration) {
    std::vector<uint8_t> p;
    p.push_back(1); p.push_back(0); p.push_back(0); p.push_back(0);  // version 1
    write_u64_be(p, 0);
    write_u64_be(p, 0);
    write_u32_be(p, timescale);
    write_u64_be(p, duration);
    write_u32_be(p, 0);
    return p;
}

inline std::vector<uint8_t> make_mvhd(uint32_t timescale, uint32_t duration) {
    std::vector<uint8_t> p;
    p.push_back(0); p.push_back(0); p.push_back(0); p.push_back(0);  // version/flags
    write_u32_be(p, 0);  // creation
    write_u32_be(p, 0);  // modification
    write_u32_be(p, timescale);
    write_u32_be(p, duration);
    p.resize(p.size() + 80, 0);  // rate, volume, matrix, next_track_ID
    return p;
}

inline std::vector<uint8_t> make_hdlr(uint32_t handler_type) {
    std::vector<uint8_t> p;
    p.reserve(25);
    p.push_back(0); p.push_back(0); p.push_back(0); p.push_back(0);  // version/flags
    write_u32_be(p, 0);       // pre_defined
    write_u32_be(p, handler_type);
    write_u32_be(p, 0);       // reserved[0]
    write_u32_be(p, 0);       // reserved[1]
    write_u32_be(p, 0);       // reserved[2]
    p.push_back(0);           // empty name
    return p;
}

inline std::vector<uint8_t> make_trak(uint32_t handler_type, uint32_t timescale,
                                      uint32_t duration) {
    return atom(fcc("trak"),
                atom(fcc("mdia"), concat({atom(fcc("mdhd"), make_mdhd(timescale, duration)),
                                          atom(fcc("hdlr"), make_hdlr(handler_type))})));
}

// ilst item: <key><data type=1 (UTF-8)><value>.
inline std::vector<uint8_t> make_ilst_item(uint32_t key, const std::string &value) {
    std::vector<uint8_t> data;
    write_u32_be(data, 1);  // type indicator
    write_u32_be(data, 0);  // locale
    data.insert(data.end(), value.begin(), value.end());
    return atom(key, atom(fcc("data"), data));
}

inline std::vector<uint8_t> make_ilst(const std::string &title, const std::string &artist,
                                      const std::string &album_artist = {}) {
    std::vector<uint8_t> items;
    if (!title.empty()) {
        auto i = make_ilst_item(fcc("\xA9nam"), title);
        items.insert(items.end(), i.begin(), i.end());
    }
    if (!artist.empty()) {
        auto i = make_ilst_item(fcc("\xA9" "ART"), artist);
        items.insert(items.end(), i.begin(), i.end());
    }
    if (!album_artist.empty()) {
        auto i = make_ilst_item(fcc("aART"), album_artist);
        items.insert(items.end(), i.begin(), i.end());
    }
    return atom(fcc("ilst"), items);
}

// ISO-style meta: full-box header, then hdlr 'mdir' and ilst.
inline std::vector<uint8_t> make_meta_payload(const std::vector<uint8_t> &ilst,
                                              bool full_box = true) {
    std::vector<uint8_t> p;
    if (full_box) {
        write_u32_be(p, 0);
    }
    auto hdlr = atom(fcc("hdlr"), make_hdlr(fcc("mdir")));
    p.insert(p.end(), hdlr.begin(), hdlr.end());
    p.insert(p.end(), ilst.begin(), ilst.end());
    return p;
}

struct BookFixture {
    uint32_t audio_timescale = 44100;
    uint32_t audio_duration = 44100 * 60;  // one minute
    uint32_t movie_timescale = 1000;
    uint32_t movie_duration = 60000;
    bool with_audio_track = true;
    std::string title;
    std::string artist;
    std::string album_artist;
};

inline std::vector<uint8_t> make_book(const BookFixture &f) {
    std::vector<uint8_t> ftyp;
    write_u32_be(ftyp, fcc("M4B "));
    write_u32_be(ftyp, 0);
    write_u32_be(ftyp, fcc("isom"));

    std::vector<uint8_t> moov = atom(fcc("mvhd"), make_mvhd(f.movie_timescale, f.movie_duration));
    if (f.with_audio_track) {
        auto trak = make_trak(fcc("soun"), f.audio_timescale, f.audio_duration);
        moov.insert(moov.end(), trak.begin(), trak.end());
    }
    if (!f.title.empty() || !f.artist.empty() || !f.album_artist.empty()) {
        auto udta = atom(fcc("udta"),
                         atom(fcc("meta"),
                              make_meta_payload(make_ilst(f.title, f.artist, f.album_artist))));
        moov.insert(moov.end(), udta.begin(), udta.end());
    }
    std::vector<uint8_t> mdat(256, 0x5A);
    return concat({atom(fcc("ftyp"), ftyp), atom(fcc("moov"), moov), atom(fcc("mdat"), mdat)});
}

inline bool write_file(const std::filesystem::path &path, const std::vector<uint8_t> &bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out.write(reinterpret_cast<const char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

inline std::vector<uint8_t> read_file(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)),
                                std::istreambuf_iterator<char>());
}

}  // namespace mp4_fixtures
