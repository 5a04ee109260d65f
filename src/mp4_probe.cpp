//
//  mp4_probe.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "mp4_probe.hpp"

#include <cerrno>
#include <fstream>
#include <optional>
#include <system_error>

#include "logging.hpp"

namespace chaptify {

namespace {

constexpr uint64_t kAtomHeaderSize = 8;
constexpr uint64_t kHdlrMinPayload = 12;
constexpr uint64_t kMaxAtomPayload = 512 * 1024 * 1024;  // 512 MB safety bound
constexpr uint64_t kMaxMetaPayload = 64 * 1024 * 1024;   // cover art included

constexpr uint32_t fourcc(char a, char b, char c, char d) {
    return (uint32_t(uint8_t(a)) << 24) | (uint32_t(uint8_t(b)) << 16) |
           (uint32_t(uint8_t(c)) << 8) | uint32_t(uint8_t(d));
}

constexpr uint32_t kMoov = fourcc('m', 'o', 'o', 'v');
constexpr uint32_t kMvhd = fourcc('m', 'v', 'h', 'd');
constexpr uint32_t kTrak = fourcc('t', 'r', 'a', 'k');
constexpr uint32_t kMdia = fourcc('m', 'd', 'i', 'a');
constexpr uint32_t kMdhd = fourcc('m', 'd', 'h', 'd');
constexpr uint32_t kHdlr = fourcc('h', 'd', 'l', 'r');
constexpr uint32_t kUdta = fourcc('u', 'd', 't', 'a');
constexpr uint32_t kMeta = fourcc('m', 'e', 't', 'a');
constexpr uint32_t kIlst = fourcc('i', 'l', 's', 't');
constexpr uint32_t kData = fourcc('d', 'a', 't', 'a');
constexpr uint32_t kSoun = fourcc('s', 'o', 'u', 'n');
// ilst keys; 0xA9 is the '©' prefix byte.
constexpr uint32_t kNam = fourcc('\xA9', 'n', 'a', 'm');
constexpr uint32_t kArt = fourcc('\xA9', 'A', 'R', 'T');
constexpr uint32_t kAart = fourcc('a', 'A', 'R', 'T');
constexpr uint32_t kAlb = fourcc('\xA9', 'a', 'l', 'b');
constexpr uint32_t kUtf8DataType = 1;

std::string fourcc_to_string(uint32_t type) {
    std::string s(4, ' ');
    for (int i = 0; i < 4; ++i) {
        const char c = static_cast<char>((type >> (24 - 8 * i)) & 0xFF);
        s[i] = (c >= 0x20 && c <= 0x7E) ? c : '?';
    }
    return s;
}

bool is_printable_fourcc(uint32_t type) {
    for (int i = 0; i < 4; ++i) {
        const uint8_t c = static_cast<uint8_t>(type >> (24 - 8 * i));
        if ((c < 0x20 || c > 0x7E) && c != 0xA9) {
            return false;
        }
    }
    return true;
}

uint32_t be32(const uint8_t *p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) |
           uint32_t(p[3]);
}

struct TrackInfo {
    uint32_t handler_type = 0;
    uint32_t timescale = 0;
    uint64_t duration = 0;
};

struct ProbeState {
    uint32_t movie_timescale = 0;
    uint64_t movie_duration = 0;
    std::optional<TrackInfo> audio;  // longest sound track
    MetadataSet tags;
    bool have_tags = false;
};

void skip(std::istream &in, uint64_t n) { in.seekg(static_cast<std::streamoff>(n), std::ios::cur); }

// Read atom header: size + type. Size 0 is returned untouched; callers decide what it means.
Mp4AtomInfo read_atom_header(std::istream &in) {
    Mp4AtomInfo info;
    info.offset = static_cast<uint64_t>(in.tellg());
    info.size = read_u32(in);
    info.type = read_u32(in);
    if (info.size == 1) {
        // 64-bit extended size; the header grows by 8 bytes.
        info.size = read_u64(in);
    }
    // Hard sanity: reject absurd payloads early (corrupted headers).
    if (info.size >= kAtomHeaderSize && (info.size - kAtomHeaderSize) > kMaxAtomPayload &&
        info.type != fourcc('m', 'd', 'a', 't')) {
        CY_LOG("warn", "atom " << fourcc_to_string(info.type) << " claims payload "
                               << (info.size - kAtomHeaderSize)
                               << " bytes; exceeds safety bound, skipping");
        info.size = 0;
    }
    return info;
}

uint64_t header_size(std::istream &in, const Mp4AtomInfo &atom) {
    return static_cast<uint64_t>(in.tellg()) - atom.offset;
}

std::vector<uint8_t> read_bytes(std::istream &in, uint64_t size) {
    std::vector<uint8_t> buf(static_cast<size_t>(size));
    in.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(size));
    if (static_cast<uint64_t>(in.gcount()) != size) {
        buf.resize(static_cast<size_t>(in.gcount()));
    }
    return buf;
}

// mvhd and mdhd share the version-dependent timescale/duration layout.
void parse_time_header(std::istream &in, uint32_t &timescale, uint64_t &duration) {
    const int version = in.get();
    skip(in, 3);  // flags
    if (version == 1) {
        read_u64(in);  // creation_time
        read_u64(in);  // modification_time
        timescale = read_u32(in);
        duration = read_u64(in);
    } else {
        read_u32(in);  // creation_time
        read_u32(in);  // modification_time
        timescale = read_u32(in);
        duration = read_u32(in);
    }
}

// Walk the children of the box whose payload spans [in.tellg(), end) and call fn for each. The
// stream is repositioned at every child's end, so fn may consume any part of the payload.
template <typename Fn>
void for_each_child(std::istream &in, uint64_t end, Fn &&fn) {
    while (in && static_cast<uint64_t>(in.tellg()) + kAtomHeaderSize <= end) {
        Mp4AtomInfo child = read_atom_header(in);
        if (!in || child.size < kAtomHeaderSize) {
            CY_LOG("probe", "child header invalid at " << child.offset << "; stopping");
            break;
        }
        if (child.size > end - child.offset) {
            CY_LOG("probe", "child " << fourcc_to_string(child.type) << " overflows parent; clamping "
                                     << child.size << " -> " << (end - child.offset));
            child.size = end - child.offset;
        }
        const uint64_t hdr = header_size(in, child);
        if (child.size < hdr) {
            break;
        }
        fn(child, child.size - hdr);
        const uint64_t next = child.offset + child.size;
        if (next <= child.offset) {
            break;
        }
        in.clear();
        in.seekg(static_cast<std::streamoff>(next));
    }
}

// Items are <key><data: type(4) locale(4) value>; only UTF-8 text values are taken.
MetadataSet parse_ilst(const std::vector<uint8_t> &buf) {
    MetadataSet tags;
    size_t pos = 0;
    while (pos + kAtomHeaderSize <= buf.size()) {
        const uint32_t item_size = be32(&buf[pos]);
        const uint32_t key = be32(&buf[pos + 4]);
        if (item_size < kAtomHeaderSize || pos + item_size > buf.size()) {
            CY_LOG("probe", "ilst item size " << item_size << " invalid at " << pos);
            break;
        }
        const size_t item_end = pos + item_size;
        size_t child = pos + kAtomHeaderSize;
        while (child + 16 <= item_end) {
            const uint32_t data_size = be32(&buf[child]);
            if (data_size < kAtomHeaderSize || child + data_size > item_end) {
                break;
            }
            if (be32(&buf[child + 4]) == kData && data_size >= 16 &&
                (be32(&buf[child + 8]) & 0x00FFFFFF) == kUtf8DataType) {
                std::string value(buf.begin() + static_cast<std::ptrdiff_t>(child + 16),
                                  buf.begin() + static_cast<std::ptrdiff_t>(child + data_size));
                while (!value.empty() && value.back() == '\0') {
                    value.pop_back();
                }
                switch (key) {
                    case kNam:
                        tags.title = std::move(value);
                        break;
                    case kArt:
                        tags.artist = std::move(value);
                        break;
                    case kAart:
                        tags.album_artist = std::move(value);
                        break;
                    case kAlb:
                        tags.album = std::move(value);
                        break;
                    default:
                        break;
                }
                break;
            }
            child += data_size;
        }
        pos = item_end;
    }
    return tags;
}

// meta is a FullBox in ISO files but a plain box in QuickTime files; accept both.
MetadataSet parse_meta(const std::vector<uint8_t> &buf) {
    size_t start = 4;
    if (buf.size() >= kAtomHeaderSize) {
        const uint32_t size = be32(&buf[0]);
        if (size >= kAtomHeaderSize && size <= buf.size() && is_printable_fourcc(be32(&buf[4]))) {
            start = 0;
        }
    }
    size_t pos = start;
    while (pos + kAtomHeaderSize <= buf.size()) {
        const uint32_t size = be32(&buf[pos]);
        const uint32_t type = be32(&buf[pos + 4]);
        if (size < kAtomHeaderSize || pos + size > buf.size()) {
            break;
        }
        if (type == kIlst) {
            return parse_ilst(std::vector<uint8_t>(
                buf.begin() + static_cast<std::ptrdiff_t>(pos + kAtomHeaderSize),
                buf.begin() + static_cast<std::ptrdiff_t>(pos + size)));
        }
        pos += size;
    }
    CY_LOG("probe", "meta without ilst");
    return {};
}

void take_meta(std::istream &in, uint64_t payload, ProbeState &state) {
    if (payload > kMaxMetaPayload) {
        CY_LOG("warn", "meta payload " << payload << " bytes exceeds bound; ignoring tags");
        return;
    }
    auto tags = parse_meta(read_bytes(in, payload));
    if (!state.have_tags && (!tags.title.empty() || !tags.author().empty())) {
        state.tags = std::move(tags);
        state.have_tags = true;
        CY_LOG("probe", "tags title='" << state.tags.title << "' author='"
                                       << state.tags.author() << "'");
    }
}

TrackInfo parse_trak(std::istream &in, uint64_t end) {
    TrackInfo track;
    for_each_child(in, end, [&](const Mp4AtomInfo &child, uint64_t payload) {
        if (child.type != kMdia) {
            return;
        }
        const uint64_t mdia_end = child.offset + child.size;
        for_each_child(in, mdia_end, [&](const Mp4AtomInfo &m, uint64_t mpay) {
            if (m.type == kMdhd) {
                parse_time_header(in, track.timescale, track.duration);
            } else if (m.type == kHdlr && mpay >= kHdlrMinPayload) {
                skip(in, 4 + 4);  // version/flags + pre_defined
                track.handler_type = read_u32(in);
            }
        });
        (void)payload;
    });
    CY_LOG("probe", " trak handler=" << fourcc_to_string(track.handler_type)
                                     << " timescale=" << track.timescale
                                     << " duration=" << track.duration);
    return track;
}

int64_t to_ms(uint64_t duration, uint32_t timescale) {
    if (timescale == 0) {
        return 0;
    }
    return static_cast<int64_t>((duration * 1000 + timescale / 2) / timescale);
}

void parse_moov(std::istream &in, const Mp4AtomInfo &atom, ProbeState &state) {
    const uint64_t end = atom.offset + atom.size;
    for_each_child(in, end, [&](const Mp4AtomInfo &child, uint64_t payload) {
        switch (child.type) {
            case kMvhd:
                parse_time_header(in, state.movie_timescale, state.movie_duration);
                break;
            case kTrak: {
                TrackInfo track = parse_trak(in, child.offset + child.size);
                if (track.handler_type == kSoun && track.timescale != 0 &&
                    (!state.audio || to_ms(track.duration, track.timescale) >
                                         to_ms(state.audio->duration, state.audio->timescale))) {
                    state.audio = track;
                }
                break;
            }
            case kUdta:
                for_each_child(in, child.offset + child.size,
                               [&](const Mp4AtomInfo &u, uint64_t upay) {
                                   if (u.type == kMeta) {
                                       take_meta(in, upay, state);
                                   }
                               });
                break;
            case kMeta:
                take_meta(in, payload, state);
                break;
            default:
                break;
        }
    });
}

}  // namespace

uint32_t read_u32(std::istream &in) {
    uint8_t b[4] = {};
    in.read(reinterpret_cast<char *>(b), 4);
    return be32(b);
}

uint64_t read_u64(std::istream &in) {
    const uint64_t hi = read_u32(in);
    const uint64_t lo = read_u32(in);
    return (hi << 32) | lo;
}

Result<MediaInfo> probe_mp4(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return make_failure<MediaInfo>(make_error(
            ErrorKind::Probe, "cannot open " + path + " (" +
                                  std::generic_category().message(errno) + ")"));
    }
    in.seekg(0, std::ios::end);
    const uint64_t file_size = static_cast<uint64_t>(in.tellg());
    in.seekg(0, std::ios::beg);
    CY_LOG("probe", "probe_mp4: size=" << file_size << " path=" << path);

    ProbeState state;
    bool saw_moov = false;
    while (in.peek() != EOF) {
        Mp4AtomInfo atom = read_atom_header(in);
        if (!in) {
            break;
        }
        if (atom.size == 0 && atom.type != 0) {
            // Last box extends to the end of the file.
            atom.size = file_size - atom.offset;
        }
        // Compared by subtraction: offset + size may wrap for 64-bit sizes.
        if (atom.size < kAtomHeaderSize || atom.size > file_size - atom.offset) {
            CY_LOG("probe", "bad top-level atom " << fourcc_to_string(atom.type)
                                                  << " size=" << atom.size
                                                  << " offset=" << atom.offset);
            break;
        }
        if (atom.type == kMoov) {
            saw_moov = true;
            parse_moov(in, atom, state);
        }
        const uint64_t next = atom.offset + atom.size;
        if (next <= atom.offset) {
            break;
        }
        in.clear();
        in.seekg(static_cast<std::streamoff>(next));
    }

    if (!saw_moov) {
        return make_failure<MediaInfo>(
            make_error(ErrorKind::Probe, path + " is not an MP4/M4B container (no moov)"));
    }
    MediaInfo info;
    info.tags = std::move(state.tags);
    if (state.audio && state.audio->duration > 0) {
        info.timescale = state.audio->timescale;
        info.duration = state.audio->duration;
    } else {
        info.timescale = state.movie_timescale;
        info.duration = state.movie_duration;
        info.from_movie_header = true;
    }
    info.duration_ms = to_ms(info.duration, info.timescale);
    if (info.duration_ms <= 0) {
        return make_failure<MediaInfo>(
            make_error(ErrorKind::Probe, path + " reports no playable duration"));
    }
    CY_LOG("probe", "probe_mp4 done duration=" << info.duration_ms << "ms timescale="
                                               << info.timescale
                                               << " movie_header=" << info.from_movie_header);
    return make_result(std::move(info));
}

#ifdef CHAPTIFY_TESTING
MetadataSet parse_ilst_for_test(const std::vector<uint8_t> &ilst_payload) {
    return parse_ilst(ilst_payload);
}

MetadataSet parse_meta_for_test(const std::vector<uint8_t> &meta_payload) {
    return parse_meta(meta_payload);
}
#endif

}  // namespace chaptify
