// Exercises the remux step against stand-in tools: failure, timeout, empty output, success.
// The original file must keep its bytes and modification time whenever the step fails.
#include <unistd.h>

#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "ffmetadata_writer.hpp"
#include "logging.hpp"
#include "mp4_fixtures.hpp"
#include "mp4_probe.hpp"
#include "process_runner.hpp"
#include "remux_invoker.hpp"

using namespace chaptify;
using namespace mp4_fixtures;
namespace fs = std::filesystem;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[remux_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool write_script(const fs::path &path, const std::string &body) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out << "#!/bin/sh\n" << body;
    out.close();
    std::error_code ec;
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
    return !ec;
}

// Copies the first -i input to the last argument and keeps the chapter file for inspection.
std::string copy_tool_body(const fs::path &capture) {
    return "in=''; ctrl=''; prev=''; out=''\n"
           "for a in \"$@\"; do\n"
           "  if [ \"$prev\" = '-i' ]; then\n"
           "    if [ -z \"$in\" ]; then in=\"$a\"; else ctrl=\"$a\"; fi\n"
           "  fi\n"
           "  prev=\"$a\"; out=\"$a\"\n"
           "done\n"
           "cp \"$ctrl\" '" + capture.string() + "' || exit 3\n"
           "cp \"$in\" \"$out\"\n";
}

std::vector<ChapterMarker> sample_markers() {
    return {{0, "Opening", 0, 20000}, {1, "Chapter 1", 20000, 60000}};
}

bool no_temporaries(const fs::path &dir) {
    for (const auto &entry : fs::directory_iterator(dir)) {
        if (entry.path().filename().string().find(".chaptify-") != std::string::npos) {
            std::cerr << "[remux_unit] leftover temporary " << entry.path() << "\n";
            return false;
        }
    }
    return true;
}

struct Workspace {
    fs::path dir;
    fs::path book;
    std::vector<uint8_t> original;
    fs::file_time_type mtime;

    Workspace() {
        dir = fs::temp_directory_path() / ("chaptify_remux_unit_" + std::to_string(::getpid()));
        fs::remove_all(dir);
        fs::create_directories(dir);
        book = dir / "Diana Wynne Jones - Howl's Moving Castle.m4b";
        BookFixture f;
        f.movie_duration = 60000;
        f.audio_duration = 44100 * 60;
        original = make_book(f);
        write_file(book, original);
        mtime = fs::last_write_time(book);
    }
    ~Workspace() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    bool original_untouched() const {
        return read_file(book) == original && fs::last_write_time(book) == mtime;
    }
};

RemuxRequest request_for(const Workspace &ws, const std::string &output = {}) {
    RemuxRequest req;
    req.input_path = ws.book.string();
    req.output_path = output;
    req.markers = sample_markers();
    req.expected_duration_ms = 60000;
    return req;
}

bool test_command_line() {
    const auto argv = build_ffmpeg_command("ffmpeg", "in.m4b", "ch.txt", "out.m4b");
    bool ok = check(argv.front() == "ffmpeg" && argv.back() == "out.m4b", "tool first, output last");
    auto has_pair = [&](const std::string &a, const std::string &b) {
        for (size_t i = 0; i + 1 < argv.size(); ++i) {
            if (argv[i] == a && argv[i + 1] == b) {
                return true;
            }
        }
        return false;
    };
    ok &= check(has_pair("-i", "in.m4b") && has_pair("-i", "ch.txt"), "both inputs");
    ok &= check(has_pair("-f", "ffmetadata"), "control file format forced");
    ok &= check(has_pair("-c", "copy"), "stream copy only");
    ok &= check(has_pair("-map_chapters", "1"), "chapters from the control file");
    ok &= check(has_pair("-map_metadata", "0"), "tags from the source");

    const auto tmp = temp_sibling_path("/books/a.m4b", ".m4b");
    ok &= check(tmp.parent_path() == fs::path("/books"), "temporary is a sibling");
    ok &= check(tmp.filename().string().rfind(".a.chaptify-", 0) == 0 && tmp.extension() == ".m4b",
                "temporary is hidden and keeps the extension");
    ok &= check(temp_sibling_path("/books/a.m4b", ".m4b") != tmp, "temporaries are unique");
    return ok;
}

bool test_process_runner() {
    auto r = run_process({"/bin/sh", "-c", "echo oops >&2; exit 4"}, std::chrono::seconds(10));
    bool ok = check(r.outcome == ProcessOutcome::Exited && r.exit_code == 4, "exit code kept");
    ok &= check(r.stderr_tail.find("oops") != std::string::npos, "stderr captured");

    r = run_process({"/nonexistent/chaptify-tool"}, std::chrono::seconds(10));
    ok &= check(r.outcome == ProcessOutcome::SpawnFailed, "missing executable");

    r = run_process({"/bin/sh", "-c", "exec sleep 30"}, std::chrono::milliseconds(200));
    ok &= check(r.outcome == ProcessOutcome::TimedOut, "timeout terminates the child");
    ok &= check(r.elapsed < std::chrono::seconds(10), "timeout returns promptly");

    // With SIGCHLD ignored the kernel reaps children itself and waitpid reports ECHILD.
    std::signal(SIGCHLD, SIG_IGN);
    const auto lost_failure = run_process({"/bin/sh", "-c", "exit 3"}, std::chrono::seconds(10));
    const auto lost_success = run_process({"/bin/sh", "-c", "exit 0"}, std::chrono::seconds(10));
    std::signal(SIGCHLD, SIG_DFL);
    ok &= check(lost_failure.outcome == ProcessOutcome::StatusLost && !lost_failure.succeeded(),
                "auto-reaped failing child is not reported as success");
    ok &= check(lost_success.outcome == ProcessOutcome::StatusLost && !lost_success.succeeded(),
                "unknown exit status is never taken as success");
    return ok;
}

bool test_tool_failure_preserves_original() {
    Workspace ws;
    const auto tool = ws.dir / "failing-ffmpeg";
    bool ok = check(write_script(tool, "echo 'Invalid data found when processing input' >&2\n"
                                       "exit 1\n"),
                    "script written");
    Mp4Inspector inspector;
    RemuxConfig cfg;
    cfg.ffmpeg_path = tool.string();
    FfmpegChapterWriter writer(cfg, inspector);
    Status st = writer.write(request_for(ws));
    ok &= check(!st.ok() && st.kind == ErrorKind::Remux, "non-zero exit is a RemuxError");
    ok &= check(!st.details.empty() && st.details[0].find("Invalid data") != std::string::npos,
                "tool stderr surfaced");
    ok &= check(ws.original_untouched(), "original bytes and mtime unchanged");
    ok &= check(no_temporaries(ws.dir), "temporaries removed");
    return ok;
}

bool test_timeout_preserves_original() {
    Workspace ws;
    const auto tool = ws.dir / "hanging-ffmpeg";
    bool ok = check(write_script(tool, "exec sleep 30\n"), "script written");
    Mp4Inspector inspector;
    RemuxConfig cfg;
    cfg.ffmpeg_path = tool.string();
    cfg.timeout = std::chrono::milliseconds(300);
    FfmpegChapterWriter writer(cfg, inspector);
    Status st = writer.write(request_for(ws));
    ok &= check(!st.ok() && st.kind == ErrorKind::Remux, "timeout is a RemuxError");
    ok &= check(st.message.find("timed out") != std::string::npos, "timeout named in message");
    ok &= check(ws.original_untouched(), "original unchanged after timeout");
    ok &= check(no_temporaries(ws.dir), "temporaries removed after timeout");
    return ok;
}

bool test_invalid_output_preserves_original() {
    Workspace ws;
    const auto tool = ws.dir / "empty-ffmpeg";
    bool ok = check(write_script(tool, "for a in \"$@\"; do out=\"$a\"; done\n: > \"$out\"\n"),
                    "script written");
    Mp4Inspector inspector;
    RemuxConfig cfg;
    cfg.ffmpeg_path = tool.string();
    FfmpegChapterWriter writer(cfg, inspector);
    Status st = writer.write(request_for(ws));
    ok &= check(!st.ok() && st.kind == ErrorKind::Remux, "empty output is a RemuxError");
    ok &= check(ws.original_untouched(), "original unchanged after empty output");
    ok &= check(no_temporaries(ws.dir), "empty output removed");

    // Output of the wrong length: the tool writes a 10 second file.
    const auto short_book = ws.dir / "short.bin";
    BookFixture f;
    f.audio_duration = 44100 * 10;
    write_file(short_book, make_book(f));
    const auto truncating = ws.dir / "truncating-ffmpeg";
    ok &= check(write_script(truncating, "for a in \"$@\"; do out=\"$a\"; done\ncp '" +
                                             short_book.string() + "' \"$out\"\n"),
                "script written");
    cfg.ffmpeg_path = truncating.string();
    FfmpegChapterWriter truncating_writer(cfg, inspector);
    st = truncating_writer.write(request_for(ws));
    ok &= check(!st.ok() && st.kind == ErrorKind::Remux, "duration drift is a RemuxError");
    ok &= check(st.message.find("differs") != std::string::npos, "drift named in message");
    ok &= check(ws.original_untouched(), "original unchanged after drift");
    ok &= check(no_temporaries(ws.dir), "drifting output removed");
    return ok;
}

bool test_success_in_place_and_to_output() {
    Workspace ws;
    const auto capture = ws.dir / "captured.txt";
    const auto tool = ws.dir / "copy-ffmpeg";
    bool ok = check(write_script(tool, copy_tool_body(capture)), "script written");
    Mp4Inspector inspector;
    RemuxConfig cfg;
    cfg.ffmpeg_path = tool.string();
    FfmpegChapterWriter writer(cfg, inspector);

    Status st = writer.write(request_for(ws));
    ok &= check(st.ok(), "in-place write succeeds: " + describe(st));
    ok &= check(read_file(ws.book) == ws.original, "replaced file carries the tool output");
    {
        std::ifstream f(capture);
        std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        ok &= check(text == build_ffmetadata(sample_markers()),
                    "tool received the rendered chapter file");
    }
    ok &= check(no_temporaries(ws.dir), "no temporaries after success");

    const auto out = ws.dir / "Howl_chapterized.m4b";
    st = writer.write(request_for(ws, out.string()));
    ok &= check(st.ok(), "write to separate output succeeds");
    ok &= check(fs::exists(out) && read_file(out) == ws.original, "output written");
    ok &= check(no_temporaries(ws.dir), "no temporaries after separate output");

    RemuxRequest missing = request_for(ws);
    missing.input_path = (ws.dir / "missing.m4b").string();
    st = writer.write(missing);
    ok &= check(!st.ok() && st.kind == ErrorKind::Remux, "missing input is a RemuxError");
    return ok;
}

// Fails like ffmpeg does when the output name carries no container extension.
std::string extension_checking_tool_body() {
    return "in=''; prev=''; out=''\n"
           "for a in \"$@\"; do\n"
           "  if [ \"$prev\" = '-i' ] && [ -z \"$in\" ]; then in=\"$a\"; fi\n"
           "  prev=\"$a\"; out=\"$a\"\n"
           "done\n"
           "case \"$out\" in\n"
           "  *.m4b) ;;\n"
           "  *) echo \"Unable to choose an output format for '$out'\" >&2; exit 1 ;;\n"
           "esac\n"
           "cp \"$in\" \"$out\"\n";
}

bool test_output_without_extension() {
    Workspace ws;
    const auto tool = ws.dir / "picky-ffmpeg";
    bool ok = check(write_script(tool, extension_checking_tool_body()), "script written");
    Mp4Inspector inspector;
    RemuxConfig cfg;
    cfg.ffmpeg_path = tool.string();
    FfmpegChapterWriter writer(cfg, inspector);

    const auto bare_out = ws.dir / "Howl_chapterized";
    Status st = writer.write(request_for(ws, bare_out.string()));
    ok &= check(st.ok(), "bare output name borrows the input's container: " + describe(st));
    ok &= check(fs::exists(bare_out) && read_file(bare_out) == ws.original,
                "bare output written");
    ok &= check(ws.original_untouched(), "input untouched when writing elsewhere");

    const auto bare_in = ws.dir / "Howl";
    ok &= check(write_file(bare_in, ws.original), "extensionless input written");
    RemuxRequest req = request_for(ws, (ws.dir / "Howl_out").string());
    req.input_path = bare_in.string();
    st = writer.write(req);
    ok &= check(!st.ok() && st.kind == ErrorKind::Remux &&
                    st.message.find("extension") != std::string::npos,
                "no extension anywhere is a clear RemuxError");
    ok &= check(!fs::exists(ws.dir / "Howl_out"), "nothing written without a container");
    ok &= check(read_file(bare_in) == ws.original, "extensionless input untouched");
    ok &= check(no_temporaries(ws.dir), "no temporaries left behind");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_command_line();
    ok &= test_process_runner();
    ok &= test_tool_failure_preserves_original();
    ok &= test_timeout_preserves_original();
    ok &= test_invalid_output_preserves_original();
    ok &= test_success_in_place_and_to_output();
    ok &= test_output_without_extension();
    if (ok) {
        std::cout << "remux_unit OK\n";
    }
    return ok ? 0 : 1;
}
