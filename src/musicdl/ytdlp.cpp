// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <gio/gio.h>
#include <json-glib/json-glib.h>

#include "internal.h"

using namespace musicdl::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static const char* kDefaultYtDlp = "yt-dlp";
static const char* kWatchUrlPrefix = "https://www.youtube.com/watch?v=";

struct ProcessResult {
    bool started{false};
    bool cancelled{false};
    int exit_status{-1};
    std::string out;
    std::string err;
};

static std::string executable_of(void* user_data) {
    const char* path = static_cast<const char*>(user_data);
    return (path && path[0] != '\0') ? std::string{path} : std::string{kDefaultYtDlp};
}

static std::string last_line_of(const std::string& text) {
    std::istringstream iss(text);
    std::string line;
    std::string last;
    while (std::getline(iss, line)) {
        const std::string trimmed = trim(line);
        if (!trimmed.empty()) last = trimmed;
    }
    return last;
}

static ProcessResult run_process(
    const std::vector<std::string>& args,
    GCancellable* cancellable) {

    ProcessResult result;
    std::vector<const gchar*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    GError* gerr = nullptr;
    GSubprocess* proc = g_subprocess_newv(
        argv.data(),
        static_cast<GSubprocessFlags>(G_SUBPROCESS_FLAGS_STDOUT_PIPE | G_SUBPROCESS_FLAGS_STDERR_PIPE),
        &gerr);
    if (!proc) {
        result.err = "Failed to start " + args.front() + ": " + gerror_message(gerr, "unknown error");
        g_clear_error(&gerr);
        return result;
    }
    result.started = true;

    char* out = nullptr;
    char* err = nullptr;
    if (!g_subprocess_communicate_utf8(proc, nullptr, cancellable, &out, &err, &gerr)) {
        if (g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_CANCELLED)) {
            result.cancelled = true;
            result.err = args.front() + " cancelled";
        } else {
            result.err = args.front() + " I/O error: " + gerror_message(gerr, "unknown error");
        }
        g_clear_error(&gerr);
        g_subprocess_force_exit(proc);
        g_subprocess_wait(proc, nullptr, nullptr);
    } else {
        result.out = to_string_or_empty(out);
        result.err = trim(to_string_or_empty(err));
        if (g_subprocess_get_if_exited(proc)) {
            result.exit_status = g_subprocess_get_exit_status(proc);
        }
    }
    g_free(out);
    g_free(err);
    g_object_unref(proc);
    return result;
}

static int64_t number_member(JsonObject* obj, const char* name) {
    if (!obj || !json_object_has_member(obj, name)) return 0;
    JsonNode* node = json_object_get_member(obj, name);
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) return 0;
    const GType type = json_node_get_value_type(node);
    if (type == G_TYPE_INT64) return json_node_get_int(node);
    if (type == G_TYPE_DOUBLE) return static_cast<int64_t>(json_node_get_double(node));
    if (type == G_TYPE_STRING) {
        int64_t v = 0;
        return parse_int64(to_string_or_empty(json_node_get_string(node)), v) ? v : 0;
    }
    return 0;
}

static std::string string_member(JsonObject* obj, const char* name) {
    if (!obj || !json_object_has_member(obj, name)) return {};
    JsonNode* node = json_object_get_member(obj, name);
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) return {};
    if (json_node_get_value_type(node) != G_TYPE_STRING) return {};
    return to_string_or_empty(json_node_get_string(node));
}

struct ParsedCandidate {
    std::string id;
    std::string title;
    std::string channel;
    std::string uploader;
    long duration_seconds{0};
    int64_t view_count{0};
    int64_t like_count{0};
};

static bool parse_candidate_line(
    const std::string& line,
    ParsedCandidate& out) {

    JsonParser* parser = json_parser_new();
    GError* gerr = nullptr;
    if (!json_parser_load_from_data(parser, line.c_str(), static_cast<gssize>(line.size()), &gerr)) {
        g_clear_error(&gerr);
        g_object_unref(parser);
        return false;
    }
    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_object_unref(parser);
        return false;
    }
    JsonObject* obj = json_node_get_object(root);
    out.id = string_member(obj, "id");
    out.title = string_member(obj, "title");
    out.uploader = string_member(obj, "uploader");
    out.channel = string_member(obj, "channel");
    if (out.channel.empty()) out.channel = out.uploader;
    out.duration_seconds = static_cast<long>(number_member(obj, "duration"));
    out.view_count = number_member(obj, "view_count");
    out.like_count = number_member(obj, "like_count");
    g_object_unref(parser);
    return !out.id.empty();
}

static MusicDlCandidateList* make_list(const std::vector<ParsedCandidate>& parsed) {
    std::vector<MusicDlCandidate> views;
    views.reserve(parsed.size());
    for (const auto& p : parsed) {
        MusicDlCandidate c{};
        c.id = p.id.c_str();
        c.title = p.title.c_str();
        c.channel = p.channel.c_str();
        c.uploader = p.uploader.c_str();
        c.duration_seconds = p.duration_seconds;
        c.view_count = p.view_count;
        c.like_count = p.like_count;
        views.push_back(c);
    }
    return musicdl_make_candidate_list(views.data(), views.size());
}

/* ------------------------------------------------------------------- */

namespace musicdl::detail {

// One JSON object per line; unparsable lines are skipped.
MusicDlCandidateList* parse_search_output(const std::string& output) {
    std::vector<ParsedCandidate> parsed;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty()) continue;
        ParsedCandidate c;
        if (parse_candidate_line(line, c)) parsed.push_back(std::move(c));
    }
    return make_list(parsed);
}

}  // namespace musicdl::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

MusicDlCandidateList* musicdl_ytdlp_search(
    void* user_data,
    const char* query,
    int limit,
    const MusicDlCancelToken* token,
    const char** error) {

    clear_error(error);
    if (!query) {
        set_error(error, "Query is null");
        return nullptr;
    }
    const int n = limit > 0 ? limit : 10;
    const std::vector<std::string> args = {
        executable_of(user_data),
        "--dump-json",
        "--skip-download",
        "--no-warnings",
        "ytsearch" + std::to_string(n) + ":" + std::string{query},
    };

    const ProcessResult r = run_process(args, cancellable_of(token));
    if (!r.started || r.cancelled) {
        set_error(error, r.err);
        return nullptr;
    }

    MusicDlCandidateList* list = parse_search_output(r.out);
    if (r.exit_status != 0 && list->count == 0) {
        musicdl_release_candidate_list(list);
        set_error(error,
            "yt-dlp search exited with status " + std::to_string(r.exit_status) +
            (r.err.empty() ? std::string{} : ": " + r.err));
        return nullptr;
    }
    return list;
}

char* musicdl_ytdlp_download(
    void* user_data,
    const MusicDlCandidate* candidate,
    const char* work_dir,
    const MusicDlCancelToken* token,
    const char** error) {

    clear_error(error);
    if (!candidate || !candidate->id || !work_dir) {
        set_error(error, "Invalid arguments to musicdl_ytdlp_download");
        return nullptr;
    }

    const std::string output_template =
        (std::filesystem::path(work_dir) / "%(id)s.%(ext)s").string();
    const std::vector<std::string> args = {
        executable_of(user_data),
        "-x",
        "--audio-format",
        "flac",
        "--no-playlist",
        "--no-progress",
        "--no-warnings",
        "-o",
        output_template,
        "--print",
        "after_move:filepath",
        std::string{kWatchUrlPrefix} + candidate->id,
    };

    const ProcessResult r = run_process(args, cancellable_of(token));
    if (!r.started || r.cancelled) {
        set_error(error, r.err);
        return nullptr;
    }
    if (r.exit_status != 0) {
        set_error(error,
            "yt-dlp exited with status " + std::to_string(r.exit_status) +
            (r.err.empty() ? std::string{} : ": " + r.err));
        return nullptr;
    }
    const std::string path = last_line_of(r.out);
    if (path.empty()) {
        set_error(error, "yt-dlp produced no output file");
        return nullptr;
    }
    return make_mutable_cstr_copy(path);
}

void musicdl_default_backend(MusicDlBackend* out, const char* ytdlp_path) {
    if (!out) return;
    out->user_data = const_cast<char*>(ytdlp_path);
    out->search = &musicdl_ytdlp_search;
    out->download = &musicdl_ytdlp_download;
    out->http_get = &musicdl_http_get_default;
    out->write_tags = nullptr;
}

};
