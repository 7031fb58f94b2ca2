// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <glib.h>
#include <json-glib/json-glib.h>

#include "internal.h"
#include "http_retry.h"
#include "version.h"

using namespace musicdl::detail;

/* ------------------------------------------------------------------- */

// ## Tech info
//
// Recording search, first tier (artist and title known):
//
// ```bash
// curl -A "musicdl/0.1.0" "https://musicbrainz.org/ws/2/recording/?query=artist%3A%22Queen%22%20AND%20recording%3A%22Bohemian%20Rhapsody%22&fmt=json&limit=5"
// ```
//
// Second tier (title only): `recording:"Bohemian Rhapsody" type:song`.
//
// MusicBrainz rejects clients exceeding one request per second,
// so requests from every job share one spacing clock.

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

constexpr int kMusicBrainzTimeoutSec = 10;
constexpr int kMusicBrainzRetryDelayMs = 1200;
constexpr int kMusicBrainzMaxAttempts = 3;
constexpr int kMusicBrainzSearchLimit = 5;
constexpr int kMusicBrainzSpacingMs = 1000;

static const std::vector<std::string> kSubjectiveTags = {
    "classic", "favorite", "beautiful", "awesome",
};

static std::mutex g_spacing_mutex;
static std::optional<std::chrono::steady_clock::time_point> g_last_request;

// Blocks until the previous request is at least kMusicBrainzSpacingMs old.
static bool wait_request_slot(GCancellable* cancellable) {
    std::lock_guard<std::mutex> lock(g_spacing_mutex);
    if (g_last_request) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - *g_last_request).count();
        if (elapsed < kMusicBrainzSpacingMs) {
            if (!sleep_unless_cancelled(
                    static_cast<int>(kMusicBrainzSpacingMs - elapsed), cancellable)) {
                return false;
            }
        }
    }
    g_last_request = std::chrono::steady_clock::now();
    return true;
}

static std::string get_string_member(JsonObject* obj, const char* name) {
    if (!obj || !name) return {};
    if (!json_object_has_member(obj, name)) return {};
    JsonNode* node = json_object_get_member(obj, name);
    if (!node || !JSON_NODE_HOLDS_VALUE(node)) return {};
    if (json_node_get_value_type(node) != G_TYPE_STRING) return {};
    const gchar* value = json_node_get_string(node);
    return value ? std::string{value} : std::string{};
}

static JsonArray* get_array_member(JsonObject* obj, const char* name) {
    if (!obj || !name) return nullptr;
    if (!json_object_has_member(obj, name)) return nullptr;
    JsonNode* node = json_object_get_member(obj, name);
    if (!node || !JSON_NODE_HOLDS_ARRAY(node)) return nullptr;
    return json_node_get_array(node);
}

static JsonObject* get_object_member(JsonObject* obj, const char* name) {
    if (!obj || !name) return nullptr;
    if (!json_object_has_member(obj, name)) return nullptr;
    JsonNode* node = json_object_get_member(obj, name);
    if (!node || !JSON_NODE_HOLDS_OBJECT(node)) return nullptr;
    return json_node_get_object(node);
}

static JsonObject* get_object_element(JsonArray* arr, guint index) {
    if (!arr || index >= json_array_get_length(arr)) return nullptr;
    JsonNode* node = json_array_get_element(arr, index);
    if (!node || !JSON_NODE_HOLDS_OBJECT(node)) return nullptr;
    return json_node_get_object(node);
}

static std::string escape_mb_query(const std::string& value) {
    gchar* escaped = g_uri_escape_string(value.c_str(), nullptr, true);
    if (!escaped) return {};
    std::string out = escaped;
    g_free(escaped);
    return out;
}

// Embedded double quotes would end the quoted value early.
static std::string quote_mb_value(const std::string& value) {
    std::string sanitized;
    sanitized.reserve(value.size());
    for (char ch : value) {
        if (ch == '"') continue;
        sanitized.push_back(ch);
    }
    return "\"" + trim(sanitized) + "\"";
}

static std::vector<std::string> build_recording_queries(
    const std::string& artist,
    const std::string& title) {

    std::vector<std::string> queries;
    if (!artist.empty() && !title.empty()) {
        queries.push_back(
            "artist:" + quote_mb_value(artist) + " AND recording:" + quote_mb_value(title));
    }
    if (!title.empty()) {
        queries.push_back("recording:" + quote_mb_value(title) + " type:song");
    }
    return queries;
}

static std::string build_recording_search_url(const std::string& query) {
    return "https://musicbrainz.org/ws/2/recording/?query=" + escape_mb_query(query) +
        "&fmt=json&limit=" + std::to_string(kMusicBrainzSearchLimit);
}

static bool is_excluded_tag(const std::string& name) {
    static const RegexPtr decade = compile_regex("^\\d+s$", true);
    static const RegexPtr vocalist = compile_regex(
        "^((male|female)\\s+)?vocal(s|ist|ists)?$", true);
    if (regex_matches(decade, name)) return true;
    if (regex_matches(vocalist, name)) return true;
    const std::string lower = to_lower(trim(name));
    for (const auto& word : kSubjectiveTags) {
        if (lower == word) return true;
    }
    return false;
}

static std::string select_genre(JsonObject* recording) {
    JsonArray* genres = get_array_member(recording, "genres");
    if (genres) {
        const guint len = json_array_get_length(genres);
        for (guint i = 0; i < len; ++i) {
            const std::string name = trim(get_string_member(get_object_element(genres, i), "name"));
            if (!name.empty()) return name;
        }
    }
    JsonArray* tags = get_array_member(recording, "tags");
    if (tags) {
        const guint len = json_array_get_length(tags);
        for (guint i = 0; i < len; ++i) {
            const std::string name = trim(get_string_member(get_object_element(tags, i), "name"));
            if (!name.empty() && !is_excluded_tag(name)) return name;
        }
    }
    return {};
}

static JsonObject* select_release(JsonObject* recording) {
    JsonArray* releases = get_array_member(recording, "releases");
    if (!releases) return nullptr;
    const guint len = json_array_get_length(releases);
    for (guint i = 0; i < len; ++i) {
        JsonObject* release = get_object_element(releases, i);
        if (!trim(get_string_member(release, "date")).empty()) return release;
    }
    return get_object_element(releases, 0);
}

static std::string extract_year(const std::string& date) {
    if (date.size() < 4) return {};
    for (size_t i = 0; i < 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) return {};
    }
    return date.substr(0, 4);
}

static std::string primary_artist_name(JsonObject* recording) {
    JsonObject* credit = get_object_element(get_array_member(recording, "artist-credit"), 0);
    std::string name = trim(get_string_member(credit, "name"));
    if (name.empty()) {
        name = trim(get_string_member(get_object_member(credit, "artist"), "name"));
    }
    return name;
}

static MusicDlTrackMetadata* make_metadata(
    const std::string& title,
    const std::string& artist,
    const std::string& album,
    const std::string& year,
    const std::string& genre,
    MusicDlMetadataSource source) {

    auto* meta = new MusicDlTrackMetadata{};
    meta->title = make_cstr_copy(title);
    meta->artist = make_cstr_copy(artist);
    meta->album = make_cstr_copy(album);
    meta->year = year.empty() ? nullptr : make_cstr_copy(year);
    meta->genre = genre.empty() ? nullptr : make_cstr_copy(genre);
    meta->source = source;
    return meta;
}

enum class ParseOutcome {
    Found,
    Empty,
    Invalid,
};

static ParseOutcome parse_recording_search(
    const std::string& body,
    const std::string& input_artist,
    const std::string& input_title,
    MusicDlTrackMetadata*& out,
    std::string& err) {

    JsonParser* parser = json_parser_new();
    GError* gerr = nullptr;
    if (!json_parser_load_from_data(parser, body.c_str(), static_cast<gssize>(body.size()), &gerr)) {
        err = "MusicBrainz response parse error: " + gerror_message(gerr, "unknown error");
        if (gerr) g_error_free(gerr);
        g_object_unref(parser);
        return ParseOutcome::Invalid;
    }
    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        err = "MusicBrainz response is not a JSON object";
        g_object_unref(parser);
        return ParseOutcome::Invalid;
    }

    JsonObject* recording = get_object_element(
        get_array_member(json_node_get_object(root), "recordings"), 0);
    if (!recording) {
        g_object_unref(parser);
        return ParseOutcome::Empty;
    }

    std::string title = trim(get_string_member(recording, "title"));
    if (title.empty()) title = input_title;
    std::string artist = primary_artist_name(recording);
    if (artist.empty()) artist = input_artist;

    JsonObject* release = select_release(recording);
    const std::string album = trim(get_string_member(release, "title"));
    const std::string year = extract_year(trim(get_string_member(release, "date")));

    out = make_metadata(title, artist, album, year, select_genre(recording), MUSICDL_METADATA_RESOLVED);
    g_object_unref(parser);
    return ParseOutcome::Found;
}

/* ------------------------------------------------------------------- */

namespace musicdl::detail {

std::string musicbrainz_user_agent() {
    std::string ua = "musicdl/";
    ua += VERSION;
    ua += " (music downloader and organizer)";
    return ua;
}

}  // namespace musicdl::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

int musicdl_http_get_default(
    void* /*user_data*/,
    const char* url,
    const MusicDlCancelToken* token,
    char** body,
    const char** error) {

    clear_error(error);
    if (body) *body = nullptr;
    if (!url || !body) {
        set_error(error, "Invalid arguments to musicdl_http_get_default");
        return 0;
    }

    GCancellable* cancellable = cancellable_of(token);
    if (!wait_request_slot(cancellable)) {
        set_error(error, "MusicBrainz request cancelled");
        return 0;
    }

    HttpRetryPolicy policy{};
    policy.timeout_sec = kMusicBrainzTimeoutSec;
    policy.max_attempts = kMusicBrainzMaxAttempts;
    policy.retry_delay_ms = kMusicBrainzRetryDelayMs;
    policy.max_redirects = 2;
    policy.respect_retry_after = true;

    std::string text;
    std::string err;
    if (!http_get_text_with_retry(
            "MusicBrainz",
            url,
            musicbrainz_user_agent(),
            "application/json",
            policy,
            cancellable,
            text,
            err)) {
        set_error(error, err);
        return 0;
    }
    *body = make_mutable_cstr_copy(text);
    return 1;
}

MusicDlTrackMetadata* musicdl_make_fallback_metadata(
    const char* artist,
    const char* title) {

    return make_metadata(
        trim(to_string_or_empty(title)),
        trim(to_string_or_empty(artist)),
        "",
        "",
        "",
        MUSICDL_METADATA_FALLBACK);
}

MusicDlTrackMetadata* musicdl_resolve_metadata(
    const char* artist,
    const char* title,
    MusicDlHttpGetFunc http_get,
    void* http_user_data,
    const MusicDlCancelToken* token,
    const char** error) {

    clear_error(error);
    const std::string artist_str = trim(to_string_or_empty(artist));
    const std::string title_str = trim(to_string_or_empty(title));
    if (!http_get) http_get = &musicdl_http_get_default;

    const auto queries = build_recording_queries(artist_str, title_str);
    if (queries.empty()) {
        set_error(error, "No title to look up");
        return musicdl_make_fallback_metadata(artist, title);
    }

    for (const auto& query : queries) {
        if (musicdl_cancel_token_is_cancelled(token)) {
            set_error(error, "Metadata lookup cancelled");
            return musicdl_make_fallback_metadata(artist, title);
        }

        char* body = nullptr;
        const char* http_err = nullptr;
        if (!http_get(http_user_data, build_recording_search_url(query).c_str(), token, &body, &http_err)) {
            set_error(error, take_error(http_err, "MusicBrainz request failed"));
            musicdl_release_string(body);
            return musicdl_make_fallback_metadata(artist, title);
        }
        musicdl_release_error(http_err);

        const std::string text = to_string_or_empty(body);
        musicdl_release_string(body);

        MusicDlTrackMetadata* resolved = nullptr;
        std::string parse_err;
        switch (parse_recording_search(text, artist_str, title_str, resolved, parse_err)) {
            case ParseOutcome::Found:
                return resolved;
            case ParseOutcome::Invalid:
                set_error(error, parse_err);
                return musicdl_make_fallback_metadata(artist, title);
            case ParseOutcome::Empty:
                break;
        }
    }

    set_error(error, "No MusicBrainz recording matched");
    return musicdl_make_fallback_metadata(artist, title);
}

void musicdl_release_track_metadata(MusicDlTrackMetadata* p) {
    if (!p) return;
    release_cstr(p->title);
    release_cstr(p->artist);
    release_cstr(p->album);
    release_cstr(p->year);
    release_cstr(p->genre);
    delete p;
}

};
