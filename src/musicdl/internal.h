#pragma once

// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#include <cctype>
#include <cstring>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <glib.h>
#include <gio/gio.h>

#include "musicdl/musicdl.h"

struct MusicDlCancelToken {
    GCancellable* cancellable{nullptr};
};

/* ------------------------------------------------------------------- */

namespace musicdl::detail {

static inline const char* make_cstr_copy(const std::string& s) {
    auto* buf = new char[s.size() + 1];
    std::memcpy(buf, s.c_str(), s.size() + 1);
    return buf;
}

static inline const char* make_cstr_copy(const char* s) {
    return make_cstr_copy(s ? std::string{s} : std::string{});
}

static inline char* make_mutable_cstr_copy(const std::string& s) {
    return const_cast<char*>(make_cstr_copy(s));
}

// Empty becomes null.
static inline const char* make_nullable_cstr_copy(const std::string& s) {
    return s.empty() ? nullptr : make_cstr_copy(s);
}

static inline std::string to_string_or_empty(const char* s) {
    return s ? std::string{s} : std::string{};
}

static inline std::string to_lower(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (unsigned char c : s) r.push_back(static_cast<char>(std::tolower(c)));
    return r;
}

static inline std::string to_upper(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (unsigned char c : s) r.push_back(static_cast<char>(std::toupper(c)));
    return r;
}

static inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

static inline bool parse_int64(const std::string& s, int64_t& out) {
    try {
        out = static_cast<int64_t>(std::stoll(s));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static inline void release_cstr(const char*& s) {
    delete[] s;
    s = nullptr;
}

static inline void set_error(const char** error, const std::string& message) {
    if (!error || *error) return;
    *error = make_cstr_copy(message);
}

static inline void clear_error(const char** error) {
    if (!error) return;
    musicdl_release_error(*error);
    *error = nullptr;
}

// Moves a library error string into a std::string and releases it.
static inline std::string take_error(const char*& error, const char* fallback) {
    std::string message = error ? std::string{error} : std::string{fallback ? fallback : ""};
    musicdl_release_error(error);
    error = nullptr;
    return message;
}

static inline std::string gerror_message(const GError* gerr, const char* fallback) {
    return (gerr && gerr->message) ? std::string{gerr->message} : std::string{fallback};
}

static inline MusicDlTagKV make_kv(const std::string& key, const std::string& value) {
    MusicDlTagKV kv{};
    kv.key = make_cstr_copy(to_upper(key));
    kv.value = make_cstr_copy(value);
    return kv;
}

static inline GCancellable* cancellable_of(const MusicDlCancelToken* token) {
    return token ? token->cancellable : nullptr;
}

using RegexPtr = std::unique_ptr<GRegex, decltype(&g_regex_unref)>;

// Null on an invalid pattern.
RegexPtr compile_regex(const char* pattern, bool caseless);

static inline bool regex_matches(const RegexPtr& re, const std::string& text) {
    return re && g_regex_match(re.get(), text.c_str(), static_cast<GRegexMatchFlags>(0), nullptr);
}

/* ------------------------------------------------------------------- */
// Shared across translation units.

// "<left> <dash> <right>" split on the first dash-like separator.
std::optional<std::pair<std::string, std::string>> split_dash_separated(
    const std::string& text);

// Invalid sequences become U+FFFD.
std::string make_valid_utf8(const std::string& text);

std::string strip_non_printable_ascii(const std::string& text);

std::string clean_video_title(const std::string& title);

std::string sanitize_title_component(const std::string& title);

std::string sanitize_path_component(const std::string& name);

std::string musicbrainz_user_agent();

std::string current_timestamp_iso();

// Candidates from "yt-dlp --dump-json" output.
MusicDlCandidateList* parse_search_output(const std::string& output);

// Lowercase whitespace separated words, in first-seen order, without duplicates.
std::vector<std::string> split_words(const std::string& text);

}  // namespace musicdl::detail
