// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <string>
#include <utility>
#include <vector>

#include "internal.h"

using namespace musicdl::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

// Hyphen-minus and U+2010..U+2015 (hyphen, figure dash, en/em dash, bar).
static const char* kDashSeparatorPattern =
    "^(.*?)\\s+[\\x{2d}\\x{2010}-\\x{2015}]\\s+(.*)$";

static const char* kFeaturingPattern =
    "\\s+[\\(\\[]?\\s*(featuring|feat\\.?|ft\\.?)\\s.*$";

static const std::vector<std::string> kDecorations = {
    "(Official Music Video)",
    "(Official Video)",
    "(Official Audio)",
    "(Lyric Video)",
    "(Music Video)",
    "[Official Music Video]",
    "[Official Video]",
    "[Official Audio]",
    "[Lyric Video]",
    "[Music Video]",
    "(HD)",
    "(HQ)",
    "(4K)",
    "(1080p)",
    "(720p)",
    "(Official)",
    "(Audio)",
    "(Lyrics)",
    "Official Music Video",
    "Official Video",
    "Official Audio",
    "Lyric Video",
    "Music Video",
};

static bool ends_with_caseless(
    const std::string& text,
    const std::string& suffix) {

    if (suffix.size() > text.size()) return false;
    return to_lower(text.substr(text.size() - suffix.size())) == to_lower(suffix);
}

static bool starts_with_caseless(
    const std::string& text,
    const std::string& prefix) {

    if (prefix.size() > text.size()) return false;
    return to_lower(text.substr(0, prefix.size())) == to_lower(prefix);
}

static std::string strip_decorations(
    std::string title) {

    for (const auto& decoration : kDecorations) {
        if (ends_with_caseless(title, decoration)) {
            title = trim(title.substr(0, title.size() - decoration.size()));
        }
        if (starts_with_caseless(title, decoration)) {
            title = trim(title.substr(decoration.size()));
        }
    }
    return title;
}

static std::string strip_featuring(
    const std::string& title) {

    static const RegexPtr re = compile_regex(kFeaturingPattern, true);
    if (!re) return title;
    GError* gerr = nullptr;
    gchar* replaced = g_regex_replace_literal(
        re.get(), title.c_str(), -1, 0, "", static_cast<GRegexMatchFlags>(0), &gerr);
    if (!replaced) {
        if (gerr) g_error_free(gerr);
        return title;
    }
    std::string out = replaced;
    g_free(replaced);
    return trim(out);
}

static std::string strip_trailing_groups(
    std::string title) {

    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& [open, close] : {std::make_pair('(', ')'), std::make_pair('[', ']')}) {
            if (!title.empty() && title.back() == close) {
                const size_t pos = title.rfind(open);
                if (pos != std::string::npos) {
                    title = trim(title.substr(0, pos));
                    changed = true;
                }
            }
        }
    }
    return title;
}

/* ------------------------------------------------------------------- */

namespace musicdl::detail {

std::optional<std::pair<std::string, std::string>> split_dash_separated(
    const std::string& text) {

    static const RegexPtr re = compile_regex(kDashSeparatorPattern, false);
    if (!re) return std::nullopt;

    GMatchInfo* match = nullptr;
    std::optional<std::pair<std::string, std::string>> result;
    if (g_regex_match(re.get(), text.c_str(), static_cast<GRegexMatchFlags>(0), &match)) {
        gchar* left = g_match_info_fetch(match, 1);
        gchar* right = g_match_info_fetch(match, 2);
        result = std::make_pair(
            trim(to_string_or_empty(left)),
            trim(to_string_or_empty(right)));
        g_free(left);
        g_free(right);
    }
    g_match_info_free(match);
    return result;
}

std::string clean_video_title(const std::string& title) {
    const std::string original = trim(make_valid_utf8(title));
    std::string cleaned = original;

    if (const auto split = split_dash_separated(cleaned)) {
        cleaned = split->second;
    }
    cleaned = strip_decorations(cleaned);
    cleaned = strip_featuring(cleaned);
    cleaned = strip_trailing_groups(cleaned);
    cleaned = trim(cleaned);

    // Never erase the whole title.
    return cleaned.empty() ? original : cleaned;
}

}  // namespace musicdl::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

MusicDlSearchQuery* musicdl_parse_query(const char* raw) {
    const std::string raw_text = to_string_or_empty(raw);
    auto* query = new MusicDlSearchQuery{};
    query->raw_text = make_cstr_copy(raw_text);
    if (const auto split = split_dash_separated(raw_text)) {
        query->artist = make_cstr_copy(split->first);
        query->title = make_cstr_copy(split->second);
    } else {
        query->artist = make_cstr_copy("");
        query->title = make_cstr_copy(raw_text);
    }
    return query;
}

void musicdl_release_query(MusicDlSearchQuery* p) {
    if (!p) return;
    release_cstr(p->raw_text);
    release_cstr(p->artist);
    release_cstr(p->title);
    delete p;
}

char* musicdl_clean_title(const char* title) {
    return make_mutable_cstr_copy(clean_video_title(to_string_or_empty(title)));
}

};
