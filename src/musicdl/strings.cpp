// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <algorithm>
#include <string>
#include <vector>

#include "internal.h"

namespace musicdl::detail {

RegexPtr compile_regex(const char* pattern, bool caseless) {
    GError* gerr = nullptr;
    int flags = G_REGEX_OPTIMIZE;
    if (caseless) flags |= G_REGEX_CASELESS;
    GRegex* re = g_regex_new(
        pattern,
        static_cast<GRegexCompileFlags>(flags),
        static_cast<GRegexMatchFlags>(0),
        &gerr);
    // A pattern that fails to compile never matches.
    if (gerr) g_error_free(gerr);
    return RegexPtr(re, &g_regex_unref);
}

std::string make_valid_utf8(const std::string& text) {
    gchar* valid = g_utf8_make_valid(text.c_str(), static_cast<gssize>(text.size()));
    std::string out = to_string_or_empty(valid);
    g_free(valid);
    return out;
}

std::string strip_non_printable_ascii(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char ch : text) {
        if (ch >= 0x20 && ch <= 0x7e) out.push_back(static_cast<char>(ch));
    }
    return out;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    const std::string lower = to_lower(text);
    size_t pos = 0;
    while (pos < lower.size()) {
        while (pos < lower.size() && std::isspace(static_cast<unsigned char>(lower[pos]))) ++pos;
        if (pos >= lower.size()) break;
        size_t end = pos;
        while (end < lower.size() && !std::isspace(static_cast<unsigned char>(lower[end]))) ++end;
        std::string word = lower.substr(pos, end - pos);
        if (std::find(words.begin(), words.end(), word) == words.end()) {
            words.push_back(std::move(word));
        }
        pos = end;
    }
    return words;
}

}  // namespace musicdl::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

void musicdl_release_error(const char* p) {
    delete[] p;
}

void musicdl_release_string(char* p) {
    delete[] p;
}

};
