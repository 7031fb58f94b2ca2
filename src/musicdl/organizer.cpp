// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <filesystem>
#include <optional>
#include <string>

#include <gio/gio.h>

#include "internal.h"

using namespace musicdl::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static const std::string reserved = "\\:?\"<>|*";

// Nullopt when the regex is missing or the replace fails.
static std::optional<std::string> regex_replace_all(
    const RegexPtr& re,
    const std::string& input,
    const char* replacement) {

    if (!re) return std::nullopt;
    GError* gerr = nullptr;
    gchar* replaced = g_regex_replace_literal(
        re.get(), input.c_str(), -1, 0, replacement, static_cast<GRegexMatchFlags>(0), &gerr);
    if (!replaced) {
        g_clear_error(&gerr);
        return std::nullopt;
    }
    std::string out = replaced;
    g_free(replaced);
    return out;
}

static bool ensure_parent_directories(
    GFile* file,
    std::string& err) {

    GFile* parent = g_file_get_parent(file);
    if (!parent) return true;
    GError* gerr = nullptr;
    bool ok = true;
    if (!g_file_make_directory_with_parents(parent, nullptr, &gerr)) {
        if (gerr && !g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_EXISTS)) {
            char* parent_path = g_file_get_path(parent);
            err = "Failed to create directories for " + to_string_or_empty(parent_path) +
                ": " + gerror_message(gerr, "unknown");
            g_free(parent_path);
            ok = false;
        }
        g_clear_error(&gerr);
    }
    g_object_unref(parent);
    return ok;
}

static std::string build_destination(
    const std::string& music_root,
    const std::string& user_name,
    const std::string& artist,
    const std::string& title,
    const std::string& extension) {

    std::filesystem::path dest(music_root);
    const std::string user_dir = trim(user_name);
    if (!user_dir.empty()) dest /= sanitize_path_component(user_dir);
    dest /= sanitize_path_component(artist);

    std::string ext = trim(extension);
    while (!ext.empty() && ext.front() == '.') ext.erase(ext.begin());
    std::string file_name = sanitize_title_component(title);
    if (!ext.empty()) file_name += "." + ext;
    dest /= file_name;
    return dest.string();
}

/* ------------------------------------------------------------------- */

namespace musicdl::detail {

std::string sanitize_title_component(const std::string& title) {
    static const RegexPtr disallowed = compile_regex("[^\\p{L}\\p{N}_\\s-]", false);
    static const RegexPtr spaces = compile_regex("\\s+", false);
    const auto kept = regex_replace_all(disallowed, make_valid_utf8(title), "");
    if (!kept) return "track";
    const auto joined = regex_replace_all(spaces, trim(*kept), "_");
    if (!joined || joined->empty()) return "track";
    return *joined;
}

std::string sanitize_path_component(const std::string& name) {
    const std::string input = trim(name);
    std::string result;
    result.reserve(input.size());
    for (unsigned char uch : input) {
        char ch = static_cast<char>(uch);
        if (std::iscntrl(uch) || reserved.find(ch) != std::string::npos || ch == '/') {
            result.push_back('_');
        } else {
            result.push_back(ch);
        }
    }
    if (result.empty() || result == "." || result == "..") result = "Unknown Artist";
    return result;
}

}  // namespace musicdl::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

char* musicdl_sanitize_title(const char* title) {
    return make_mutable_cstr_copy(sanitize_title_component(to_string_or_empty(title)));
}

char* musicdl_build_destination(
    const char* music_root,
    const char* user_name,
    const char* artist,
    const char* title,
    const char* extension) {

    return make_mutable_cstr_copy(build_destination(
        to_string_or_empty(music_root),
        to_string_or_empty(user_name),
        to_string_or_empty(artist),
        to_string_or_empty(title),
        to_string_or_empty(extension)));
}

char* musicdl_organize_file(
    const char* artifact_path,
    const char* music_root,
    const char* user_name,
    const MusicDlTrackMetadata* meta,
    const char** error) {

    clear_error(error);
    if (!artifact_path || !music_root || !meta) {
        set_error(error, "Invalid arguments to musicdl_organize_file");
        return nullptr;
    }

    const std::filesystem::path source_path(artifact_path);
    const std::string destination = build_destination(
        music_root,
        to_string_or_empty(user_name),
        to_string_or_empty(meta->artist),
        to_string_or_empty(meta->title),
        source_path.extension().string());

    GFile* source = g_file_new_for_path(artifact_path);
    GFile* target = g_file_new_for_path(destination.c_str());

    std::string err;
    if (!ensure_parent_directories(target, err)) {
        set_error(error, err);
        g_object_unref(source);
        g_object_unref(target);
        return nullptr;
    }

    GError* move_err = nullptr;
    if (!g_file_move(
        source,
        target,
        G_FILE_COPY_OVERWRITE,
        nullptr,
        nullptr,
        nullptr,
        &move_err)) {

        set_error(error,
            "Failed to move " + std::string{artifact_path} + " to " + destination +
            " (" + gerror_message(move_err, "unknown") + ")");
        g_clear_error(&move_err);
        g_object_unref(source);
        g_object_unref(target);
        return nullptr;
    }

    g_object_unref(source);
    g_object_unref(target);
    return make_mutable_cstr_copy(destination);
}

};
