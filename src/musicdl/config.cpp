// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <glib.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal.h"

using namespace musicdl::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static const char* kGroupMain = "musicdl";
static const char* kGroupUsb = "usb";
static const char* kGroupScoring = "scoring";

static void replace_cstr(
    const char*& target,
    const std::string& value) {

    release_cstr(target);
    target = make_cstr_copy(value);
}

static std::string strip_inline_comment_value(
    const std::string& raw) {

    bool in_single = false;
    bool in_double = false;
    bool escaped = false;
    for (size_t i = 0; i < raw.size(); ++i) {
        const char ch = raw[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (ch == '\\') {
            escaped = true;
        } else if (ch == '\'' && !in_double) {
            in_single = !in_single;
        } else if (ch == '"' && !in_single) {
            in_double = !in_double;
        } else if (!in_single && !in_double && (ch == '#' || ch == ';') &&
                   (i == 0 || std::isspace(static_cast<unsigned char>(raw[i - 1])))) {
            return trim(raw.substr(0, i));
        }
    }
    return trim(raw);
}

static bool parse_bool_value(
    const std::string& raw,
    bool& out) {

    const std::string value = to_lower(trim(raw));
    if (value == "true" || value == "yes" || value == "1") {
        out = true;
        return true;
    }
    if (value == "false" || value == "no" || value == "0") {
        out = false;
        return true;
    }
    return false;
}

static bool parse_int_strict_value(
    const std::string& raw,
    int& out) {

    const std::string value = trim(raw);
    if (value.empty()) return false;
    size_t idx = 0;
    try {
        const int v = std::stoi(value, &idx);
        if (idx != value.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_int64_strict_value(
    const std::string& raw,
    int64_t& out) {

    const std::string value = trim(raw);
    if (value.empty()) return false;
    size_t idx = 0;
    try {
        const long long v = std::stoll(value, &idx);
        if (idx != value.size()) return false;
        out = static_cast<int64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_double_strict_value(
    const std::string& raw,
    double& out) {

    const std::string value = trim(raw);
    if (value.empty()) return false;
    size_t idx = 0;
    try {
        const double v = std::stod(value, &idx);
        if (idx != value.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Reads group/key with inline comments stripped.
// Returns nullopt when the key is absent; fills failure when GKeyFile rejects it.
static std::optional<std::string> read_value(
    GKeyFile* key_file,
    const char* group,
    const char* key,
    std::string& failure) {

    if (!g_key_file_has_key(key_file, group, key, nullptr)) return std::nullopt;
    GError* gerr = nullptr;
    char* value = g_key_file_get_string(key_file, group, key, &gerr);
    if (!value) {
        failure = "Failed to parse " + std::string{key} + ": " + gerror_message(gerr, "unknown error");
        g_clear_error(&gerr);
        return std::nullopt;
    }
    const std::string v = strip_inline_comment_value(value);
    g_free(value);
    return v;
}

struct IntWeightKey {
    const char* key;
    int MusicDlScoreWeights::* field;
};

static const IntWeightKey kIntWeightKeys[] = {
    { "artist_match", &MusicDlScoreWeights::artist_match },
    { "title_match", &MusicDlScoreWeights::title_match },
    { "word_overlap", &MusicDlScoreWeights::word_overlap },
    { "duration_ideal", &MusicDlScoreWeights::duration_ideal },
    { "duration_acceptable", &MusicDlScoreWeights::duration_acceptable },
    { "duration_penalty", &MusicDlScoreWeights::duration_penalty },
    { "official_bonus", &MusicDlScoreWeights::official_bonus },
    { "audio_bonus", &MusicDlScoreWeights::audio_bonus },
    { "live_penalty", &MusicDlScoreWeights::live_penalty },
    { "tutorial_penalty", &MusicDlScoreWeights::tutorial_penalty },
    { "compilation_penalty", &MusicDlScoreWeights::compilation_penalty },
    { "channel_artist_bonus", &MusicDlScoreWeights::channel_artist_bonus },
    { "channel_official_bonus", &MusicDlScoreWeights::channel_official_bonus },
    { "channel_label_bonus", &MusicDlScoreWeights::channel_label_bonus },
};

struct Int64WeightKey {
    const char* key;
    int64_t MusicDlScoreWeights::* field;
};

static const Int64WeightKey kInt64WeightKeys[] = {
    { "view_threshold", &MusicDlScoreWeights::view_threshold },
    { "like_threshold", &MusicDlScoreWeights::like_threshold },
};

struct DoubleWeightKey {
    const char* key;
    double MusicDlScoreWeights::* field;
};

static const DoubleWeightKey kDoubleWeightKeys[] = {
    { "view_log_offset", &MusicDlScoreWeights::view_log_offset },
    { "view_cap", &MusicDlScoreWeights::view_cap },
    { "like_log_offset", &MusicDlScoreWeights::like_log_offset },
    { "like_cap", &MusicDlScoreWeights::like_cap },
};

static std::string default_music_root() {
    const char* xdg = g_get_user_special_dir(G_USER_DIRECTORY_MUSIC);
    if (xdg && xdg[0] != '\0') return xdg;
    return (std::filesystem::path(g_get_home_dir()) / "Music").string();
}

static MusicDlConfig* make_default_config() {
    auto* cfg = new MusicDlConfig{};
    cfg->music_root = make_cstr_copy(default_music_root());
    cfg->user_name = make_cstr_copy(g_get_user_name());
    cfg->concurrency = 1;
    cfg->job_timeout_sec = 0;
    cfg->search_limit = 10;
    cfg->fetch_metadata = true;
    cfg->usb_sync = false;
    cfg->auto_eject = false;
    cfg->ytdlp_path = make_cstr_copy("yt-dlp");
    musicdl_default_score_weights(&cfg->weights);
    cfg->config_path = nullptr;
    return cfg;
}

// Applies every recognized key; returns false with failure set on the first invalid one.
static bool apply_key_file(
    GKeyFile* key_file,
    MusicDlConfig* cfg,
    std::string& failure) {

    // [musicdl] group
    if (auto v = read_value(key_file, kGroupMain, "music_root", failure)) {
        if (!v->empty()) replace_cstr(cfg->music_root, *v);
    } else if (!failure.empty()) return false;

    if (auto v = read_value(key_file, kGroupMain, "user_name", failure)) {
        replace_cstr(cfg->user_name, *v);
    } else if (!failure.empty()) return false;

    if (auto v = read_value(key_file, kGroupMain, "concurrency", failure)) {
        int parsed = 0;
        if (!parse_int_strict_value(*v, parsed) || parsed < 1) {
            failure = "Invalid concurrency value";
            return false;
        }
        cfg->concurrency = parsed;
    } else if (!failure.empty()) return false;

    if (auto v = read_value(key_file, kGroupMain, "job_timeout", failure)) {
        int parsed = 0;
        if (!parse_int_strict_value(*v, parsed) || parsed < 0) {
            failure = "Invalid job_timeout value";
            return false;
        }
        cfg->job_timeout_sec = parsed;
    } else if (!failure.empty()) return false;

    if (auto v = read_value(key_file, kGroupMain, "search_limit", failure)) {
        int parsed = 0;
        if (!parse_int_strict_value(*v, parsed) || parsed <= 0) {
            failure = "Invalid search_limit value";
            return false;
        }
        cfg->search_limit = parsed;
    } else if (!failure.empty()) return false;

    if (auto v = read_value(key_file, kGroupMain, "fetch_metadata", failure)) {
        if (!parse_bool_value(*v, cfg->fetch_metadata)) {
            failure = "Invalid fetch_metadata value";
            return false;
        }
    } else if (!failure.empty()) return false;

    if (auto v = read_value(key_file, kGroupMain, "ytdlp", failure)) {
        if (!v->empty()) replace_cstr(cfg->ytdlp_path, *v);
    } else if (!failure.empty()) return false;

    // [usb] group
    if (auto v = read_value(key_file, kGroupUsb, "sync", failure)) {
        if (!parse_bool_value(*v, cfg->usb_sync)) {
            failure = "Invalid usb sync value";
            return false;
        }
    } else if (!failure.empty()) return false;

    if (auto v = read_value(key_file, kGroupUsb, "auto_eject", failure)) {
        if (!parse_bool_value(*v, cfg->auto_eject)) {
            failure = "Invalid usb auto_eject value";
            return false;
        }
    } else if (!failure.empty()) return false;

    // [scoring] group: unspecified keys keep defaults.
    for (const auto& k : kIntWeightKeys) {
        if (auto v = read_value(key_file, kGroupScoring, k.key, failure)) {
            if (!parse_int_strict_value(*v, cfg->weights.*k.field)) {
                failure = "Invalid scoring value: " + std::string{k.key};
                return false;
            }
        } else if (!failure.empty()) return false;
    }
    for (const auto& k : kInt64WeightKeys) {
        if (auto v = read_value(key_file, kGroupScoring, k.key, failure)) {
            if (!parse_int64_strict_value(*v, cfg->weights.*k.field)) {
                failure = "Invalid scoring value: " + std::string{k.key};
                return false;
            }
        } else if (!failure.empty()) return false;
    }
    for (const auto& k : kDoubleWeightKeys) {
        if (auto v = read_value(key_file, kGroupScoring, k.key, failure)) {
            if (!parse_double_strict_value(*v, cfg->weights.*k.field)) {
                failure = "Invalid scoring value: " + std::string{k.key};
                return false;
            }
        } else if (!failure.empty()) return false;
    }
    return true;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

MusicDlConfig* musicdl_load_config(
    const char* path,
    const char** error) {

    clear_error(error);

    std::vector<std::string> candidates;
    if (path) {
        candidates.emplace_back(path);
    } else {
        candidates.emplace_back("musicdl.conf");
        const char* home = std::getenv("HOME");
        if (home) {
            candidates.push_back((std::filesystem::path(home) / ".musicdl.conf").string());
        }
    }

    auto* cfg = make_default_config();
    GKeyFile* key_file = g_key_file_new();
    std::string loaded_path;

    for (const auto& candidate : candidates) {
        GError* gerr = nullptr;
        if (g_key_file_load_from_file(key_file, candidate.c_str(), G_KEY_FILE_NONE, &gerr)) {
            loaded_path = candidate;
            break;
        }
        if (path) {
            set_error(error, gerror_message(gerr, "Failed to load config"));
            g_clear_error(&gerr);
            g_key_file_unref(key_file);
            musicdl_release_config(cfg);
            return nullptr;
        }
        g_clear_error(&gerr);
    }

    if (loaded_path.empty()) {
        g_key_file_unref(key_file);
        return cfg;
    }

    std::string failure;
    const bool applied = apply_key_file(key_file, cfg, failure);
    g_key_file_unref(key_file);
    if (!applied) {
        set_error(error, loaded_path + ": " + failure);
        musicdl_release_config(cfg);
        return nullptr;
    }

    cfg->config_path = make_cstr_copy(loaded_path);
    return cfg;
}

void musicdl_release_config(
    MusicDlConfig* cfg) {

    if (!cfg) return;
    release_cstr(cfg->music_root);
    release_cstr(cfg->user_name);
    release_cstr(cfg->ytdlp_path);
    release_cstr(cfg->config_path);
    delete cfg;
}

};
