// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <glib.h>

#include "musicdl/musicdl.h"

namespace fs = std::filesystem;

namespace {

using ConfigPtr = std::unique_ptr<MusicDlConfig, decltype(&musicdl_release_config)>;

fs::path g_root;

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream ofs(path);
    ofs << content;
}

ConfigPtr load(const fs::path& path, std::string& error) {
    const char* err = nullptr;
    ConfigPtr cfg(musicdl_load_config(path.empty() ? nullptr : path.string().c_str(), &err),
        &musicdl_release_config);
    error = err ? err : "";
    musicdl_release_error(err);
    return cfg;
}

void testDefaults() {
    std::cout << "[Test] Defaults without any config file..." << std::endl;
    std::string err;
    auto cfg = load({}, err);
    assert(cfg);
    assert(err.empty());
    assert(cfg->config_path == nullptr);
    assert(cfg->music_root && cfg->music_root[0] != '\0');
    assert(cfg->concurrency == 1);
    assert(cfg->job_timeout_sec == 0);
    assert(cfg->search_limit == 10);
    assert(cfg->fetch_metadata);
    assert(!cfg->usb_sync);
    assert(!cfg->auto_eject);
    assert(std::string(cfg->ytdlp_path) == "yt-dlp");

    MusicDlScoreWeights w{};
    musicdl_default_score_weights(&w);
    assert(cfg->weights.artist_match == w.artist_match);
    assert(cfg->weights.compilation_penalty == -20);
    assert(cfg->weights.view_threshold == 1000000);
    std::cout << "[PASS] Defaults without any config file" << std::endl;
}

void testSearchOrder() {
    std::cout << "[Test] Home config is found after the working directory..." << std::endl;
    write_file(g_root / "home" / ".musicdl.conf", "[musicdl]\nconcurrency = 3\n");
    std::string err;
    {
        auto cfg = load({}, err);
        assert(cfg);
        assert(cfg->concurrency == 3);
        assert(std::string(cfg->config_path) == (g_root / "home" / ".musicdl.conf").string());
    }
    write_file(g_root / "cwd" / "musicdl.conf", "[musicdl]\nconcurrency = 2\n");
    {
        auto cfg = load({}, err);
        assert(cfg);
        assert(cfg->concurrency == 2);
        assert(std::string(cfg->config_path) == "musicdl.conf");
    }
    fs::remove(g_root / "cwd" / "musicdl.conf");
    fs::remove(g_root / "home" / ".musicdl.conf");
    std::cout << "[PASS] Home config is found after the working directory" << std::endl;
}

void testExplicitFile() {
    std::cout << "[Test] Explicit config values..." << std::endl;
    const fs::path path = g_root / "full.conf";
    write_file(path,
        "# library\n"
        "[musicdl]\n"
        "music_root = /srv/music   # shared\n"
        "user_name = alice\n"
        "concurrency = 4\n"
        "job_timeout = 600 ; ten minutes\n"
        "search_limit = 15\n"
        "fetch_metadata = false\n"
        "ytdlp = /opt/yt-dlp/yt-dlp\n"
        "\n"
        "[usb]\n"
        "sync = true\n"
        "auto_eject = yes\n"
        "\n"
        "[scoring]\n"
        "live_penalty = -30\n"
        "view_threshold = 5000\n"
        "like_cap = 1.5\n");

    std::string err;
    auto cfg = load(path, err);
    assert(cfg);
    assert(err.empty());
    assert(std::string(cfg->music_root) == "/srv/music");
    assert(std::string(cfg->user_name) == "alice");
    assert(cfg->concurrency == 4);
    assert(cfg->job_timeout_sec == 600);
    assert(cfg->search_limit == 15);
    assert(!cfg->fetch_metadata);
    assert(std::string(cfg->ytdlp_path) == "/opt/yt-dlp/yt-dlp");
    assert(cfg->usb_sync);
    assert(cfg->auto_eject);
    assert(cfg->weights.live_penalty == -30);
    assert(cfg->weights.view_threshold == 5000);
    assert(cfg->weights.like_cap == 1.5);
    // Untouched keys keep defaults.
    assert(cfg->weights.title_match == 20);
    assert(cfg->weights.like_threshold == 10000);
    assert(std::string(cfg->config_path) == path.string());
    std::cout << "[PASS] Explicit config values" << std::endl;
}

void testInvalidValues() {
    std::cout << "[Test] Invalid values are rejected..." << std::endl;
    const char* bad[] = {
        "[musicdl]\nconcurrency = 0\n",
        "[musicdl]\nconcurrency = two\n",
        "[musicdl]\njob_timeout = -1\n",
        "[musicdl]\nsearch_limit = 0\n",
        "[musicdl]\nfetch_metadata = maybe\n",
        "[usb]\nsync = 2\n",
        "[scoring]\nartist_match = 20.5\n",
        "[scoring]\nview_cap = lots\n",
    };
    const fs::path path = g_root / "bad.conf";
    for (const char* content : bad) {
        write_file(path, content);
        std::string err;
        auto cfg = load(path, err);
        assert(!cfg);
        assert(!err.empty());
    }
    std::cout << "[PASS] Invalid values are rejected" << std::endl;
}

void testMissingExplicitFile() {
    std::cout << "[Test] Missing explicit file is an error..." << std::endl;
    std::string err;
    auto cfg = load(g_root / "does-not-exist.conf", err);
    assert(!cfg);
    assert(!err.empty());
    std::cout << "[PASS] Missing explicit file is an error" << std::endl;
}

}  // namespace

int main() {
    GError* gerr = nullptr;
    gchar* dir = g_dir_make_tmp("musicdl-config-XXXXXX", &gerr);
    assert(dir != nullptr);
    g_root = dir;
    g_free(dir);

    // Isolate the search path from the real home and working directory.
    fs::create_directories(g_root / "home");
    fs::create_directories(g_root / "cwd");
    g_setenv("HOME", (g_root / "home").string().c_str(), TRUE);
    const fs::path previous = fs::current_path();
    fs::current_path(g_root / "cwd");

    testDefaults();
    testSearchOrder();
    testExplicitFile();
    testInvalidValues();
    testMissingExplicitFile();

    fs::current_path(previous);
    fs::remove_all(g_root);
    std::cout << "[PASS] All config tests" << std::endl;
    return 0;
}
