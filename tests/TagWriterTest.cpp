// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <FLAC++/encoder.h>
#include <glib.h>

#include "musicdl/musicdl.h"

namespace fs = std::filesystem;

namespace {

using TagListPtr = std::unique_ptr<MusicDlTagList, decltype(&musicdl_release_tag_list)>;

constexpr unsigned kChannels = 2;
constexpr unsigned kBitsPerSample = 16;
constexpr unsigned kSampleRate = 44100;

// Half a second of a quiet square wave.
void encode_test_flac(const fs::path& path) {
    FLAC::Encoder::File encoder;
    encoder.set_verify(false);
    encoder.set_compression_level(5);
    encoder.set_channels(kChannels);
    encoder.set_bits_per_sample(kBitsPerSample);
    encoder.set_sample_rate(kSampleRate);
    const FLAC__StreamEncoderInitStatus st = encoder.init(path.string().c_str());
    assert(st == FLAC__STREAM_ENCODER_INIT_STATUS_OK);

    const unsigned frames = kSampleRate / 2;
    std::vector<FLAC__int32> pcm(frames * kChannels);
    for (unsigned i = 0; i < frames; ++i) {
        const FLAC__int32 v = ((i / 50) % 2) ? 1000 : -1000;
        pcm[i * kChannels] = v;
        pcm[i * kChannels + 1] = v;
    }
    const bool ok = encoder.process_interleaved(pcm.data(), frames);
    assert(ok);
    const bool finished = encoder.finish();
    assert(finished);
}

std::map<std::string, std::string> read_tags(const fs::path& path) {
    const char* err = nullptr;
    TagListPtr list(musicdl_read_flac_tags(path.string().c_str(), &err), &musicdl_release_tag_list);
    assert(list);
    assert(err == nullptr);
    std::map<std::string, std::string> out;
    for (size_t i = 0; i < list->count; ++i) {
        out[list->tags[i].key] = list->tags[i].value;
    }
    return out;
}

void testResolvedTags(const fs::path& dir) {
    std::cout << "[Test] Resolved metadata is written and read back..." << std::endl;
    const fs::path path = dir / "resolved.flac";
    encode_test_flac(path);

    MusicDlTrackMetadata meta{};
    meta.title = "Bohemian Rhapsody";
    meta.artist = "Queen";
    meta.album = "A Night at the Opera";
    meta.year = "1975";
    meta.genre = "progressive rock";
    meta.source = MUSICDL_METADATA_RESOLVED;

    const char* err = nullptr;
    assert(musicdl_write_flac_tags(path.string().c_str(), &meta, &err) == 1);
    assert(err == nullptr);

    const auto tags = read_tags(path);
    assert(tags.at("TITLE") == "Bohemian Rhapsody");
    assert(tags.at("ARTIST") == "Queen");
    assert(tags.at("ALBUM") == "A Night at the Opera");
    assert(tags.at("DATE") == "1975");
    assert(tags.at("GENRE") == "progressive rock");
    assert(tags.at("MUSICDL_SOURCE") == "resolved");
    std::cout << "[PASS] Resolved metadata is written and read back" << std::endl;
}

void testFallbackReplacesPreviousTags(const fs::path& dir) {
    std::cout << "[Test] Fallback metadata replaces earlier tags..." << std::endl;
    const fs::path path = dir / "fallback.flac";
    encode_test_flac(path);

    MusicDlTrackMetadata first{};
    first.title = "Old Title";
    first.artist = "Old Artist";
    first.album = "Old Album";
    first.year = "2001";
    first.genre = "pop";
    first.source = MUSICDL_METADATA_RESOLVED;
    assert(musicdl_write_flac_tags(path.string().c_str(), &first, nullptr) == 1);

    std::unique_ptr<MusicDlTrackMetadata, decltype(&musicdl_release_track_metadata)> fallback(
        musicdl_make_fallback_metadata("Caf\xC3\xA9 Tacvba", "Eres"), &musicdl_release_track_metadata);
    assert(musicdl_write_flac_tags(path.string().c_str(), fallback.get(), nullptr) == 1);

    const auto tags = read_tags(path);
    assert(tags.at("TITLE") == "Eres");
    assert(tags.at("ARTIST") == "Caf\xC3\xA9 Tacvba");
    assert(tags.at("MUSICDL_SOURCE") == "fallback");
    // Empty values are not written; nothing of the old block survives.
    assert(tags.find("ALBUM") == tags.end());
    assert(tags.find("DATE") == tags.end());
    assert(tags.find("GENRE") == tags.end());
    std::cout << "[PASS] Fallback metadata replaces earlier tags" << std::endl;
}

void testNotFlac(const fs::path& dir) {
    std::cout << "[Test] Non-FLAC input is rejected..." << std::endl;
    const fs::path path = dir / "not-flac.flac";
    std::ofstream(path) << "this is not a flac stream";

    MusicDlTrackMetadata meta{};
    meta.title = "Song";
    meta.artist = "Artist";
    meta.album = "";
    meta.source = MUSICDL_METADATA_FALLBACK;

    const char* err = nullptr;
    assert(musicdl_write_flac_tags(path.string().c_str(), &meta, &err) == 0);
    assert(err != nullptr);
    musicdl_release_error(err);

    err = nullptr;
    assert(musicdl_write_flac_tags((dir / "absent.flac").string().c_str(), &meta, &err) == 0);
    assert(err != nullptr);
    musicdl_release_error(err);
    std::cout << "[PASS] Non-FLAC input is rejected" << std::endl;
}

}  // namespace

int main() {
    GError* gerr = nullptr;
    gchar* tmp = g_dir_make_tmp("musicdl-tags-XXXXXX", &gerr);
    assert(tmp != nullptr);
    const fs::path dir(tmp);
    g_free(tmp);

    testResolvedTags(dir);
    testFallbackReplacesPreviousTags(dir);
    testNotFlac(dir);

    fs::remove_all(dir);
    std::cout << "[PASS] All tag writer tests" << std::endl;
    return 0;
}
