// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <cstdlib>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <FLAC/metadata.h>

#include "internal.h"

using namespace musicdl::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static FLAC__StreamMetadata* build_vorbis_comments(
    const std::map<std::string, std::string>& tags) {

    FLAC__StreamMetadata* meta = FLAC__metadata_object_new(FLAC__METADATA_TYPE_VORBIS_COMMENT);
    if (!meta) return nullptr;
    for (const auto& [key, value] : tags) {
        FLAC__StreamMetadata_VorbisComment_Entry entry;
        if (!FLAC__metadata_object_vorbiscomment_entry_from_name_value_pair(
                &entry, key.c_str(), value.c_str())) {
            FLAC__metadata_object_delete(meta);
            return nullptr;
        }
        // Ownership of entry moves into the block.
        if (!FLAC__metadata_object_vorbiscomment_append_comment(meta, entry, false)) {
            std::free(entry.entry);
            FLAC__metadata_object_delete(meta);
            return nullptr;
        }
    }
    return meta;
}

static bool collect_vorbis_comments(
    const std::string& path,
    std::map<std::string, std::string>& out) {

    FLAC__StreamMetadata* tags = nullptr;
    if (!FLAC__metadata_get_tags(path.c_str(), &tags)) {
        return false;
    }
    if (!tags || tags->type != FLAC__METADATA_TYPE_VORBIS_COMMENT) {
        if (tags) FLAC__metadata_object_delete(tags);
        return false;
    }
    const auto& vc = tags->data.vorbis_comment;
    for (uint32_t i = 0; i < vc.num_comments; ++i) {
        const auto& entry = vc.comments[i];
        char* name = nullptr;
        char* value = nullptr;
        if (FLAC__metadata_object_vorbiscomment_entry_to_name_value_pair(
                entry, &name, &value)) {
            out[to_upper(to_string_or_empty(name))] = to_string_or_empty(value);
        }
        if (name) free(name);
        if (value) free(value);
    }
    FLAC__metadata_object_delete(tags);
    return true;
}

static std::map<std::string, std::string> build_tag_map(
    const MusicDlTrackMetadata& meta) {

    std::map<std::string, std::string> tags = {
        {"TITLE", to_string_or_empty(meta.title)},
        {"ARTIST", to_string_or_empty(meta.artist)},
        {"ALBUM", to_string_or_empty(meta.album)},
        {"DATE", to_string_or_empty(meta.year)},
        {"GENRE", to_string_or_empty(meta.genre)},
        {"MUSICDL_SOURCE", meta.source == MUSICDL_METADATA_RESOLVED ? "resolved" : "fallback"},
    };
    for (auto it = tags.begin(); it != tags.end();) {
        if (it->second.empty()) it = tags.erase(it);
        else ++it;
    }
    return tags;
}

using ChainPtr = std::unique_ptr<FLAC__Metadata_Chain, decltype(&FLAC__metadata_chain_delete)>;
using IteratorPtr = std::unique_ptr<FLAC__Metadata_Iterator, decltype(&FLAC__metadata_iterator_delete)>;

// Drops every Vorbis comment block and appends one built from tags.
static bool replace_vorbis_comments(
    const std::string& path,
    const std::map<std::string, std::string>& tags,
    std::string& err) {

    ChainPtr chain(FLAC__metadata_chain_new(), &FLAC__metadata_chain_delete);
    IteratorPtr it(FLAC__metadata_iterator_new(), &FLAC__metadata_iterator_delete);
    if (!chain || !it) {
        err = "Out of memory while preparing FLAC metadata";
        return false;
    }
    if (!FLAC__metadata_chain_read(chain.get(), path.c_str())) {
        err = "Not a readable FLAC file: " + path + " (" +
            FLAC__Metadata_ChainStatusString[FLAC__metadata_chain_status(chain.get())] + ")";
        return false;
    }

    // STREAMINFO comes first, so a deletion always has a previous block to land on.
    FLAC__metadata_iterator_init(it.get(), chain.get());
    do {
        if (FLAC__metadata_iterator_get_block_type(it.get()) == FLAC__METADATA_TYPE_VORBIS_COMMENT) {
            FLAC__metadata_iterator_delete_block(it.get(), false);
        }
    } while (FLAC__metadata_iterator_next(it.get()));

    FLAC__StreamMetadata* vorbis = build_vorbis_comments(tags);
    if (!vorbis) {
        err = "Failed to build Vorbis comments";
        return false;
    }
    if (!FLAC__metadata_iterator_insert_block_after(it.get(), vorbis)) {
        FLAC__metadata_object_delete(vorbis);
        err = "Failed to insert Vorbis comment block";
        return false;
    }

    FLAC__metadata_chain_sort_padding(chain.get());
    if (!FLAC__metadata_chain_write(chain.get(), true, true)) {
        err = "Failed to write FLAC metadata: " + path + " (" +
            FLAC__Metadata_ChainStatusString[FLAC__metadata_chain_status(chain.get())] + ")";
        return false;
    }
    return true;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

int musicdl_write_flac_tags(
    const char* path,
    const MusicDlTrackMetadata* meta,
    const char** error) {

    clear_error(error);
    if (!path || !meta) {
        set_error(error, "Invalid arguments to musicdl_write_flac_tags");
        return 0;
    }

    const std::string path_str = path;
    const auto tags = build_tag_map(*meta);
    std::string err;
    if (!replace_vorbis_comments(path_str, tags, err)) {
        set_error(error, err);
        return 0;
    }

    // Confirm by re-reading.
    std::map<std::string, std::string> written;
    if (!collect_vorbis_comments(path_str, written)) {
        set_error(error, "Failed to re-read Vorbis comments: " + path_str);
        return 0;
    }
    for (const char* key : {"TITLE", "ARTIST"}) {
        const auto expected = tags.find(key);
        if (expected == tags.end()) continue;
        const auto actual = written.find(key);
        if (actual == written.end() || actual->second != expected->second) {
            set_error(error, std::string{"Tag "} + key + " did not round-trip: " + path_str);
            return 0;
        }
    }
    return 1;
}

MusicDlTagList* musicdl_read_flac_tags(
    const char* path,
    const char** error) {

    clear_error(error);
    if (!path) {
        set_error(error, "Path is null");
        return nullptr;
    }
    std::map<std::string, std::string> tags;
    if (!collect_vorbis_comments(path, tags)) {
        set_error(error, "Failed to read Vorbis comments: " + std::string{path});
        return nullptr;
    }

    auto* list = new MusicDlTagList{};
    if (!tags.empty()) {
        list->count = tags.size();
        list->tags = new MusicDlTagKV[list->count]{};
        size_t i = 0;
        for (const auto& [key, value] : tags) {
            list->tags[i++] = make_kv(key, value);
        }
    }
    return list;
}

void musicdl_release_tag_list(MusicDlTagList* p) {
    if (!p) return;
    if (p->tags) {
        for (size_t i = 0; i < p->count; ++i) {
            release_cstr(p->tags[i].key);
            release_cstr(p->tags[i].value);
        }
        delete[] p->tags;
        p->tags = nullptr;
    }
    p->count = 0;
    delete p;
}

};
