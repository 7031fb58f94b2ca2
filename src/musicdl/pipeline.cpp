// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>

#include <glib.h>

#include "internal.h"
#include "pipeline.h"

using namespace musicdl::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

using QueryPtr = std::unique_ptr<MusicDlSearchQuery, decltype(&musicdl_release_query)>;
using CandidateListPtr = std::unique_ptr<MusicDlCandidateList, decltype(&musicdl_release_candidate_list)>;
using SelectionPtr = std::unique_ptr<MusicDlSelection, decltype(&musicdl_release_selection)>;
using MetadataPtr = std::unique_ptr<MusicDlTrackMetadata, decltype(&musicdl_release_track_metadata)>;

struct ScoreLogContext {
    const LogSink* log;
};

// Per-job scratch directory, removed with everything left inside.
class WorkDir {
public:
    WorkDir() {
        GError* gerr = nullptr;
        gchar* dir = g_dir_make_tmp("musicdlXXXXXX", &gerr);
        if (!dir) {
            const std::string message = "Failed to create work directory: " +
                gerror_message(gerr, "unknown error");
            g_clear_error(&gerr);
            throw PipelineError(MUSICDL_ERROR_DOWNLOAD_FAILED, message);
        }
        path_ = dir;
        g_free(dir);
    }

    ~WorkDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    WorkDir(const WorkDir&) = delete;
    WorkDir& operator=(const WorkDir&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

static void on_candidate_scored(
    void* user_data,
    size_t index,
    const MusicDlCandidate* candidate,
    int score) {

    auto* ctx = static_cast<ScoreLogContext*>(user_data);
    std::ostringstream oss;
    oss << "Score " << score << " [" << (index + 1) << "] "
        << to_string_or_empty(candidate->title);
    const std::string channel = to_string_or_empty(candidate->channel);
    if (!channel.empty()) oss << " (" << channel << ")";
    (*ctx->log)(oss.str());
}

[[noreturn]] static void fail_stage(
    const MusicDlCancelToken* token,
    MusicDlErrorKind kind,
    const std::string& message) {

    if (musicdl_cancel_token_is_cancelled(token)) {
        throw PipelineError(MUSICDL_ERROR_CANCELLED, "Cancelled");
    }
    throw PipelineError(kind, message);
}

static void check_cancelled(const MusicDlCancelToken* token) {
    if (musicdl_cancel_token_is_cancelled(token)) {
        throw PipelineError(MUSICDL_ERROR_CANCELLED, "Cancelled");
    }
}

static MetadataPtr resolve_track_metadata(
    const MusicDlSearchQuery& query,
    const MusicDlCandidate& selected,
    const PipelineSettings& settings,
    const MusicDlBackend& backend,
    const MusicDlCancelToken* token,
    const LogSink& log) {

    // Query hints win; otherwise derive them from the selected video.
    std::string artist = to_string_or_empty(query.artist);
    std::string title = to_string_or_empty(query.title);
    if (artist.empty()) {
        const std::string video_title = to_string_or_empty(selected.title);
        if (const auto split = split_dash_separated(video_title)) {
            artist = split->first;
        }
        if (artist.empty()) artist = to_string_or_empty(selected.channel);
        if (artist.empty()) artist = to_string_or_empty(selected.uploader);
        title = clean_video_title(video_title);
    }

    if (!settings.fetch_metadata) {
        log("Metadata lookup disabled, using \"" + artist + " - " + title + "\"");
        return MetadataPtr(
            musicdl_make_fallback_metadata(artist.c_str(), title.c_str()),
            &musicdl_release_track_metadata);
    }

    log("Looking up metadata: " + artist + " - " + title);
    const char* err = nullptr;
    MetadataPtr meta(
        musicdl_resolve_metadata(
            artist.c_str(), title.c_str(), backend.http_get, backend.user_data, token, &err),
        &musicdl_release_track_metadata);
    if (meta->source == MUSICDL_METADATA_FALLBACK) {
        // Recovered: never fails the job.
        log("Metadata lookup failed, using fallback: " + take_error(err, "no result"));
    } else {
        musicdl_release_error(err);
        std::ostringstream oss;
        oss << "Metadata: " << to_string_or_empty(meta->artist) << " - "
            << to_string_or_empty(meta->title);
        if (meta->album && meta->album[0]) oss << " / " << meta->album;
        if (meta->year) oss << " (" << meta->year << ")";
        if (meta->genre) oss << " [" << meta->genre << "]";
        log(oss.str());
    }
    return meta;
}

static void sync_to_volume(
    const std::string& destination,
    const MusicDlTrackMetadata& meta,
    const PipelineSettings& settings,
    const MusicDlVolumeManager& volumes,
    PipelineResult& result,
    const LogSink& log) {

    char* volume_root = nullptr;
    const char* err = nullptr;
    const MusicDlSyncResult sync = musicdl_try_sync(
        destination.c_str(),
        meta.artist,
        settings.usb_sync,
        &volumes,
        &volume_root,
        &err);
    switch (sync) {
        case MUSICDL_SYNC_DISABLED:
            break;
        case MUSICDL_SYNC_NO_VOLUME:
            log("No removable volume found, skipped copy");
            break;
        case MUSICDL_SYNC_ERROR:
            // Logged only.
            log("Volume sync failed: " + take_error(err, "unknown error"));
            break;
        case MUSICDL_SYNC_COPIED: {
            result.usb_copied = true;
            const std::string root = to_string_or_empty(volume_root);
            log("Copied to volume " + root);
            log(kUsbCopySuccess);
            if (settings.auto_eject && volumes.eject) {
                const char* eject_err = nullptr;
                if (volumes.eject(volumes.user_data, root.c_str(), &eject_err)) {
                    log("Ejected " + root);
                } else {
                    log("Eject failed: " + take_error(eject_err, "unknown error"));
                }
                musicdl_release_error(eject_err);
            }
            break;
        }
    }
    musicdl_release_error(err);
    musicdl_release_string(volume_root);
}

static void run_stages(
    const std::string& raw_query,
    const PipelineSettings& settings,
    const MusicDlBackend& backend,
    const MusicDlVolumeManager& volumes,
    const MusicDlCancelToken* token,
    const LogSink& log,
    PipelineResult& result) {

    QueryPtr query(musicdl_parse_query(raw_query.c_str()), &musicdl_release_query);
    log("Query: artist=\"" + to_string_or_empty(query->artist) +
        "\" title=\"" + to_string_or_empty(query->title) + "\"");

    check_cancelled(token);
    if (!backend.search || !backend.download) {
        throw PipelineError(MUSICDL_ERROR_DOWNLOAD_FAILED, "Backend is incomplete");
    }

    const char* err = nullptr;
    CandidateListPtr candidates(
        backend.search(backend.user_data, raw_query.c_str(), settings.search_limit, token, &err),
        &musicdl_release_candidate_list);
    if (!candidates) {
        fail_stage(token, MUSICDL_ERROR_NO_SEARCH_RESULTS,
            "Search failed: " + take_error(err, "unknown error"));
    }
    musicdl_release_error(err);
    err = nullptr;
    if (candidates->count == 0) {
        fail_stage(token, MUSICDL_ERROR_NO_SEARCH_RESULTS, "No search results for \"" + raw_query + "\"");
    }
    log("Found " + std::to_string(candidates->count) + " candidate(s)");

    ScoreLogContext score_ctx{&log};
    SelectionPtr selection(
        musicdl_select_candidate(query.get(), candidates.get(), &settings.weights,
            &on_candidate_scored, &score_ctx),
        &musicdl_release_selection);
    if (!selection->matched) {
        fail_stage(token, MUSICDL_ERROR_NO_SUITABLE_MATCH,
            "No suitable match (best score " + std::to_string(selection->best_score) + ")");
    }
    const MusicDlCandidate& selected = candidates->candidates[selection->index];
    log("Selected: " + to_string_or_empty(selected.title) +
        " (score " + std::to_string(selection->best_score) + ")");

    check_cancelled(token);
    WorkDir work_dir;
    log("Downloading " + to_string_or_empty(selected.id));
    char* artifact_raw = backend.download(
        backend.user_data, &selected, work_dir.path().c_str(), token, &err);
    if (!artifact_raw) {
        fail_stage(token, MUSICDL_ERROR_DOWNLOAD_FAILED,
            "Download failed: " + take_error(err, "no output"));
    }
    musicdl_release_error(err);
    err = nullptr;
    const std::string artifact = trim(to_string_or_empty(artifact_raw));
    musicdl_release_string(artifact_raw);
    if (artifact.empty()) {
        fail_stage(token, MUSICDL_ERROR_DOWNLOAD_FAILED, "Download failed: no output");
    }
    if (!g_file_test(artifact.c_str(), G_FILE_TEST_IS_REGULAR)) {
        fail_stage(token, MUSICDL_ERROR_ARTIFACT_MISSING, "Downloaded file not found: " + artifact);
    }

    check_cancelled(token);
    MetadataPtr meta = resolve_track_metadata(*query, selected, settings, backend, token, log);

    check_cancelled(token);
    const int tagged = backend.write_tags
        ? backend.write_tags(backend.user_data, artifact.c_str(), meta.get(), &err)
        : musicdl_write_flac_tags(artifact.c_str(), meta.get(), &err);
    if (!tagged) {
        fail_stage(token, MUSICDL_ERROR_TAG_WRITE_FAILED,
            "Tag write failed: " + take_error(err, "unknown error"));
    }
    musicdl_release_error(err);
    err = nullptr;

    check_cancelled(token);
    char* destination_raw = musicdl_organize_file(
        artifact.c_str(),
        settings.music_root.c_str(),
        settings.user_name.c_str(),
        meta.get(),
        &err);
    if (!destination_raw) {
        fail_stage(token, MUSICDL_ERROR_ORGANIZE_FAILED, take_error(err, "Failed to organize file"));
    }
    musicdl_release_error(err);
    result.destination = to_string_or_empty(destination_raw);
    musicdl_release_string(destination_raw);
    log("Saved: " + result.destination);

    sync_to_volume(result.destination, *meta, settings, volumes, result, log);
}

/* ------------------------------------------------------------------- */

namespace musicdl::detail {

PipelineResult run_job_pipeline(
    const std::string& raw_query,
    const PipelineSettings& settings,
    const MusicDlBackend& backend,
    const MusicDlVolumeManager& volumes,
    const MusicDlCancelToken* token,
    const LogSink& log) {

    PipelineResult result;
    try {
        run_stages(raw_query, settings, backend, volumes, token, log, result);
    } catch (const PipelineError& ex) {
        result.error_kind = ex.kind();
        log(std::string{kErrorPrefix} + " " + ex.what());
    }
    return result;
}

}  // namespace musicdl::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

int musicdl_cancel_token_is_cancelled(const MusicDlCancelToken* token) {
    GCancellable* cancellable = cancellable_of(token);
    return (cancellable && g_cancellable_is_cancelled(cancellable)) ? 1 : 0;
}

const char* musicdl_error_kind_label(MusicDlErrorKind kind) {
    switch (kind) {
        case MUSICDL_ERROR_NONE: return "none";
        case MUSICDL_ERROR_NO_SEARCH_RESULTS: return "no-search-results";
        case MUSICDL_ERROR_NO_SUITABLE_MATCH: return "no-suitable-match";
        case MUSICDL_ERROR_DOWNLOAD_FAILED: return "download-failed";
        case MUSICDL_ERROR_ARTIFACT_MISSING: return "artifact-missing";
        case MUSICDL_ERROR_METADATA_LOOKUP_FAILED: return "metadata-lookup-failed";
        case MUSICDL_ERROR_TAG_WRITE_FAILED: return "tag-write-failed";
        case MUSICDL_ERROR_VOLUME_SYNC_FAILED: return "volume-sync-failed";
        case MUSICDL_ERROR_ORGANIZE_FAILED: return "organize-failed";
        case MUSICDL_ERROR_CANCELLED: return "cancelled";
        case MUSICDL_ERROR_TIMED_OUT: return "timed-out";
    }
    return "unknown";
}

};
