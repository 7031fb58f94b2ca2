#pragma once

// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#ifndef __MUSICDL_H
#define __MUSICDL_H

#include <stddef.h>
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ------------------------------------------------------------------- */

/**
 * Release error string allocated by library functions.
 * @param p Pointer returned via error out-parameters (nullable).
 */
void musicdl_release_error(const char* p);

/**
 * Release a string returned by library functions.
 * @param p Pointer to free (nullable).
 */
void musicdl_release_string(char* p);

/**
 * Format a UNIX timestamp in ISO-8601 local time with timezone offset.
 * @param unix_seconds Seconds since epoch.
 * @return Newly allocated string; free with musicdl_release_timestamp.
 */
char* musicdl_format_timestamp_iso(int64_t unix_seconds);
/**
 * Release a timestamp string allocated by musicdl_format_timestamp_iso.
 * @param p Pointer to free (nullable).
 */
void musicdl_release_timestamp(char* p);

/* ------------------------------------------------------------------- */

/** Error kinds raised (or recovered) while a job runs. */
typedef enum MusicDlErrorKind {
    MUSICDL_ERROR_NONE = 0,
    /** Search provider returned nothing. */
    MUSICDL_ERROR_NO_SEARCH_RESULTS = 1,
    /** Best candidate score was below zero. */
    MUSICDL_ERROR_NO_SUITABLE_MATCH = 2,
    /** Download executor failed or produced no output. */
    MUSICDL_ERROR_DOWNLOAD_FAILED = 3,
    /** Download executor reported a file that does not exist. */
    MUSICDL_ERROR_ARTIFACT_MISSING = 4,
    /** Metadata lookup failed (recovered with fallback metadata). */
    MUSICDL_ERROR_METADATA_LOOKUP_FAILED = 5,
    /** Tags could not be written or did not read back. */
    MUSICDL_ERROR_TAG_WRITE_FAILED = 6,
    /** Volume copy failed (logged only). */
    MUSICDL_ERROR_VOLUME_SYNC_FAILED = 7,
    /** Artifact could not be moved into the music directory. */
    MUSICDL_ERROR_ORGANIZE_FAILED = 8,
    /** Job was cancelled by the caller. */
    MUSICDL_ERROR_CANCELLED = 9,
    /** Job exceeded the configured timeout. */
    MUSICDL_ERROR_TIMED_OUT = 10,
} MusicDlErrorKind;

/**
 * Get a short label for an error kind.
 * @return Static string (never null).
 */
const char* musicdl_error_kind_label(MusicDlErrorKind kind);

/* ------------------------------------------------------------------- */

/** Parsed free-text query. */
typedef struct MusicDlSearchQuery {
    /** Query as submitted. */
    const char* raw_text;
    /** Artist hint (empty when the query has no separator). */
    const char* artist;
    /** Title hint (raw text when the query has no separator). */
    const char* title;
} MusicDlSearchQuery;

/**
 * Split "<artist> - <title>" into artist and title hints.
 * Never fails; a query without a dash-like separator becomes the title.
 * @param raw Raw query text (nullable => empty).
 * @return Newly allocated query; free with musicdl_release_query.
 */
MusicDlSearchQuery* musicdl_parse_query(const char* raw);
/**
 * Release parsed query.
 * @param p Query pointer (nullable).
 */
void musicdl_release_query(MusicDlSearchQuery* p);

/**
 * Strip video decoration ("(Official Video)", "[Lyrics]", "feat. X", ...) from a title.
 * @param title Title text (nullable).
 * @return Newly allocated string; free with musicdl_release_string.
 */
char* musicdl_clean_title(const char* title);

/* ------------------------------------------------------------------- */

/** One raw search result. */
typedef struct MusicDlCandidate {
    const char* id;
    const char* title;
    const char* channel;
    const char* uploader;
    long duration_seconds;
    int64_t view_count;
    int64_t like_count;
} MusicDlCandidate;

/** Ordered list of raw search results. */
typedef struct MusicDlCandidateList {
    /** Array of candidates in provider order. */
    MusicDlCandidate* candidates;
    /** Number of candidates. */
    size_t count;
} MusicDlCandidateList;

/**
 * Allocate a candidate list holding copies of the given candidates.
 * @param items Array of candidates (nullable when count is zero).
 * @param count Number of items.
 * @return Newly allocated list; free with musicdl_release_candidate_list.
 */
MusicDlCandidateList* musicdl_make_candidate_list(
    const MusicDlCandidate* items,
    size_t count);
/**
 * Release candidate list.
 * @param p List pointer (nullable).
 */
void musicdl_release_candidate_list(
    MusicDlCandidateList* p);

/* ------------------------------------------------------------------- */

/** Scoring constants. */
typedef struct MusicDlScoreWeights {
    int artist_match;
    int title_match;
    /** Per overlapping title word. */
    int word_overlap;
    /** 180-359 seconds. */
    int duration_ideal;
    /** 120-479 seconds outside the ideal band. */
    int duration_acceptable;
    /** Anything else. */
    int duration_penalty;
    /** "official audio/video/music video". */
    int official_bonus;
    /** "audio/lyrics/visualizer". */
    int audio_bonus;
    /** "live/concert/performance/cover/remix/instrumental/karaoke". */
    int live_penalty;
    /** "reaction/review/tutorial/how to/lesson". */
    int tutorial_penalty;
    /** "full album/greatest hits/compilation/mix". */
    int compilation_penalty;
    /** Channel contains the query artist. */
    int channel_artist_bonus;
    /** Channel matches "vevo" or "official". */
    int channel_official_bonus;
    /** Channel matches "music/records/entertainment". */
    int channel_label_bonus;
    int64_t view_threshold;
    double view_log_offset;
    double view_cap;
    int64_t like_threshold;
    double like_log_offset;
    double like_cap;
} MusicDlScoreWeights;

/**
 * Fill scoring constants with the built-in defaults.
 * @param out Destination (must not be null).
 */
void musicdl_default_score_weights(MusicDlScoreWeights* out);

/**
 * Score a single candidate against a parsed query.
 * @param query Parsed query.
 * @param candidate Candidate to score.
 * @param weights Scoring constants (nullable => defaults).
 * @return Signed score (deterministic).
 */
int musicdl_score_candidate(
    const MusicDlSearchQuery* query,
    const MusicDlCandidate* candidate,
    const MusicDlScoreWeights* weights /* nullable */);

/** Observer invoked for every scored candidate in provider order. */
typedef void (*MusicDlScoreCallback)(
    void* user_data,
    size_t index,
    const MusicDlCandidate* candidate,
    int score);

/** Result of candidate selection. */
typedef struct MusicDlSelection {
    /** Non-zero when a candidate was selected. */
    int matched;
    /** Index of the selected candidate (valid when matched). */
    size_t index;
    /** Score of the best candidate (valid when the list was not empty). */
    int best_score;
    /** Per-candidate scores in provider order. */
    int* scores;
    /** Number of entries in scores. */
    size_t scores_count;
} MusicDlSelection;

/**
 * Score all candidates and select the best one.
 * The first candidate with a strictly higher score wins; ties keep the earlier one.
 * No match when the list is empty or the best score is below zero.
 * @param query Parsed query.
 * @param candidates Candidates in provider order (nullable => empty).
 * @param weights Scoring constants (nullable => defaults).
 * @param on_score Observer (nullable).
 * @param user_data Passed to on_score.
 * @return Newly allocated selection; free with musicdl_release_selection.
 */
MusicDlSelection* musicdl_select_candidate(
    const MusicDlSearchQuery* query,
    const MusicDlCandidateList* candidates /* nullable */,
    const MusicDlScoreWeights* weights /* nullable */,
    MusicDlScoreCallback on_score /* nullable */,
    void* user_data);
/**
 * Release selection.
 * @param p Selection pointer (nullable).
 */
void musicdl_release_selection(MusicDlSelection* p);

/* ------------------------------------------------------------------- */

/** Cancellation token shared by a job and its collaborators. */
typedef struct MusicDlCancelToken MusicDlCancelToken;

/**
 * Check whether a token has been cancelled.
 * @param token Token (nullable => never cancelled).
 * @return Non-zero when cancelled.
 */
int musicdl_cancel_token_is_cancelled(const MusicDlCancelToken* token);

/* ------------------------------------------------------------------- */

/** Where resolved metadata came from. */
typedef enum MusicDlMetadataSource {
    MUSICDL_METADATA_RESOLVED = 0,
    MUSICDL_METADATA_FALLBACK = 1,
} MusicDlMetadataSource;

/** Resolved tag set. */
typedef struct MusicDlTrackMetadata {
    const char* title;
    const char* artist;
    const char* album;
    /** Four digit year, or null. */
    const char* year;
    /** Genre, or null. */
    const char* genre;
    MusicDlMetadataSource source;
} MusicDlTrackMetadata;

/**
 * HTTP GET used by the metadata resolver.
 * @param user_data Transport context.
 * @param url Request URL.
 * @param token Cancellation token (nullable).
 * @param body Out: newly allocated response body (release with musicdl_release_string).
 * @param error Out: error message (release with musicdl_release_error).
 * @return Non-zero on success.
 */
typedef int (*MusicDlHttpGetFunc)(
    void* user_data,
    const char* url,
    const MusicDlCancelToken* token,
    char** body,
    const char** error);

/**
 * Default transport: libsoup with retry and request spacing.
 */
int musicdl_http_get_default(
    void* user_data,
    const char* url,
    const MusicDlCancelToken* token,
    char** body,
    const char** error);

/**
 * Resolve metadata for (artist, title) from MusicBrainz.
 * Never fails: any lookup problem yields fallback metadata built from the inputs.
 * @param artist Artist hint (nullable => empty).
 * @param title Title hint (nullable => empty).
 * @param http_get Transport (nullable => musicdl_http_get_default).
 * @param http_user_data Passed to http_get.
 * @param token Cancellation token (nullable).
 * @param error Optional out-parameter describing why fallback was used.
 * @return Newly allocated metadata; free with musicdl_release_track_metadata.
 */
MusicDlTrackMetadata* musicdl_resolve_metadata(
    const char* artist,
    const char* title,
    MusicDlHttpGetFunc http_get /* nullable */,
    void* http_user_data,
    const MusicDlCancelToken* token /* nullable */,
    const char** error /* nullable */);
/**
 * Build fallback metadata directly from the inputs.
 * @return Newly allocated metadata; free with musicdl_release_track_metadata.
 */
MusicDlTrackMetadata* musicdl_make_fallback_metadata(
    const char* artist,
    const char* title);
/**
 * Release metadata.
 * @param p Metadata pointer (nullable).
 */
void musicdl_release_track_metadata(MusicDlTrackMetadata* p);

/* ------------------------------------------------------------------- */

/**
 * Write metadata as FLAC Vorbis comments and verify by re-reading them.
 * @param path FLAC file path.
 * @param meta Metadata to write.
 * @param error Optional error string out-parameter.
 * @return Non-zero on success.
 */
int musicdl_write_flac_tags(
    const char* path,
    const MusicDlTrackMetadata* meta,
    const char** error /* nullable */);

/** Tag key/value read from a file. */
typedef struct MusicDlTagKV {
    const char* key;
    const char* value;
} MusicDlTagKV;

/** List of tags read from a file. */
typedef struct MusicDlTagList {
    MusicDlTagKV* tags;
    size_t count;
} MusicDlTagList;

/**
 * Read Vorbis comments from a FLAC file (keys upper-cased).
 * @param path FLAC file path.
 * @param error Optional error string out-parameter.
 * @return Newly allocated list (null on failure); free with musicdl_release_tag_list.
 */
MusicDlTagList* musicdl_read_flac_tags(
    const char* path,
    const char** error /* nullable */);
/**
 * Release tag list.
 * @param p List pointer (nullable).
 */
void musicdl_release_tag_list(MusicDlTagList* p);

/* ------------------------------------------------------------------- */

/**
 * Sanitize a title for use as a file name.
 * Removes characters other than word characters, whitespace and dashes,
 * then replaces whitespace runs with a single underscore. Idempotent.
 * @param title Title text (nullable).
 * @return Newly allocated string; free with musicdl_release_string.
 */
char* musicdl_sanitize_title(const char* title);

/**
 * Build "<music_root>/<user_name>/<artist>/<sanitized title>.<ext>".
 * @return Newly allocated path; free with musicdl_release_string.
 */
char* musicdl_build_destination(
    const char* music_root,
    const char* user_name,
    const char* artist,
    const char* title,
    const char* extension);

/**
 * Move an artifact to its destination, creating directories and overwriting.
 * @param artifact_path Source file.
 * @param music_root Music root directory.
 * @param user_name Per-user subdirectory.
 * @param meta Metadata providing artist and title.
 * @param error Optional error string out-parameter.
 * @return Newly allocated destination path on success (free with musicdl_release_string); null on failure.
 */
char* musicdl_organize_file(
    const char* artifact_path,
    const char* music_root,
    const char* user_name,
    const MusicDlTrackMetadata* meta,
    const char** error /* nullable */);

/* ------------------------------------------------------------------- */

/** Removable volume capability (detection, copy, eject). */
typedef struct MusicDlVolumeManager {
    void* user_data;
    /**
     * Detect the first usable removable volume.
     * @return Newly allocated root path (release with musicdl_release_string), or null when none.
     */
    char* (*detect)(void* user_data);
    /**
     * Copy file into directory on the volume (force overwrite).
     * @return Non-zero on success.
     */
    int (*copy)(void* user_data, const char* file_path, const char* dest_dir, const char** error);
    /**
     * Eject the volume mounted at root.
     * @return Non-zero on success.
     */
    int (*eject)(void* user_data, const char* volume_root, const char** error);
} MusicDlVolumeManager;

/**
 * Fill a volume manager with the GIO based implementation.
 * detect and eject use the GIO volume monitor: call them from the main thread.
 * The orchestrator forwards them to the thread calling musicdl_orchestrator_poll.
 * @param out Destination (must not be null).
 */
void musicdl_default_volume_manager(MusicDlVolumeManager* out);

/** Volume sync outcome. */
typedef enum MusicDlSyncResult {
    MUSICDL_SYNC_COPIED = 0,
    MUSICDL_SYNC_NO_VOLUME = 1,
    MUSICDL_SYNC_ERROR = 2,
    /** Sync disabled by configuration; no hardware touched. */
    MUSICDL_SYNC_DISABLED = 3,
} MusicDlSyncResult;

/**
 * Copy a file onto the first removable volume under "Music/<artist>/".
 * @param file_path File to copy.
 * @param artist Artist subdirectory name.
 * @param enabled False => MUSICDL_SYNC_DISABLED without detection.
 * @param manager Volume manager (nullable => default).
 * @param volume_root Optional out: newly allocated root of the volume used (release with musicdl_release_string).
 * @param error Optional error string out-parameter.
 */
MusicDlSyncResult musicdl_try_sync(
    const char* file_path,
    const char* artist,
    bool enabled,
    const MusicDlVolumeManager* manager /* nullable */,
    char** volume_root /* nullable */,
    const char** error /* nullable */);

/* ------------------------------------------------------------------- */

/** External collaborators used by a job pipeline. */
typedef struct MusicDlBackend {
    void* user_data;
    /**
     * Search for candidates.
     * @return Newly allocated list (release with musicdl_release_candidate_list); null on failure.
     */
    MusicDlCandidateList* (*search)(
        void* user_data,
        const char* query,
        int limit,
        const MusicDlCancelToken* token,
        const char** error);
    /**
     * Download the candidate's audio into work_dir.
     * @return Newly allocated artifact path (release with musicdl_release_string); null on failure.
     */
    char* (*download)(
        void* user_data,
        const MusicDlCandidate* candidate,
        const char* work_dir,
        const MusicDlCancelToken* token,
        const char** error);
    /** Metadata service transport (nullable => musicdl_http_get_default). */
    MusicDlHttpGetFunc http_get;
    /**
     * Write tags and confirm by re-reading them (nullable => musicdl_write_flac_tags).
     * @return Non-zero on success.
     */
    int (*write_tags)(
        void* user_data,
        const char* path,
        const MusicDlTrackMetadata* meta,
        const char** error);
} MusicDlBackend;

/**
 * Fill a backend with the yt-dlp / MusicBrainz / libFLAC implementation.
 * @param out Destination (must not be null).
 * @param ytdlp_path yt-dlp executable (nullable => "yt-dlp"); must outlive the backend.
 */
void musicdl_default_backend(MusicDlBackend* out, const char* ytdlp_path /* nullable */);

/**
 * Run yt-dlp search and parse its JSON lines.
 */
MusicDlCandidateList* musicdl_ytdlp_search(
    void* user_data,
    const char* query,
    int limit,
    const MusicDlCancelToken* token,
    const char** error);
/**
 * Run yt-dlp audio extraction to FLAC.
 */
char* musicdl_ytdlp_download(
    void* user_data,
    const MusicDlCandidate* candidate,
    const char* work_dir,
    const MusicDlCancelToken* token,
    const char** error);

/* ------------------------------------------------------------------- */

/** Global configuration loaded from INI or defaults. */
typedef struct MusicDlConfig {
    /** Root of the music library. */
    const char* music_root;
    /** Per-user subdirectory. */
    const char* user_name;
    /** Maximum number of jobs running at once (>= 1). */
    int concurrency;
    /** Per-job timeout in seconds (0 => none). */
    int job_timeout_sec;
    /** Number of search results requested. */
    int search_limit;
    /** Query the metadata service. */
    bool fetch_metadata;
    /** Copy finished files onto a removable volume. */
    bool usb_sync;
    /** Eject the volume after a successful copy. */
    bool auto_eject;
    /** yt-dlp executable. */
    const char* ytdlp_path;
    /** Scoring constants. */
    MusicDlScoreWeights weights;
    /** Loaded config file path, or null when defaults. */
    const char* config_path;
} MusicDlConfig;

/**
 * Load configuration from INI file.
 * Search order when path is null: ./musicdl.conf then ~/.musicdl.conf.
 * Returns defaults if no file found; returns null on parse/load error.
 * @param path Optional explicit config path.
 * @param error Optional error string out-parameter.
 * @return Newly allocated config, must free with musicdl_release_config; null on failure.
 */
MusicDlConfig* musicdl_load_config(
    const char* path /* nullable */,
    const char** error /* nullable */);
/**
 * Release configuration and owned members.
 * @param cfg Config pointer (nullable).
 */
void musicdl_release_config(
    MusicDlConfig* cfg);

/* ------------------------------------------------------------------- */

/** Job lifecycle states. */
typedef enum MusicDlJobState {
    MUSICDL_JOB_QUEUED = 0,
    MUSICDL_JOB_RUNNING = 1,
    MUSICDL_JOB_COMPLETED = 2,
    MUSICDL_JOB_FAILED = 3,
} MusicDlJobState;

/**
 * Get a short label for a job state.
 * @return Static string (never null).
 */
const char* musicdl_job_state_label(MusicDlJobState state);

/** Running totals. */
typedef struct MusicDlAggregateStats {
    size_t queued;
    size_t running;
    size_t completed;
    size_t failed;
    size_t usb_copied;
} MusicDlAggregateStats;

/** Snapshot of a job. */
typedef struct MusicDlJobInfo {
    uint64_t id;
    const char* query;
    MusicDlJobState state;
    /** First fatal error kind, or MUSICDL_ERROR_NONE. */
    MusicDlErrorKind error_kind;
    /** Non-zero when the file was copied onto a volume. */
    int usb_copied;
    /** Final file path (nullable). */
    const char* destination;
    /** ISO-8601 timestamps (nullable when not reached). */
    const char* submitted_at;
    const char* started_at;
    const char* finished_at;
    /** Log messages in emission order (without the "<id>|" prefix). */
    const char** log_lines;
    size_t log_lines_count;
} MusicDlJobInfo;

/** Orchestrator settings. */
typedef struct MusicDlOrchestratorSettings {
    /** Maximum running jobs (< 1 => 1). */
    int concurrency;
    /** Per-job timeout in seconds (0 => none). */
    int job_timeout_sec;
    const char* music_root;
    const char* user_name;
    int search_limit;
    bool fetch_metadata;
    bool usb_sync;
    bool auto_eject;
    /** Scoring constants (nullable => defaults). */
    const MusicDlScoreWeights* weights;
} MusicDlOrchestratorSettings;

/** Opaque job orchestrator. */
typedef struct MusicDlOrchestrator MusicDlOrchestrator;

/** Called on the coordinating thread for each job log line "<id>|<message>". */
typedef void (*MusicDlLogCallback)(void* user_data, uint64_t job_id, const char* line);
/** Called on the coordinating thread after a job reached a terminal state. */
typedef void (*MusicDlTerminalCallback)(void* user_data, uint64_t job_id, MusicDlJobState state);

/**
 * Create an orchestrator.
 * @param settings Settings (copied).
 * @param backend External collaborators (copied; nullable => default backend).
 * @param volumes Volume manager (copied; nullable => default).
 * @param error Optional error string out-parameter.
 * @return Handle; free with musicdl_orchestrator_free. Null on failure.
 */
MusicDlOrchestrator* musicdl_orchestrator_new(
    const MusicDlOrchestratorSettings* settings,
    const MusicDlBackend* backend /* nullable */,
    const MusicDlVolumeManager* volumes /* nullable */,
    const char** error /* nullable */);
/**
 * Cancel running jobs, drop queued ones, wait for workers and free.
 * @param o Handle (nullable).
 */
void musicdl_orchestrator_free(MusicDlOrchestrator* o);

/** Install the log line observer (nullable to remove). */
void musicdl_orchestrator_set_log_callback(
    MusicDlOrchestrator* o,
    MusicDlLogCallback callback,
    void* user_data);
/** Install the terminal transition observer (nullable to remove). */
void musicdl_orchestrator_set_terminal_callback(
    MusicDlOrchestrator* o,
    MusicDlTerminalCallback callback,
    void* user_data);

/**
 * Submit a query. Starts immediately when below the concurrency bound, queues otherwise.
 * @return Job id (>= 1), or 0 when o or query is null.
 */
uint64_t musicdl_orchestrator_submit(
    MusicDlOrchestrator* o,
    const char* query);

/**
 * Process worker messages and timeouts, start queued jobs.
 * @param timeout_ms Maximum wait for a message (0 => do not wait).
 * @return Number of jobs that reached a terminal state.
 */
size_t musicdl_orchestrator_poll(
    MusicDlOrchestrator* o,
    int timeout_ms);

/**
 * Poll with the given tick until no job is queued or running.
 */
void musicdl_orchestrator_run_until_idle(
    MusicDlOrchestrator* o,
    int tick_ms);

/**
 * Cancel a job. Queued jobs fail immediately; running jobs fail once their worker returns.
 * @return Non-zero when the job existed and was not terminal.
 */
int musicdl_orchestrator_cancel(
    MusicDlOrchestrator* o,
    uint64_t job_id);

/**
 * @return Non-zero when no job is queued or running.
 */
int musicdl_orchestrator_is_idle(const MusicDlOrchestrator* o);

/**
 * Read aggregate counters.
 * @param out Destination (must not be null).
 */
void musicdl_orchestrator_get_stats(
    const MusicDlOrchestrator* o,
    MusicDlAggregateStats* out);

/**
 * Snapshot a job.
 * @return Newly allocated info (free with musicdl_release_job_info), or null when unknown.
 */
MusicDlJobInfo* musicdl_orchestrator_get_job(
    const MusicDlOrchestrator* o,
    uint64_t job_id);
/**
 * Release job info.
 * @param p Info pointer (nullable).
 */
void musicdl_release_job_info(MusicDlJobInfo* p);

#ifdef __cplusplus
}
#endif

#endif
