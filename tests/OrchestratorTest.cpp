// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <algorithm>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <glib.h>

#include "musicdl/musicdl.h"

namespace fs = std::filesystem;

namespace {

using OrchestratorPtr = std::unique_ptr<MusicDlOrchestrator, decltype(&musicdl_orchestrator_free)>;
using JobInfoPtr = std::unique_ptr<MusicDlJobInfo, decltype(&musicdl_release_job_info)>;

char* copy_str(const std::string& s) {
    auto* buf = new char[s.size() + 1];
    std::memcpy(buf, s.c_str(), s.size() + 1);
    return buf;
}

// Shared by all worker threads of one orchestrator.
struct FakeWorld {
    std::mutex mutex;
    std::condition_variable cv;
    bool gated{false};
    int permits{0};
    int active_downloads{0};
    int max_active_downloads{0};
    std::vector<std::string> download_order;
    int tag_writes{0};
    std::string volume_root;
    int detect_calls{0};
    int copy_calls{0};
    int eject_calls{0};
    std::vector<std::thread::id> monitor_threads;
    std::vector<std::thread::id> copy_threads;
};

// Query conventions:
//   "fail-search ..."  search transport error
//   "empty ..."        no results
//   "negative ..."     only unsuitable candidates
//   "missing ..."      download reports a path that does not exist
//   anything else      one good candidate titled after the query
MusicDlCandidateList* fake_search(
    void*, const char* query, int, const MusicDlCancelToken*, const char** error) {

    const std::string q = query;
    if (q.rfind("fail-search", 0) == 0) {
        *error = copy_str("yt-dlp exited with status 1");
        return nullptr;
    }
    if (q.rfind("empty", 0) == 0) {
        return musicdl_make_candidate_list(nullptr, 0);
    }
    MusicDlCandidate c{};
    c.uploader = "Uploader";
    c.view_count = 0;
    c.like_count = 0;
    if (q.rfind("negative", 0) == 0) {
        c.id = "neg";
        c.title = "Live Concert Cover";
        c.channel = "";
        c.duration_seconds = 600;
    } else {
        c.id = q.rfind("missing", 0) == 0 ? "missing" : query;
        c.title = query;
        c.channel = "Official";
        c.duration_seconds = 200;
    }
    return musicdl_make_candidate_list(&c, 1);
}

char* fake_download(
    void* user_data, const MusicDlCandidate* candidate, const char* work_dir,
    const MusicDlCancelToken* token, const char** error) {

    auto* world = static_cast<FakeWorld*>(user_data);
    const std::string id = candidate->id;
    {
        std::unique_lock<std::mutex> lock(world->mutex);
        world->download_order.push_back(id);
        ++world->active_downloads;
        world->max_active_downloads = std::max(world->max_active_downloads, world->active_downloads);
        while (world->gated && world->permits == 0 && !musicdl_cancel_token_is_cancelled(token)) {
            world->cv.wait_for(lock, std::chrono::milliseconds(10));
        }
        const bool cancelled = musicdl_cancel_token_is_cancelled(token) != 0;
        if (world->gated && !cancelled) --world->permits;
        --world->active_downloads;
        if (cancelled) {
            *error = copy_str("download cancelled");
            return nullptr;
        }
    }

    if (id == "missing") {
        return copy_str((fs::path(work_dir) / "gone.flac").string());
    }
    const fs::path artifact = fs::path(work_dir) / "artifact.flac";
    std::ofstream(artifact) << "fLaC";
    return copy_str(artifact.string());
}

int fake_http_get(void*, const char*, const MusicDlCancelToken*, char**, const char** error) {
    *error = copy_str("network unreachable");
    return 0;
}

int fake_write_tags(void* user_data, const char*, const MusicDlTrackMetadata* meta, const char** error) {
    auto* world = static_cast<FakeWorld*>(user_data);
    if (!meta || !meta->title || !meta->title[0]) {
        *error = copy_str("empty title");
        return 0;
    }
    std::lock_guard<std::mutex> lock(world->mutex);
    ++world->tag_writes;
    return 1;
}

char* fake_detect(void* user_data) {
    auto* world = static_cast<FakeWorld*>(user_data);
    std::lock_guard<std::mutex> lock(world->mutex);
    ++world->detect_calls;
    world->monitor_threads.push_back(std::this_thread::get_id());
    return world->volume_root.empty() ? nullptr : copy_str(world->volume_root);
}

int fake_copy(void* user_data, const char*, const char*, const char**) {
    auto* world = static_cast<FakeWorld*>(user_data);
    std::lock_guard<std::mutex> lock(world->mutex);
    ++world->copy_calls;
    world->copy_threads.push_back(std::this_thread::get_id());
    return 1;
}

int fake_eject(void* user_data, const char*, const char**) {
    auto* world = static_cast<FakeWorld*>(user_data);
    std::lock_guard<std::mutex> lock(world->mutex);
    ++world->eject_calls;
    world->monitor_threads.push_back(std::this_thread::get_id());
    return 1;
}

struct Recorder {
    std::vector<std::string> lines;
    std::map<uint64_t, int> terminal_counts;
};

void record_line(void* ud, uint64_t, const char* line) {
    static_cast<Recorder*>(ud)->lines.emplace_back(line);
}

void record_terminal(void* ud, uint64_t job_id, MusicDlJobState) {
    ++static_cast<Recorder*>(ud)->terminal_counts[job_id];
}

struct Fixture {
    fs::path root;
    FakeWorld world;
    Recorder recorder;
    MusicDlBackend backend{};
    MusicDlVolumeManager volumes{};

    Fixture() {
        GError* gerr = nullptr;
        gchar* dir = g_dir_make_tmp("musicdl-orchestrator-XXXXXX", &gerr);
        assert(dir != nullptr);
        root = dir;
        g_free(dir);

        backend.user_data = &world;
        backend.search = &fake_search;
        backend.download = &fake_download;
        backend.http_get = &fake_http_get;
        backend.write_tags = &fake_write_tags;

        volumes.user_data = &world;
        volumes.detect = &fake_detect;
        volumes.copy = &fake_copy;
        volumes.eject = &fake_eject;
    }

    ~Fixture() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    OrchestratorPtr make(int concurrency, int timeout_sec, bool usb_sync, bool fetch_metadata = false) {
        const std::string music_root = (root / "Music").string();
        MusicDlOrchestratorSettings s{};
        s.concurrency = concurrency;
        s.job_timeout_sec = timeout_sec;
        s.music_root = music_root.c_str();
        s.user_name = "alice";
        s.search_limit = 5;
        s.fetch_metadata = fetch_metadata;
        s.usb_sync = usb_sync;
        s.auto_eject = usb_sync;
        s.weights = nullptr;
        const char* err = nullptr;
        OrchestratorPtr o(musicdl_orchestrator_new(&s, &backend, &volumes, &err), &musicdl_orchestrator_free);
        assert(o);
        assert(err == nullptr);
        musicdl_orchestrator_set_log_callback(o.get(), &record_line, &recorder);
        musicdl_orchestrator_set_terminal_callback(o.get(), &record_terminal, &recorder);
        return o;
    }

    void release_downloads(int n) {
        {
            std::lock_guard<std::mutex> lock(world.mutex);
            world.permits += n;
        }
        world.cv.notify_all();
    }
};

MusicDlAggregateStats stats_of(MusicDlOrchestrator* o) {
    MusicDlAggregateStats s{};
    musicdl_orchestrator_get_stats(o, &s);
    return s;
}

JobInfoPtr job_of(MusicDlOrchestrator* o, uint64_t id) {
    return JobInfoPtr(musicdl_orchestrator_get_job(o, id), &musicdl_release_job_info);
}

// Polls until the number of settled jobs reaches target.
void poll_until_settled(MusicDlOrchestrator* o, size_t target, size_t bound) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (true) {
        musicdl_orchestrator_poll(o, 20);
        const auto s = stats_of(o);
        assert(s.running <= bound);
        if (s.completed + s.failed >= target) return;
        assert(std::chrono::steady_clock::now() < deadline);
    }
}

bool has_line(const JobInfoPtr& info, const std::string& needle) {
    for (size_t i = 0; i < info->log_lines_count; ++i) {
        if (std::string(info->log_lines[i]).find(needle) != std::string::npos) return true;
    }
    return false;
}

void testFifoAndConcurrencyBound() {
    std::cout << "[Test] FIFO start order under concurrency bound 1..." << std::endl;
    Fixture f;
    f.world.gated = true;
    auto o = f.make(1, 0, false);

    const uint64_t id1 = musicdl_orchestrator_submit(o.get(), "Queen - One");
    const uint64_t id2 = musicdl_orchestrator_submit(o.get(), "Queen - Two");
    const uint64_t id3 = musicdl_orchestrator_submit(o.get(), "Queen - Three");
    assert(id1 == 1 && id2 == 2 && id3 == 3);

    assert(job_of(o.get(), id1)->state == MUSICDL_JOB_RUNNING);
    assert(job_of(o.get(), id2)->state == MUSICDL_JOB_QUEUED);
    assert(job_of(o.get(), id3)->state == MUSICDL_JOB_QUEUED);
    auto s = stats_of(o.get());
    assert(s.running == 1 && s.queued == 2);

    f.release_downloads(1);
    poll_until_settled(o.get(), 1, 1);
    s = stats_of(o.get());
    assert(s.completed + s.failed == 1);
    assert(s.running == 1);
    assert(s.queued == 1);
    assert(job_of(o.get(), id1)->state == MUSICDL_JOB_COMPLETED);
    assert(job_of(o.get(), id2)->state == MUSICDL_JOB_RUNNING);
    assert(job_of(o.get(), id3)->state == MUSICDL_JOB_QUEUED);

    f.release_downloads(2);
    poll_until_settled(o.get(), 3, 1);
    assert(musicdl_orchestrator_is_idle(o.get()));

    assert(f.world.max_active_downloads == 1);
    assert(f.world.download_order.size() == 3);
    assert(f.world.download_order[0] == "Queen - One");
    assert(f.world.download_order[1] == "Queen - Two");
    assert(f.world.download_order[2] == "Queen - Three");

    s = stats_of(o.get());
    assert(s.completed == 3 && s.failed == 0);
    for (uint64_t id : {id1, id2, id3}) {
        assert(f.recorder.terminal_counts[id] == 1);
    }
    std::cout << "[PASS] FIFO start order under concurrency bound 1" << std::endl;
}

void testParallelBound() {
    std::cout << "[Test] Concurrency bound 2 never exceeded..." << std::endl;
    Fixture f;
    f.world.gated = true;
    auto o = f.make(2, 0, false);
    for (int i = 0; i < 5; ++i) {
        musicdl_orchestrator_submit(o.get(), ("Band - Song " + std::to_string(i)).c_str());
    }
    auto s = stats_of(o.get());
    assert(s.running == 2 && s.queued == 3);

    f.release_downloads(5);
    poll_until_settled(o.get(), 5, 2);
    s = stats_of(o.get());
    assert(s.completed == 5);
    assert(s.running == 0 && s.queued == 0);
    assert(f.world.max_active_downloads <= 2);
    std::cout << "[PASS] Concurrency bound 2 never exceeded" << std::endl;
}

void testCompletedJobDetails() {
    std::cout << "[Test] Completed job is organized and logged..." << std::endl;
    Fixture f;
    auto o = f.make(1, 0, false, true);
    const uint64_t id = musicdl_orchestrator_submit(o.get(), "Queen - Bohemian Rhapsody");
    musicdl_orchestrator_run_until_idle(o.get(), 20);

    auto info = job_of(o.get(), id);
    assert(info->state == MUSICDL_JOB_COMPLETED);
    assert(info->error_kind == MUSICDL_ERROR_NONE);
    assert(std::string(info->query) == "Queen - Bohemian Rhapsody");
    const fs::path expected = f.root / "Music" / "alice" / "Queen" / "Bohemian_Rhapsody.flac";
    assert(std::string(info->destination) == expected.string());
    assert(fs::exists(expected));
    assert(info->submitted_at && info->started_at && info->finished_at);
    assert(has_line(info, "Score "));
    // Metadata failure is recovered, not an error line.
    assert(has_line(info, "Metadata lookup failed, using fallback"));
    assert(has_line(info, "Saved: "));
    for (size_t i = 0; i < info->log_lines_count; ++i) {
        assert(std::string(info->log_lines[i]).rfind("Error:", 0) != 0);
    }
    assert(f.world.tag_writes == 1);

    // Callback lines carry the job id prefix.
    assert(!f.recorder.lines.empty());
    for (const auto& line : f.recorder.lines) {
        assert(line.rfind("1|", 0) == 0);
    }
    std::cout << "[PASS] Completed job is organized and logged" << std::endl;
}

void testFailuresAndCounterConservation() {
    std::cout << "[Test] Failures classify jobs and counters add up..." << std::endl;
    Fixture f;
    auto o = f.make(2, 0, false);
    const uint64_t ok1 = musicdl_orchestrator_submit(o.get(), "Queen - Good One");
    const uint64_t search_fail = musicdl_orchestrator_submit(o.get(), "fail-search - x");
    const uint64_t empty = musicdl_orchestrator_submit(o.get(), "empty - x");
    const uint64_t negative = musicdl_orchestrator_submit(o.get(), "negative - x");
    const uint64_t missing = musicdl_orchestrator_submit(o.get(), "missing - x");
    const uint64_t ok2 = musicdl_orchestrator_submit(o.get(), "Queen - Good Two");
    musicdl_orchestrator_run_until_idle(o.get(), 20);

    const auto s = stats_of(o.get());
    assert(s.completed + s.failed == 6);
    assert(s.completed == 2);
    assert(s.failed == 4);

    assert(job_of(o.get(), ok1)->state == MUSICDL_JOB_COMPLETED);
    assert(job_of(o.get(), ok2)->state == MUSICDL_JOB_COMPLETED);
    assert(job_of(o.get(), search_fail)->error_kind == MUSICDL_ERROR_NO_SEARCH_RESULTS);
    assert(job_of(o.get(), empty)->error_kind == MUSICDL_ERROR_NO_SEARCH_RESULTS);
    assert(job_of(o.get(), negative)->error_kind == MUSICDL_ERROR_NO_SUITABLE_MATCH);
    assert(job_of(o.get(), missing)->error_kind == MUSICDL_ERROR_ARTIFACT_MISSING);
    auto failed = job_of(o.get(), negative);
    assert(failed->state == MUSICDL_JOB_FAILED);
    assert(has_line(failed, "Error: No suitable match"));
    assert(failed->destination == nullptr);
    std::cout << "[PASS] Failures classify jobs and counters add up" << std::endl;
}

void testVolumeSync() {
    std::cout << "[Test] Volume sync counts copies..." << std::endl;
    {
        Fixture f;
        f.world.volume_root = "/media/usb0";
        auto o = f.make(1, 0, true);
        const uint64_t id = musicdl_orchestrator_submit(o.get(), "Queen - Bohemian Rhapsody");
        musicdl_orchestrator_run_until_idle(o.get(), 20);
        auto info = job_of(o.get(), id);
        assert(info->state == MUSICDL_JOB_COMPLETED);
        assert(info->usb_copied);
        assert(has_line(info, "USB_COPY_SUCCESS"));
        assert(stats_of(o.get()).usb_copied == 1);
        assert(f.world.copy_calls == 1);
        assert(f.world.eject_calls == 1);
    }
    {
        // No volume present: still completed, nothing copied.
        Fixture f;
        auto o = f.make(1, 0, true);
        musicdl_orchestrator_submit(o.get(), "Queen - Bohemian Rhapsody");
        musicdl_orchestrator_run_until_idle(o.get(), 20);
        const auto s = stats_of(o.get());
        assert(s.completed == 1 && s.usb_copied == 0);
        assert(f.world.detect_calls == 1);
    }
    {
        // Disabled: no probing at all.
        Fixture f;
        f.world.volume_root = "/media/usb0";
        auto o = f.make(1, 0, false);
        musicdl_orchestrator_submit(o.get(), "Queen - Bohemian Rhapsody");
        musicdl_orchestrator_submit(o.get(), "Queen - Another One");
        musicdl_orchestrator_run_until_idle(o.get(), 20);
        const auto s = stats_of(o.get());
        assert(s.completed == 2 && s.usb_copied == 0);
        assert(f.world.detect_calls == 0);
        assert(f.world.copy_calls == 0);
    }
    std::cout << "[PASS] Volume sync counts copies" << std::endl;
}

void testVolumeMonitorCallsOnPollingThread() {
    std::cout << "[Test] Volume detect and eject run on the polling thread..." << std::endl;
    Fixture f;
    f.world.volume_root = "/media/usb0";
    auto o = f.make(2, 0, true);
    musicdl_orchestrator_submit(o.get(), "Queen - Bohemian Rhapsody");
    musicdl_orchestrator_submit(o.get(), "Queen - Another One");
    musicdl_orchestrator_submit(o.get(), "Queen - Radio Ga Ga");
    musicdl_orchestrator_run_until_idle(o.get(), 20);

    const auto s = stats_of(o.get());
    assert(s.completed == 3 && s.usb_copied == 3);
    assert(f.world.detect_calls == 3);
    assert(f.world.eject_calls == 3);
    assert(f.world.monitor_threads.size() == 6);
    for (const auto& id : f.world.monitor_threads) {
        assert(id == std::this_thread::get_id());
    }
    // Copies stay on the workers.
    assert(f.world.copy_threads.size() == 3);
    for (const auto& id : f.world.copy_threads) {
        assert(id != std::this_thread::get_id());
    }
    std::cout << "[PASS] Volume detect and eject run on the polling thread" << std::endl;
}

void testCancel() {
    std::cout << "[Test] Cancelling queued and running jobs..." << std::endl;
    Fixture f;
    f.world.gated = true;
    auto o = f.make(1, 0, false);
    const uint64_t running = musicdl_orchestrator_submit(o.get(), "Queen - One");
    const uint64_t queued = musicdl_orchestrator_submit(o.get(), "Queen - Two");

    assert(musicdl_orchestrator_cancel(o.get(), queued) == 1);
    auto q = job_of(o.get(), queued);
    assert(q->state == MUSICDL_JOB_FAILED);
    assert(q->error_kind == MUSICDL_ERROR_CANCELLED);
    assert(q->started_at == nullptr);
    assert(f.recorder.terminal_counts[queued] == 1);
    auto s = stats_of(o.get());
    assert(s.failed == 1 && s.queued == 0 && s.running == 1);

    assert(musicdl_orchestrator_cancel(o.get(), running) == 1);
    musicdl_orchestrator_run_until_idle(o.get(), 20);
    auto r = job_of(o.get(), running);
    assert(r->state == MUSICDL_JOB_FAILED);
    assert(r->error_kind == MUSICDL_ERROR_CANCELLED);
    assert(has_line(r, "Error: Cancelled by request"));

    s = stats_of(o.get());
    assert(s.completed + s.failed == 2);
    // Terminal jobs and unknown ids cannot be cancelled.
    assert(musicdl_orchestrator_cancel(o.get(), running) == 0);
    assert(musicdl_orchestrator_cancel(o.get(), 999) == 0);
    assert(f.recorder.terminal_counts[running] == 1);
    std::cout << "[PASS] Cancelling queued and running jobs" << std::endl;
}

void testTimeout() {
    std::cout << "[Test] Job timeout fails the job and frees the slot..." << std::endl;
    Fixture f;
    f.world.gated = true;
    auto o = f.make(1, 1, false);
    const uint64_t stuck = musicdl_orchestrator_submit(o.get(), "Queen - Stuck");
    const uint64_t next = musicdl_orchestrator_submit(o.get(), "Queen - Next");
    poll_until_settled(o.get(), 1, 1);

    auto info = job_of(o.get(), stuck);
    assert(info->state == MUSICDL_JOB_FAILED);
    assert(info->error_kind == MUSICDL_ERROR_TIMED_OUT);
    assert(has_line(info, "Error: Job timed out after 1 seconds"));

    f.release_downloads(1);
    musicdl_orchestrator_run_until_idle(o.get(), 20);
    assert(job_of(o.get(), next)->state == MUSICDL_JOB_COMPLETED);
    const auto s = stats_of(o.get());
    assert(s.completed == 1 && s.failed == 1);
    std::cout << "[PASS] Job timeout fails the job and frees the slot" << std::endl;
}

void testDestroyWhileRunning() {
    std::cout << "[Test] Destroying with running jobs returns..." << std::endl;
    Fixture f;
    f.world.gated = true;
    {
        auto o = f.make(1, 0, false);
        musicdl_orchestrator_submit(o.get(), "Queen - One");
        musicdl_orchestrator_submit(o.get(), "Queen - Two");
    }
    // Only the running job ever reached the download stage.
    assert(f.world.download_order.size() <= 1);
    std::cout << "[PASS] Destroying with running jobs returns" << std::endl;
}

void testInvalidSettings() {
    std::cout << "[Test] Invalid settings are rejected..." << std::endl;
    MusicDlOrchestratorSettings s{};
    s.concurrency = 0;
    const char* err = nullptr;
    assert(musicdl_orchestrator_new(&s, nullptr, nullptr, &err) == nullptr);
    assert(err != nullptr);
    musicdl_release_error(err);
    assert(musicdl_orchestrator_new(nullptr, nullptr, nullptr, nullptr) == nullptr);
    assert(musicdl_orchestrator_submit(nullptr, "x") == 0);
    std::cout << "[PASS] Invalid settings are rejected" << std::endl;
}

}  // namespace

int main() {
    testFifoAndConcurrencyBound();
    testParallelBound();
    testCompletedJobDetails();
    testFailuresAndCounterConservation();
    testVolumeSync();
    testVolumeMonitorCallsOnPollingThread();
    testCancel();
    testTimeout();
    testDestroyWhileRunning();
    testInvalidSettings();
    std::cout << "[PASS] All orchestrator tests" << std::endl;
    return 0;
}
