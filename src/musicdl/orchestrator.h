#pragma once

// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal.h"
#include "pipeline.h"

namespace musicdl::detail {

struct VolumeReply {
    bool ok{false};
    std::string root;
    std::string error;
};

// Volume detection and eject run on the coordinating thread (inside poll),
// the worker blocks on the reply.
struct VolumeRequest {
    enum class Op {
        Detect,
        Eject,
    };
    Op op{Op::Detect};
    std::string root;
    std::promise<VolumeReply> reply;
};

struct WorkerMessage {
    enum class Kind {
        Log,
        Volume,
        Done,
    };
    uint64_t job_id{0};
    Kind kind{Kind::Log};
    std::string text;
    std::shared_ptr<VolumeRequest> volume;
    PipelineResult result;
};

// One-way channel from workers to the coordinator.
class MessageChannel {
public:
    void push(WorkerMessage message);
    // Waits up to timeout_ms for at least one message, then takes everything queued.
    std::deque<WorkerMessage> drain(int timeout_ms);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<WorkerMessage> messages_;
};

enum class JobOutcome {
    Completed,
    Failed,
};

class AggregateStats {
public:
    // The only mutator: exactly one call per job.
    void record_terminal(JobOutcome outcome, bool usb_copied);

    size_t completed() const { return completed_; }
    size_t failed() const { return failed_; }
    size_t usb_copied() const { return usb_copied_; }

private:
    size_t completed_{0};
    size_t failed_{0};
    size_t usb_copied_{0};
};

struct CancelTokenDeleter {
    void operator()(MusicDlCancelToken* token) const;
};
using CancelTokenPtr = std::unique_ptr<MusicDlCancelToken, CancelTokenDeleter>;

struct Job {
    uint64_t id{0};
    std::string query;
    MusicDlJobState state{MUSICDL_JOB_QUEUED};
    MusicDlErrorKind error_kind{MUSICDL_ERROR_NONE};
    bool usb_copied{false};
    bool timed_out{false};
    bool cancel_requested{false};
    std::string destination;
    std::string submitted_at;
    std::string started_at;
    std::string finished_at;
    std::vector<std::string> log_lines;
    std::chrono::steady_clock::time_point started;
    CancelTokenPtr token;
    std::future<void> worker;
};

struct OrchestratorSettings {
    size_t concurrency{1};
    int job_timeout_sec{0};
    PipelineSettings pipeline;
};

class Orchestrator {
public:
    Orchestrator(
        const OrchestratorSettings& settings,
        const MusicDlBackend& backend,
        const MusicDlVolumeManager& volumes);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void set_log_callback(MusicDlLogCallback callback, void* user_data);
    void set_terminal_callback(MusicDlTerminalCallback callback, void* user_data);

    uint64_t submit(const std::string& query);
    size_t poll(int timeout_ms);
    bool cancel(uint64_t job_id);

    bool is_idle() const;
    MusicDlAggregateStats stats() const;
    MusicDlJobInfo* snapshot(uint64_t job_id) const;

private:
    struct LogEvent {
        uint64_t job_id;
        std::string message;
    };
    struct TerminalEvent {
        uint64_t job_id;
        MusicDlJobState state;
    };
    struct Events {
        std::vector<LogEvent> logs;
        std::vector<TerminalEvent> terminals;
    };

    void start_job_locked(Job& job);
    void append_log_locked(Job& job, const std::string& message, Events& events);
    void finish_job_locked(Job& job, const PipelineResult& result, Events& events);
    void check_timeouts_locked(Events& events);
    void start_queued_locked();
    void serve_volume_request(VolumeRequest& request);
    void dispatch(const Events& events);

    const OrchestratorSettings settings_;
    const MusicDlBackend backend_;
    const MusicDlVolumeManager volumes_;
    std::shared_ptr<MessageChannel> channel_;

    mutable std::mutex state_mutex_;
    uint64_t next_id_{1};
    std::map<uint64_t, Job> jobs_;
    std::deque<uint64_t> queue_;
    std::set<uint64_t> running_;
    AggregateStats stats_;

    MusicDlLogCallback log_callback_{nullptr};
    void* log_user_data_{nullptr};
    MusicDlTerminalCallback terminal_callback_{nullptr};
    void* terminal_user_data_{nullptr};
};

}  // namespace musicdl::detail

struct MusicDlOrchestrator {
    std::unique_ptr<musicdl::detail::Orchestrator> impl;
};
