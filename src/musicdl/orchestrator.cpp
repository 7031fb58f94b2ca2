// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <thread>
#include <utility>

#include <gio/gio.h>

#include "internal.h"
#include "orchestrator.h"

using namespace musicdl::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static CancelTokenPtr make_cancel_token() {
    auto* token = new MusicDlCancelToken{};
    token->cancellable = g_cancellable_new();
    return CancelTokenPtr(token);
}

// Worker side of the volume manager: copy runs in place, detect and eject are
// forwarded to the coordinating thread.
struct VolumeRelay {
    std::shared_ptr<MessageChannel> channel;
    uint64_t job_id{0};
    const MusicDlCancelToken* token{nullptr};
    MusicDlVolumeManager inner{};
};

static VolumeReply request_volume_op(
    VolumeRelay& relay,
    VolumeRequest::Op op,
    const std::string& root) {

    auto request = std::make_shared<VolumeRequest>();
    request->op = op;
    request->root = root;
    std::future<VolumeReply> reply = request->reply.get_future();

    WorkerMessage message;
    message.job_id = relay.job_id;
    message.kind = WorkerMessage::Kind::Volume;
    message.volume = std::move(request);
    relay.channel->push(std::move(message));

    GCancellable* cancellable = cancellable_of(relay.token);
    while (reply.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (cancellable && g_cancellable_is_cancelled(cancellable)) {
            VolumeReply cancelled;
            cancelled.error = "Cancelled while waiting for volume";
            return cancelled;
        }
    }
    try {
        return reply.get();
    } catch (const std::exception& ex) {
        VolumeReply broken;
        broken.error = ex.what();
        return broken;
    }
}

static char* relay_detect(void* user_data) {
    auto* relay = static_cast<VolumeRelay*>(user_data);
    const VolumeReply reply = request_volume_op(*relay, VolumeRequest::Op::Detect, {});
    return reply.ok ? make_mutable_cstr_copy(reply.root) : nullptr;
}

static int relay_copy(
    void* user_data,
    const char* file_path,
    const char* dest_dir,
    const char** error) {

    auto* relay = static_cast<VolumeRelay*>(user_data);
    return relay->inner.copy(relay->inner.user_data, file_path, dest_dir, error);
}

static int relay_eject(
    void* user_data,
    const char* volume_root,
    const char** error) {

    clear_error(error);
    auto* relay = static_cast<VolumeRelay*>(user_data);
    const VolumeReply reply = request_volume_op(
        *relay, VolumeRequest::Op::Eject, to_string_or_empty(volume_root));
    if (!reply.ok) set_error(error, reply.error);
    return reply.ok ? 1 : 0;
}

// Runs on the worker thread; touches nothing but its own copies and the channel.
static void run_worker(
    std::shared_ptr<MessageChannel> channel,
    uint64_t job_id,
    std::string query,
    PipelineSettings settings,
    MusicDlBackend backend,
    MusicDlVolumeManager volumes,
    const MusicDlCancelToken* token) {

    const LogSink log = [&channel, job_id](const std::string& line) {
        WorkerMessage message;
        message.job_id = job_id;
        message.kind = WorkerMessage::Kind::Log;
        message.text = line;
        channel->push(std::move(message));
    };

    VolumeRelay relay;
    relay.channel = channel;
    relay.job_id = job_id;
    relay.token = token;
    relay.inner = volumes;

    MusicDlVolumeManager relayed{};
    relayed.user_data = &relay;
    relayed.detect = volumes.detect ? &relay_detect : nullptr;
    relayed.copy = volumes.copy ? &relay_copy : nullptr;
    relayed.eject = volumes.eject ? &relay_eject : nullptr;

    PipelineResult result;
    try {
        result = run_job_pipeline(query, settings, backend, relayed, token, log);
    } catch (const std::exception& ex) {
        log(std::string{kErrorPrefix} + " Unexpected failure: " + ex.what());
    }

    WorkerMessage done;
    done.job_id = job_id;
    done.kind = WorkerMessage::Kind::Done;
    done.result = std::move(result);
    channel->push(std::move(done));
}

/* ------------------------------------------------------------------- */

namespace musicdl::detail {

void CancelTokenDeleter::operator()(MusicDlCancelToken* token) const {
    if (!token) return;
    if (token->cancellable) g_object_unref(token->cancellable);
    delete token;
}

void MessageChannel::push(WorkerMessage message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(std::move(message));
    }
    cv_.notify_one();
}

std::deque<WorkerMessage> MessageChannel::drain(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (messages_.empty() && timeout_ms > 0) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
            [this] { return !messages_.empty(); });
    }
    std::deque<WorkerMessage> out;
    out.swap(messages_);
    return out;
}

void AggregateStats::record_terminal(JobOutcome outcome, bool usb_copied) {
    if (outcome == JobOutcome::Completed) ++completed_;
    else ++failed_;
    if (usb_copied) ++usb_copied_;
}

Orchestrator::Orchestrator(
    const OrchestratorSettings& settings,
    const MusicDlBackend& backend,
    const MusicDlVolumeManager& volumes)
    : settings_(settings),
      backend_(backend),
      volumes_(volumes),
      channel_(std::make_shared<MessageChannel>()) {
}

Orchestrator::~Orchestrator() {
    std::vector<std::future<void>*> workers;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        queue_.clear();
        for (const uint64_t id : running_) {
            Job& job = jobs_.at(id);
            if (job.token) g_cancellable_cancel(job.token->cancellable);
            if (job.worker.valid()) workers.push_back(&job.worker);
        }
    }
    // Tokens stay alive until every worker has returned.
    for (auto* worker : workers) {
        worker->wait();
    }
}

void Orchestrator::set_log_callback(MusicDlLogCallback callback, void* user_data) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    log_callback_ = callback;
    log_user_data_ = user_data;
}

void Orchestrator::set_terminal_callback(MusicDlTerminalCallback callback, void* user_data) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    terminal_callback_ = callback;
    terminal_user_data_ = user_data;
}

uint64_t Orchestrator::submit(const std::string& query) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const uint64_t id = next_id_++;
    Job& job = jobs_[id];
    job.id = id;
    job.query = query;
    job.submitted_at = current_timestamp_iso();
    if (running_.size() < settings_.concurrency && queue_.empty()) {
        start_job_locked(job);
    } else {
        queue_.push_back(id);
    }
    return id;
}

void Orchestrator::start_job_locked(Job& job) {
    job.state = MUSICDL_JOB_RUNNING;
    job.started_at = current_timestamp_iso();
    job.started = std::chrono::steady_clock::now();
    job.token = make_cancel_token();
    running_.insert(job.id);
    job.worker = std::async(
        std::launch::async,
        &run_worker,
        channel_,
        job.id,
        job.query,
        settings_.pipeline,
        backend_,
        volumes_,
        static_cast<const MusicDlCancelToken*>(job.token.get()));
}

void Orchestrator::append_log_locked(Job& job, const std::string& message, Events& events) {
    job.log_lines.push_back(message);
    events.logs.push_back(LogEvent{job.id, message});
}

void Orchestrator::finish_job_locked(Job& job, const PipelineResult& result, Events& events) {
    bool failed = false;
    bool usb_copied = false;
    for (const auto& line : job.log_lines) {
        if (is_error_line(line)) failed = true;
        if (line == kUsbCopySuccess) usb_copied = true;
    }

    if (job.error_kind == MUSICDL_ERROR_NONE) job.error_kind = result.error_kind;
    job.destination = result.destination;
    job.usb_copied = usb_copied;
    job.state = failed ? MUSICDL_JOB_FAILED : MUSICDL_JOB_COMPLETED;
    job.finished_at = current_timestamp_iso();
    stats_.record_terminal(failed ? JobOutcome::Failed : JobOutcome::Completed, usb_copied);

    running_.erase(job.id);
    if (job.worker.valid()) job.worker.wait();
    events.terminals.push_back(TerminalEvent{job.id, job.state});
}

void Orchestrator::check_timeouts_locked(Events& events) {
    if (settings_.job_timeout_sec <= 0) return;
    const auto now = std::chrono::steady_clock::now();
    const auto limit = std::chrono::seconds(settings_.job_timeout_sec);
    for (const uint64_t id : running_) {
        Job& job = jobs_.at(id);
        if (job.timed_out || now - job.started < limit) continue;
        job.timed_out = true;
        if (job.error_kind == MUSICDL_ERROR_NONE) job.error_kind = MUSICDL_ERROR_TIMED_OUT;
        append_log_locked(job,
            std::string{kErrorPrefix} + " Job timed out after " +
                std::to_string(settings_.job_timeout_sec) + " seconds",
            events);
        // The slot is held until the worker reports back.
        g_cancellable_cancel(job.token->cancellable);
    }
}

void Orchestrator::start_queued_locked() {
    while (running_.size() < settings_.concurrency && !queue_.empty()) {
        const uint64_t id = queue_.front();
        queue_.pop_front();
        start_job_locked(jobs_.at(id));
    }
}

void Orchestrator::serve_volume_request(VolumeRequest& request) {
    VolumeReply reply;
    if (request.op == VolumeRequest::Op::Detect) {
        char* root = volumes_.detect ? volumes_.detect(volumes_.user_data) : nullptr;
        reply.ok = root != nullptr;
        reply.root = to_string_or_empty(root);
        musicdl_release_string(root);
    } else if (!volumes_.eject) {
        reply.error = "Eject is not supported";
    } else {
        const char* err = nullptr;
        reply.ok = volumes_.eject(volumes_.user_data, request.root.c_str(), &err) != 0;
        if (reply.ok) musicdl_release_error(err);
        else reply.error = take_error(err, "unknown error");
    }
    request.reply.set_value(std::move(reply));
}

size_t Orchestrator::poll(int timeout_ms) {
    std::deque<WorkerMessage> messages = channel_->drain(timeout_ms);

    // Outside the state lock: eject may spin a main loop.
    for (auto& message : messages) {
        if (message.kind == WorkerMessage::Kind::Volume && message.volume) {
            serve_volume_request(*message.volume);
        }
    }

    Events events;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& message : messages) {
            auto it = jobs_.find(message.job_id);
            if (it == jobs_.end()) continue;
            Job& job = it->second;
            if (message.kind == WorkerMessage::Kind::Log) {
                append_log_locked(job, message.text, events);
            } else if (message.kind == WorkerMessage::Kind::Done) {
                finish_job_locked(job, message.result, events);
            }
        }
        check_timeouts_locked(events);
        start_queued_locked();
    }

    dispatch(events);
    return events.terminals.size();
}

bool Orchestrator::cancel(uint64_t job_id) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end()) return false;
        Job& job = it->second;

        if (job.state == MUSICDL_JOB_QUEUED) {
            queue_.erase(std::remove(queue_.begin(), queue_.end(), job_id), queue_.end());
            job.error_kind = MUSICDL_ERROR_CANCELLED;
            append_log_locked(job, std::string{kErrorPrefix} + " Cancelled before start", events);
            job.state = MUSICDL_JOB_FAILED;
            job.finished_at = current_timestamp_iso();
            stats_.record_terminal(JobOutcome::Failed, false);
            events.terminals.push_back(TerminalEvent{job.id, job.state});
        } else if (job.state == MUSICDL_JOB_RUNNING) {
            if (!job.cancel_requested) {
                job.cancel_requested = true;
                if (job.error_kind == MUSICDL_ERROR_NONE) job.error_kind = MUSICDL_ERROR_CANCELLED;
                append_log_locked(job, std::string{kErrorPrefix} + " Cancelled by request", events);
                g_cancellable_cancel(job.token->cancellable);
            }
        } else {
            return false;
        }
    }

    dispatch(events);
    return true;
}

void Orchestrator::dispatch(const Events& events) {
    MusicDlLogCallback log_callback = nullptr;
    void* log_user_data = nullptr;
    MusicDlTerminalCallback terminal_callback = nullptr;
    void* terminal_user_data = nullptr;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        log_callback = log_callback_;
        log_user_data = log_user_data_;
        terminal_callback = terminal_callback_;
        terminal_user_data = terminal_user_data_;
    }

    if (log_callback) {
        for (const auto& e : events.logs) {
            const std::string line = std::to_string(e.job_id) + "|" + e.message;
            log_callback(log_user_data, e.job_id, line.c_str());
        }
    }
    if (terminal_callback) {
        for (const auto& e : events.terminals) {
            terminal_callback(terminal_user_data, e.job_id, e.state);
        }
    }
}

bool Orchestrator::is_idle() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return queue_.empty() && running_.empty();
}

MusicDlAggregateStats Orchestrator::stats() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    MusicDlAggregateStats out{};
    out.queued = queue_.size();
    out.running = running_.size();
    out.completed = stats_.completed();
    out.failed = stats_.failed();
    out.usb_copied = stats_.usb_copied();
    return out;
}

MusicDlJobInfo* Orchestrator::snapshot(uint64_t job_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return nullptr;
    const Job& job = it->second;

    auto* info = new MusicDlJobInfo{};
    info->id = job.id;
    info->query = make_cstr_copy(job.query);
    info->state = job.state;
    info->error_kind = job.error_kind;
    info->usb_copied = job.usb_copied ? 1 : 0;
    info->destination = make_nullable_cstr_copy(job.destination);
    info->submitted_at = make_nullable_cstr_copy(job.submitted_at);
    info->started_at = make_nullable_cstr_copy(job.started_at);
    info->finished_at = make_nullable_cstr_copy(job.finished_at);
    if (!job.log_lines.empty()) {
        info->log_lines_count = job.log_lines.size();
        info->log_lines = new const char*[info->log_lines_count]{};
        for (size_t i = 0; i < job.log_lines.size(); ++i) {
            info->log_lines[i] = make_cstr_copy(job.log_lines[i]);
        }
    }
    return info;
}

}  // namespace musicdl::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

const char* musicdl_job_state_label(MusicDlJobState state) {
    switch (state) {
        case MUSICDL_JOB_QUEUED: return "queued";
        case MUSICDL_JOB_RUNNING: return "running";
        case MUSICDL_JOB_COMPLETED: return "completed";
        case MUSICDL_JOB_FAILED: return "failed";
    }
    return "unknown";
}

MusicDlOrchestrator* musicdl_orchestrator_new(
    const MusicDlOrchestratorSettings* settings,
    const MusicDlBackend* backend,
    const MusicDlVolumeManager* volumes,
    const char** error) {

    clear_error(error);
    if (!settings) {
        set_error(error, "Orchestrator settings are null");
        return nullptr;
    }
    if (!settings->music_root || settings->music_root[0] == '\0') {
        set_error(error, "Music root is not set");
        return nullptr;
    }

    OrchestratorSettings s;
    s.concurrency = static_cast<size_t>(std::max(1, settings->concurrency));
    s.job_timeout_sec = std::max(0, settings->job_timeout_sec);
    s.pipeline.music_root = settings->music_root;
    s.pipeline.user_name = to_string_or_empty(settings->user_name);
    s.pipeline.search_limit = settings->search_limit > 0 ? settings->search_limit : 10;
    s.pipeline.fetch_metadata = settings->fetch_metadata;
    s.pipeline.usb_sync = settings->usb_sync;
    s.pipeline.auto_eject = settings->auto_eject;
    if (settings->weights) s.pipeline.weights = *settings->weights;
    else musicdl_default_score_weights(&s.pipeline.weights);

    MusicDlBackend b{};
    if (backend) b = *backend;
    else musicdl_default_backend(&b, nullptr);

    MusicDlVolumeManager v{};
    if (volumes) v = *volumes;
    else musicdl_default_volume_manager(&v);

    auto* o = new MusicDlOrchestrator{};
    o->impl = std::make_unique<Orchestrator>(s, b, v);
    return o;
}

void musicdl_orchestrator_free(MusicDlOrchestrator* o) {
    delete o;
}

void musicdl_orchestrator_set_log_callback(
    MusicDlOrchestrator* o,
    MusicDlLogCallback callback,
    void* user_data) {

    if (!o) return;
    o->impl->set_log_callback(callback, user_data);
}

void musicdl_orchestrator_set_terminal_callback(
    MusicDlOrchestrator* o,
    MusicDlTerminalCallback callback,
    void* user_data) {

    if (!o) return;
    o->impl->set_terminal_callback(callback, user_data);
}

uint64_t musicdl_orchestrator_submit(
    MusicDlOrchestrator* o,
    const char* query) {

    if (!o || !query) return 0;
    return o->impl->submit(query);
}

size_t musicdl_orchestrator_poll(
    MusicDlOrchestrator* o,
    int timeout_ms) {

    if (!o) return 0;
    return o->impl->poll(timeout_ms);
}

void musicdl_orchestrator_run_until_idle(
    MusicDlOrchestrator* o,
    int tick_ms) {

    if (!o) return;
    const int tick = tick_ms > 0 ? tick_ms : 200;
    while (!o->impl->is_idle()) {
        o->impl->poll(tick);
    }
}

int musicdl_orchestrator_cancel(
    MusicDlOrchestrator* o,
    uint64_t job_id) {

    if (!o) return 0;
    return o->impl->cancel(job_id) ? 1 : 0;
}

int musicdl_orchestrator_is_idle(const MusicDlOrchestrator* o) {
    if (!o) return 1;
    return o->impl->is_idle() ? 1 : 0;
}

void musicdl_orchestrator_get_stats(
    const MusicDlOrchestrator* o,
    MusicDlAggregateStats* out) {

    if (!out) return;
    *out = MusicDlAggregateStats{};
    if (!o) return;
    *out = o->impl->stats();
}

MusicDlJobInfo* musicdl_orchestrator_get_job(
    const MusicDlOrchestrator* o,
    uint64_t job_id) {

    if (!o) return nullptr;
    return o->impl->snapshot(job_id);
}

void musicdl_release_job_info(MusicDlJobInfo* p) {
    if (!p) return;
    release_cstr(p->query);
    release_cstr(p->destination);
    release_cstr(p->submitted_at);
    release_cstr(p->started_at);
    release_cstr(p->finished_at);
    if (p->log_lines) {
        for (size_t i = 0; i < p->log_lines_count; ++i) {
            release_cstr(p->log_lines[i]);
        }
        delete[] p->log_lines;
        p->log_lines = nullptr;
    }
    p->log_lines_count = 0;
    delete p;
}

};
