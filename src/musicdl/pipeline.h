#pragma once

// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <functional>
#include <stdexcept>
#include <string>

#include "internal.h"

namespace musicdl::detail {

// Reserved log message reporting a finished volume copy.
constexpr const char* kUsbCopySuccess = "USB_COPY_SUCCESS";
// Prefix marking a fatal job log line.
constexpr const char* kErrorPrefix = "Error:";

class PipelineError : public std::runtime_error {
public:
    PipelineError(MusicDlErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    MusicDlErrorKind kind() const noexcept { return kind_; }

private:
    MusicDlErrorKind kind_;
};

struct PipelineSettings {
    std::string music_root;
    std::string user_name;
    int search_limit{10};
    bool fetch_metadata{true};
    bool usb_sync{false};
    bool auto_eject{false};
    MusicDlScoreWeights weights{};
};

struct PipelineResult {
    MusicDlErrorKind error_kind{MUSICDL_ERROR_NONE};
    std::string destination;
    bool usb_copied{false};
};

using LogSink = std::function<void(const std::string&)>;

static inline bool is_error_line(const std::string& line) {
    return line.rfind(kErrorPrefix, 0) == 0;
}

// Runs search -> score -> download -> metadata -> tag -> organize -> sync.
// Stage failures are caught here and reported as "Error: ..." log lines.
PipelineResult run_job_pipeline(
    const std::string& raw_query,
    const PipelineSettings& settings,
    const MusicDlBackend& backend,
    const MusicDlVolumeManager& volumes,
    const MusicDlCancelToken* token,
    const LogSink& log);

}  // namespace musicdl::detail
