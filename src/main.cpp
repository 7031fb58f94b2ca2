// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include "musicdl/musicdl.h"
#include "version.h"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string view_string(const char* s) {
    return s ? std::string{s} : std::string{};
}

std::string trim_ws(const std::string& s) {
    const size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    const size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

int parse_int_option(const std::string& name, const char* raw, int min_value) {
    int v = 0;
    try {
        size_t idx = 0;
        const std::string s = raw;
        v = std::stoi(s, &idx);
        if (idx != s.size()) throw std::invalid_argument(s);
    } catch (const std::exception&) {
        std::cerr << "Error: " << name << " requires an integer\n";
        std::exit(1);
    }
    if (v < min_value) {
        std::cerr << "Error: " << name << " must be >= " << min_value << "\n";
        std::exit(1);
    }
    return v;
}

void print_usage() {
    std::cout << "Usage: musicdl [-i config] [-r dir] [-u name] [-j n] [-t sec] [-n n] [--usb|--no-usb] [-e] [--no-metadata] [-s] [-q] \"<artist> - <title>\" ... | -\n";
    std::cout << "  -i / --input: musicdl config file path (default search: ./musicdl.conf --> ~/.musicdl.conf)\n";
    std::cout << "  -r / --root: Music library root directory (default: XDG music directory)\n";
    std::cout << "  -u / --user: Per-user subdirectory under the root (default: login name)\n";
    std::cout << "  -j / --jobs: Maximum concurrent jobs (default: 1)\n";
    std::cout << "  -t / --timeout: Per-job timeout in seconds, 0 disables (default: 0)\n";
    std::cout << "  -n / --limit: Number of search results to score (default: 10)\n";
    std::cout << "  --usb / --no-usb: Copy finished files onto a removable volume\n";
    std::cout << "  -e / --eject: Eject the volume after a successful copy\n";
    std::cout << "  --no-metadata: Skip the metadata service and tag with parsed values\n";
    std::cout << "  -s / --search: Print scored candidates for each query without downloading\n";
    std::cout << "  -q / --quiet: Suppress per-job log lines\n";
    std::cout << "  -  : Read one query per line from stdin\n";
}

}  // namespace

struct Options {
    std::optional<std::string> music_root;
    std::optional<std::string> user_name;
    std::optional<int> concurrency;
    std::optional<int> job_timeout_sec;
    std::optional<int> search_limit;
    std::optional<bool> usb_sync;
    std::optional<bool> auto_eject;
    std::optional<bool> fetch_metadata;
    std::string config_file;
    bool search_only = false;
    bool quiet = false;
    bool read_stdin = false;
    std::vector<std::string> queries;
};

Options parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if ((arg == "-r" || arg == "--root") && i + 1 < argc) {
            opts.music_root = argv[++i];
        } else if ((arg == "-u" || arg == "--user") && i + 1 < argc) {
            opts.user_name = argv[++i];
        } else if ((arg == "-j" || arg == "--jobs") && i + 1 < argc) {
            opts.concurrency = parse_int_option("-j/--jobs", argv[++i], 1);
        } else if ((arg == "-t" || arg == "--timeout") && i + 1 < argc) {
            opts.job_timeout_sec = parse_int_option("-t/--timeout", argv[++i], 0);
        } else if ((arg == "-n" || arg == "--limit") && i + 1 < argc) {
            opts.search_limit = parse_int_option("-n/--limit", argv[++i], 1);
        } else if (arg == "--usb") {
            opts.usb_sync = true;
        } else if (arg == "--no-usb") {
            opts.usb_sync = false;
        } else if (arg == "-e" || arg == "--eject") {
            opts.auto_eject = true;
        } else if (arg == "--no-metadata") {
            opts.fetch_metadata = false;
        } else if (arg == "-s" || arg == "--search") {
            opts.search_only = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "-") {
            opts.read_stdin = true;
        } else if (arg == "-?" || arg == "-h" || arg == "--help") {
            print_usage();
            std::exit(0);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << "\n";
            print_usage();
            std::exit(1);
        } else {
            opts.queries.push_back(arg);
        }
    }
    return opts;
}

struct RunContext {
    bool quiet = false;
};

void on_job_log(void* user_data, uint64_t, const char* line) {
    const auto* ctx = static_cast<const RunContext*>(user_data);
    if (ctx->quiet) return;
    std::cout << view_string(line) << "\n";
}

void on_job_terminal(void* user_data, uint64_t job_id, MusicDlJobState state) {
    (void)user_data;
    std::cout << "Job " << job_id << ": " << musicdl_job_state_label(state) << "\n";
}

void on_search_score(void*, size_t index, const MusicDlCandidate* candidate, int score) {
    std::cout << "  [" << std::setw(2) << (index + 1) << "] " << std::setw(4) << score << "  "
              << view_string(candidate->title) << " (" << view_string(candidate->channel) << ", "
              << candidate->duration_seconds << "s, " << candidate->view_count << " views)\n";
}

int run_search_mode(
    const std::vector<std::string>& queries,
    const MusicDlConfig* cfg,
    int search_limit) {

    MusicDlBackend backend{};
    musicdl_default_backend(&backend, cfg->ytdlp_path);

    int status = 0;
    for (const auto& raw : queries) {
        std::unique_ptr<MusicDlSearchQuery, decltype(&musicdl_release_query)> query(
            musicdl_parse_query(raw.c_str()), &musicdl_release_query);
        std::cout << "\n=== " << raw << " (artist: \"" << view_string(query->artist)
                  << "\", title: \"" << view_string(query->title) << "\") ===\n";

        const char* err = nullptr;
        std::unique_ptr<MusicDlCandidateList, decltype(&musicdl_release_candidate_list)> list(
            backend.search(backend.user_data, raw.c_str(), search_limit, nullptr, &err),
            &musicdl_release_candidate_list);
        if (!list) {
            std::cerr << "Search failed: " << view_string(err) << "\n";
            musicdl_release_error(err);
            status = 1;
            continue;
        }
        musicdl_release_error(err);

        std::unique_ptr<MusicDlSelection, decltype(&musicdl_release_selection)> selection(
            musicdl_select_candidate(query.get(), list.get(), &cfg->weights, &on_search_score, nullptr),
            &musicdl_release_selection);
        if (selection->matched) {
            const auto& best = list->candidates[selection->index];
            std::cout << "Selected: [" << (selection->index + 1) << "] " << view_string(best.title)
                      << " (score " << selection->best_score << ")\n";
        } else {
            std::cout << "No suitable match.\n";
            status = 1;
        }
    }
    return status;
}

int main(int argc, char** argv) {
    std::cout << "\nMusic downloader and organizer [" << VERSION << "-" << COMMIT_ID << "]\n";
    std::cout << "Copyright (c) Kouji Matsui (@kekyo@mi.kekyo.net)\n";
    std::cout << "Licence: Under MIT.\n\n";

    Options cli_opts = parse_args(argc, argv);

    const char* config_err = nullptr;
    MusicDlConfig* cfg_raw = musicdl_load_config(
        cli_opts.config_file.empty() ? nullptr : cli_opts.config_file.c_str(),
        &config_err);
    if (!cfg_raw) {
        std::cerr << (config_err ? view_string(config_err) : "Failed to load config") << "\n";
        musicdl_release_error(config_err);
        return 1;
    }
    musicdl_release_error(config_err);
    std::unique_ptr<MusicDlConfig, decltype(&musicdl_release_config)> cfg(cfg_raw, &musicdl_release_config);

    if (cli_opts.read_stdin) {
        std::string line;
        while (std::getline(std::cin, line)) {
            line = trim_ws(line);
            if (!line.empty()) cli_opts.queries.push_back(line);
        }
    }
    if (cli_opts.queries.empty()) {
        std::cerr << "Error: no queries given.\n";
        print_usage();
        return 1;
    }

    const std::string music_root = cli_opts.music_root.value_or(view_string(cfg->music_root));
    const std::string user_name = cli_opts.user_name.value_or(view_string(cfg->user_name));
    const int concurrency = cli_opts.concurrency.value_or(cfg->concurrency);
    const int job_timeout_sec = cli_opts.job_timeout_sec.value_or(cfg->job_timeout_sec);
    const int search_limit = cli_opts.search_limit.value_or(cfg->search_limit);
    const bool usb_sync = cli_opts.usb_sync.value_or(cfg->usb_sync);
    const bool auto_eject = cli_opts.auto_eject.value_or(cfg->auto_eject);
    const bool fetch_metadata = cli_opts.fetch_metadata.value_or(cfg->fetch_metadata);

    if (cfg->config_path) {
        std::cout << "Config: " << view_string(cfg->config_path) << "\n";
    }

    if (cli_opts.search_only) {
        return run_search_mode(cli_opts.queries, cfg.get(), search_limit);
    }

    std::cout << "Music root: " << music_root << "\n";
    std::cout << "User: " << (user_name.empty() ? "(none)" : user_name) << "\n";
    std::cout << "Jobs: " << concurrency
              << ", timeout: " << (job_timeout_sec > 0 ? std::to_string(job_timeout_sec) + "s" : "none")
              << ", search limit: " << search_limit << "\n";
    std::cout << "Metadata: " << (fetch_metadata ? "enabled" : "disabled")
              << ", USB sync: " << (usb_sync ? (auto_eject ? "enabled (auto eject)" : "enabled") : "disabled")
              << "\n\n";

    MusicDlOrchestratorSettings settings{};
    settings.concurrency = concurrency;
    settings.job_timeout_sec = job_timeout_sec;
    settings.music_root = music_root.c_str();
    settings.user_name = user_name.c_str();
    settings.search_limit = search_limit;
    settings.fetch_metadata = fetch_metadata;
    settings.usb_sync = usb_sync;
    settings.auto_eject = auto_eject;
    settings.weights = &cfg->weights;

    MusicDlBackend backend{};
    musicdl_default_backend(&backend, cfg->ytdlp_path);

    const char* err = nullptr;
    std::unique_ptr<MusicDlOrchestrator, decltype(&musicdl_orchestrator_free)> orchestrator(
        musicdl_orchestrator_new(&settings, &backend, nullptr, &err),
        &musicdl_orchestrator_free);
    if (!orchestrator) {
        std::cerr << "Failed to start: " << view_string(err) << "\n";
        musicdl_release_error(err);
        return 1;
    }
    musicdl_release_error(err);

    RunContext ctx;
    ctx.quiet = cli_opts.quiet;
    musicdl_orchestrator_set_log_callback(orchestrator.get(), &on_job_log, &ctx);
    musicdl_orchestrator_set_terminal_callback(orchestrator.get(), &on_job_terminal, &ctx);

    std::vector<uint64_t> job_ids;
    for (const auto& q : cli_opts.queries) {
        const uint64_t id = musicdl_orchestrator_submit(orchestrator.get(), q.c_str());
        std::cout << "Queued job " << id << ": " << q << "\n";
        job_ids.push_back(id);
    }

    musicdl_orchestrator_run_until_idle(orchestrator.get(), 200);

    std::cout << "\n";
    for (const uint64_t id : job_ids) {
        std::unique_ptr<MusicDlJobInfo, decltype(&musicdl_release_job_info)> info(
            musicdl_orchestrator_get_job(orchestrator.get(), id), &musicdl_release_job_info);
        if (!info) continue;
        std::cout << "[" << info->id << "] " << musicdl_job_state_label(info->state) << ": "
                  << view_string(info->query);
        if (info->state == MUSICDL_JOB_COMPLETED) {
            std::cout << " --> " << view_string(info->destination);
            if (info->usb_copied) std::cout << " (copied to volume)";
        } else {
            std::cout << " (" << musicdl_error_kind_label(info->error_kind) << ")";
        }
        std::cout << "\n";
    }

    MusicDlAggregateStats stats{};
    musicdl_orchestrator_get_stats(orchestrator.get(), &stats);
    std::cout << "\nCompleted: " << stats.completed
              << ", failed: " << stats.failed
              << ", copied to volume: " << stats.usb_copied << "\n";

    return stats.failed == 0 ? 0 : 1;
}
