// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <algorithm>
#include <climits>
#include <cmath>
#include <string>
#include <vector>

#include "internal.h"

using namespace musicdl::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

struct TitleClass {
    const char* pattern;
    int MusicDlScoreWeights::* weight;
};

static const TitleClass kTitleClasses[] = {
    { "official\\s+(audio|video|music\\s+video)", &MusicDlScoreWeights::official_bonus },
    { "\\b(audio|lyrics?|visualizer)\\b", &MusicDlScoreWeights::audio_bonus },
    { "\\b(live|concert|performance|cover|remix|instrumental|karaoke)\\b", &MusicDlScoreWeights::live_penalty },
    { "\\b(reaction|review|tutorial|how to|lesson)\\b", &MusicDlScoreWeights::tutorial_penalty },
    { "\\b(full album|greatest hits|compilation|mix)\\b", &MusicDlScoreWeights::compilation_penalty },
};

static const std::vector<RegexPtr>& title_class_regexes() {
    static const std::vector<RegexPtr> regexes = [] {
        std::vector<RegexPtr> r;
        for (const auto& c : kTitleClasses) {
            r.push_back(compile_regex(c.pattern, true));
        }
        return r;
    }();
    return regexes;
}

static bool contains_caseless(
    const std::string& haystack,
    const std::string& needle) {

    if (needle.empty()) return false;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

static int duration_score(
    long seconds,
    const MusicDlScoreWeights& w) {

    if (seconds >= 180 && seconds <= 359) return w.duration_ideal;
    if (seconds >= 120 && seconds <= 479) return w.duration_acceptable;
    return w.duration_penalty;
}

// Truncated toward zero so the total stays integral.
static int log_bonus(
    int64_t count,
    int64_t threshold,
    double offset,
    double cap) {

    if (count <= threshold) return 0;
    const double bonus = std::min(std::log10(static_cast<double>(count)) - offset, cap);
    return static_cast<int>(bonus);
}

static int score_one(
    const MusicDlSearchQuery& query,
    const MusicDlCandidate& candidate,
    const MusicDlScoreWeights& w) {

    const std::string query_artist = trim(to_string_or_empty(query.artist));
    const std::string query_title = trim(to_string_or_empty(query.title));
    const std::string title = strip_non_printable_ascii(to_string_or_empty(candidate.title));
    const std::string channel = strip_non_printable_ascii(to_string_or_empty(candidate.channel));

    std::string video_artist;
    std::string video_title = title;
    if (const auto split = split_dash_separated(title)) {
        video_artist = split->first;
        video_title = split->second;
    }

    int score = 0;

    if (contains_caseless(video_artist, query_artist)) score += w.artist_match;
    if (contains_caseless(video_title, query_title)) score += w.title_match;

    const auto video_words = split_words(video_title);
    int overlap = 0;
    for (const auto& word : split_words(query_title)) {
        for (const auto& vw : video_words) {
            if (vw == word) {
                ++overlap;
                break;
            }
        }
    }
    score += overlap * w.word_overlap;

    score += duration_score(candidate.duration_seconds, w);

    const auto& regexes = title_class_regexes();
    for (size_t i = 0; i < regexes.size(); ++i) {
        if (regex_matches(regexes[i], title)) score += w.*(kTitleClasses[i].weight);
    }

    static const RegexPtr official_channel = compile_regex("vevo|official", true);
    static const RegexPtr label_channel = compile_regex("music|records|entertainment", true);
    if (contains_caseless(channel, query_artist)) score += w.channel_artist_bonus;
    if (regex_matches(official_channel, channel)) score += w.channel_official_bonus;
    if (regex_matches(label_channel, channel)) score += w.channel_label_bonus;

    score += log_bonus(candidate.view_count, w.view_threshold, w.view_log_offset, w.view_cap);
    score += log_bonus(candidate.like_count, w.like_threshold, w.like_log_offset, w.like_cap);
    return score;
}

static MusicDlScoreWeights resolve_weights(
    const MusicDlScoreWeights* weights) {

    if (weights) return *weights;
    MusicDlScoreWeights w{};
    musicdl_default_score_weights(&w);
    return w;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

void musicdl_default_score_weights(MusicDlScoreWeights* out) {
    if (!out) return;
    out->artist_match = 20;
    out->title_match = 20;
    out->word_overlap = 5;
    out->duration_ideal = 3;
    out->duration_acceptable = 2;
    out->duration_penalty = -3;
    out->official_bonus = 5;
    out->audio_bonus = 3;
    out->live_penalty = -10;
    out->tutorial_penalty = -15;
    out->compilation_penalty = -20;
    out->channel_artist_bonus = 10;
    out->channel_official_bonus = 5;
    out->channel_label_bonus = 2;
    out->view_threshold = 1000000;
    out->view_log_offset = 5.0;
    out->view_cap = 5.0;
    out->like_threshold = 10000;
    out->like_log_offset = 3.0;
    out->like_cap = 3.0;
}

int musicdl_score_candidate(
    const MusicDlSearchQuery* query,
    const MusicDlCandidate* candidate,
    const MusicDlScoreWeights* weights) {

    if (!query || !candidate) return 0;
    return score_one(*query, *candidate, resolve_weights(weights));
}

MusicDlSelection* musicdl_select_candidate(
    const MusicDlSearchQuery* query,
    const MusicDlCandidateList* candidates,
    const MusicDlScoreWeights* weights,
    MusicDlScoreCallback on_score,
    void* user_data) {

    auto* selection = new MusicDlSelection{};
    selection->best_score = INT_MIN;
    if (!query || !candidates || !candidates->candidates || candidates->count == 0) {
        return selection;
    }

    const MusicDlScoreWeights w = resolve_weights(weights);
    selection->scores = new int[candidates->count]{};
    selection->scores_count = candidates->count;

    size_t best_index = 0;
    for (size_t i = 0; i < candidates->count; ++i) {
        const auto& candidate = candidates->candidates[i];
        const int score = score_one(*query, candidate, w);
        selection->scores[i] = score;
        if (on_score) on_score(user_data, i, &candidate, score);
        // Strictly greater: ties keep the earlier candidate.
        if (score > selection->best_score) {
            selection->best_score = score;
            best_index = i;
        }
    }

    if (selection->best_score >= 0) {
        selection->matched = 1;
        selection->index = best_index;
    }
    return selection;
}

void musicdl_release_selection(MusicDlSelection* p) {
    if (!p) return;
    delete[] p->scores;
    p->scores = nullptr;
    p->scores_count = 0;
    delete p;
}

MusicDlCandidateList* musicdl_make_candidate_list(
    const MusicDlCandidate* items,
    size_t count) {

    auto* list = new MusicDlCandidateList{};
    if (!items || count == 0) return list;
    list->count = count;
    list->candidates = new MusicDlCandidate[count]{};
    for (size_t i = 0; i < count; ++i) {
        auto& dst = list->candidates[i];
        dst.id = make_cstr_copy(items[i].id);
        dst.title = make_cstr_copy(items[i].title);
        dst.channel = make_cstr_copy(items[i].channel);
        dst.uploader = make_cstr_copy(items[i].uploader);
        dst.duration_seconds = items[i].duration_seconds;
        dst.view_count = items[i].view_count;
        dst.like_count = items[i].like_count;
    }
    return list;
}

void musicdl_release_candidate_list(
    MusicDlCandidateList* p) {

    if (!p) return;
    if (p->candidates) {
        for (size_t i = 0; i < p->count; ++i) {
            release_cstr(p->candidates[i].id);
            release_cstr(p->candidates[i].title);
            release_cstr(p->candidates[i].channel);
            release_cstr(p->candidates[i].uploader);
        }
        delete[] p->candidates;
        p->candidates = nullptr;
    }
    p->count = 0;
    delete p;
}

};
