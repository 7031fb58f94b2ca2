// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal.h"

using namespace musicdl::detail;

namespace {

using ListPtr = std::unique_ptr<MusicDlCandidateList, decltype(&musicdl_release_candidate_list)>;

ListPtr parse(const std::string& output) {
    return ListPtr(parse_search_output(output), &musicdl_release_candidate_list);
}

void testTypicalOutput() {
    std::cout << "[Test] One JSON object per line..." << std::endl;
    const std::string output =
        R"({"id":"fJ9rUzIMcZQ","title":"Queen - Bohemian Rhapsody (Official Video Remastered)","channel":"Queen Official","uploader":"Queen Official","duration":359,"view_count":1900000000,"like_count":19000000})" "\n"
        R"({"id":"abc","title":"Bohemian Rhapsody (Live Aid 1985)","channel":"Queen Official","duration":358.5,"view_count":"12345","like_count":null})" "\n";
    auto list = parse(output);
    assert(list->count == 2);

    const auto& first = list->candidates[0];
    assert(std::string(first.id) == "fJ9rUzIMcZQ");
    assert(std::string(first.channel) == "Queen Official");
    assert(first.duration_seconds == 359);
    assert(first.view_count == 1900000000);
    assert(first.like_count == 19000000);

    const auto& second = list->candidates[1];
    assert(second.duration_seconds == 358);
    assert(second.view_count == 12345);
    assert(second.like_count == 0);
    assert(std::string(second.uploader).empty());
    std::cout << "[PASS] One JSON object per line" << std::endl;
}

void testChannelFallsBackToUploader() {
    std::cout << "[Test] Channel falls back to uploader..." << std::endl;
    auto list = parse(R"({"id":"u1","title":"Song","uploader":"Some Uploader"})");
    assert(list->count == 1);
    assert(std::string(list->candidates[0].channel) == "Some Uploader");
    assert(list->candidates[0].duration_seconds == 0);
    assert(list->candidates[0].view_count == 0);
    std::cout << "[PASS] Channel falls back to uploader" << std::endl;
}

void testBrokenLinesSkipped() {
    std::cout << "[Test] Broken lines are skipped..." << std::endl;
    const std::string output =
        "WARNING: something noisy\n"
        "\n"
        R"({"title":"no id here"})" "\n"
        R"(["not", "an", "object"])" "\n"
        R"({"id":"ok","title":"Fine","duration":"abc"})" "\n";
    auto list = parse(output);
    assert(list->count == 1);
    assert(std::string(list->candidates[0].id) == "ok");
    assert(list->candidates[0].duration_seconds == 0);

    auto empty = parse("");
    assert(empty->count == 0);
    std::cout << "[PASS] Broken lines are skipped" << std::endl;
}

}  // namespace

int main() {
    testTypicalOutput();
    testChannelFallsBackToUploader();
    testBrokenLinesSkipped();
    std::cout << "[PASS] All search output parser tests" << std::endl;
    return 0;
}
