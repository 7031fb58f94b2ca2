// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "musicdl/musicdl.h"

namespace {

using QueryPtr = std::unique_ptr<MusicDlSearchQuery, decltype(&musicdl_release_query)>;

QueryPtr parse(const char* raw) {
    return QueryPtr(musicdl_parse_query(raw), &musicdl_release_query);
}

std::string clean(const char* title) {
    char* out = musicdl_clean_title(title);
    std::string s = out ? out : "";
    musicdl_release_string(out);
    return s;
}

void testArtistTitleSplit() {
    std::cout << "[Test] Artist - title split..." << std::endl;
    auto q = parse("Queen - Bohemian Rhapsody");
    assert(std::string(q->raw_text) == "Queen - Bohemian Rhapsody");
    assert(std::string(q->artist) == "Queen");
    assert(std::string(q->title) == "Bohemian Rhapsody");

    auto padded = parse("  Daft Punk   -   One More Time  ");
    assert(std::string(padded->artist) == "Daft Punk");
    assert(std::string(padded->title) == "One More Time");
    std::cout << "[PASS] Artist - title split" << std::endl;
}

void testFirstSeparatorWins() {
    std::cout << "[Test] First separator wins..." << std::endl;
    auto q = parse("A - B - C");
    assert(std::string(q->artist) == "A");
    assert(std::string(q->title) == "B - C");
    std::cout << "[PASS] First separator wins" << std::endl;
}

void testUnicodeDashes() {
    std::cout << "[Test] Unicode dash separators..." << std::endl;
    auto en = parse("Queen \xE2\x80\x93 Bohemian Rhapsody");   // U+2013
    assert(std::string(en->artist) == "Queen");
    assert(std::string(en->title) == "Bohemian Rhapsody");

    auto em = parse("Queen \xE2\x80\x94 Bohemian Rhapsody");   // U+2014
    assert(std::string(em->artist) == "Queen");
    assert(std::string(em->title) == "Bohemian Rhapsody");
    std::cout << "[PASS] Unicode dash separators" << std::endl;
}

void testNoSeparator() {
    std::cout << "[Test] Query without separator..." << std::endl;
    auto q = parse("some song");
    assert(std::string(q->artist).empty());
    assert(std::string(q->title) == "some song");

    // Hyphen without surrounding whitespace is part of a word.
    auto hyphen = parse("AC-DC Thunderstruck");
    assert(std::string(hyphen->artist).empty());
    assert(std::string(hyphen->title) == "AC-DC Thunderstruck");

    auto null_query = parse(nullptr);
    assert(std::string(null_query->raw_text).empty());
    assert(std::string(null_query->title).empty());
    std::cout << "[PASS] Query without separator" << std::endl;
}

void testCleanTitle() {
    std::cout << "[Test] Video title cleanup..." << std::endl;
    assert(clean("Queen - Bohemian Rhapsody (Official Video)") == "Bohemian Rhapsody");
    assert(clean("Bohemian Rhapsody [Official Music Video]") == "Bohemian Rhapsody");
    assert(clean("Get Lucky (HD)") == "Get Lucky");
    assert(clean("Get Lucky feat. Pharrell Williams") == "Get Lucky");
    assert(clean("Get Lucky (Radio Edit) [2013]") == "Get Lucky");
    // Nothing left after cleanup: keep the original.
    assert(clean("(Official Video)") == "(Official Video)");
    assert(clean("  Plain Title  ") == "Plain Title");
    std::cout << "[PASS] Video title cleanup" << std::endl;
}

}  // namespace

int main() {
    testArtistTitleSplit();
    testFirstSeparatorWins();
    testUnicodeDashes();
    testNoSeparator();
    testCleanTitle();
    std::cout << "[PASS] All query parser tests" << std::endl;
    return 0;
}
