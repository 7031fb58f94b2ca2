// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <string>

#include <glib.h>

#include "internal.h"

using namespace musicdl::detail;

/* ------------------------------------------------------------------- */

namespace musicdl::detail {

std::string current_timestamp_iso() {
    char* ts = musicdl_format_timestamp_iso(g_get_real_time() / G_USEC_PER_SEC);
    std::string out = to_string_or_empty(ts);
    musicdl_release_timestamp(ts);
    return out;
}

}  // namespace musicdl::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

char* musicdl_format_timestamp_iso(int64_t unix_seconds) {
    GDateTime* dt = g_date_time_new_from_unix_local(unix_seconds);
    if (!dt) return make_mutable_cstr_copy("");
    gchar* formatted = g_date_time_format(dt, "%Y-%m-%dT%H:%M:%S%:z");
    std::string ts = to_string_or_empty(formatted);
    g_free(formatted);
    g_date_time_unref(dt);
    return make_mutable_cstr_copy(ts);
}

void musicdl_release_timestamp(char* p) {
    delete[] p;
}

};
