#pragma once

// Music downloader and organizer
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <string>
#include <thread>

#include <gio/gio.h>
#include <libsoup/soup.h>

namespace musicdl::detail {

struct HttpRetryPolicy {
    int timeout_sec = 10;
    int max_attempts = 3;
    int retry_delay_ms = 1200;
    int max_redirects = 2;
    bool respect_retry_after = true;
};

static inline bool http_status_is_retryable(guint status) {
    if (status == 0) return true;  // network error / not reached server
    if (status == 408) return true;  // Request Timeout
    if (status == 429) return true;  // Too Many Requests
    if (status >= 500 && status <= 599) return true;  // transient server errors
    return false;
}

static inline bool gerror_is_retryable(const GError* gerr) {
    if (!gerr) return false;

    if (g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_FAILED) ||
        g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_CONNECTION_CLOSED) ||
        g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_TIMED_OUT) ||
        g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_NOT_CONNECTED) ||
        g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_HOST_UNREACHABLE) ||
        g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_NETWORK_UNREACHABLE) ||
        g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_CONNECTION_REFUSED) ||
        g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_BROKEN_PIPE)) {
        return true;
    }

    // Handshake failures only; bad certificates are not retried.
    if (g_error_matches(gerr, G_TLS_ERROR, G_TLS_ERROR_HANDSHAKE) ||
        g_error_matches(gerr, G_TLS_ERROR, G_TLS_ERROR_MISC) ||
        g_error_matches(gerr, G_TLS_ERROR, G_TLS_ERROR_UNAVAILABLE)) {
        return true;
    }

    return false;
}

static inline int parse_retry_after_ms(const char* value) {
    if (!value) return -1;
    char* end = nullptr;
    long sec = std::strtol(value, &end, 10);
    if (end == value) return -1;
    if (sec <= 0) return -1;
    if (sec > 60 * 60) sec = 60 * 60;
    const long ms = sec * 1000L;
    if (ms > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    return static_cast<int>(ms);
}

static inline int compute_retry_delay_ms(
    const HttpRetryPolicy& policy,
    SoupMessage* msg) {

    if (policy.respect_retry_after && msg) {
        const char* retry_after = soup_message_headers_get_one(
            soup_message_get_response_headers(msg),
            "Retry-After");
        const int ra_ms = parse_retry_after_ms(retry_after);
        if (ra_ms > 0) return ra_ms;
    }
    return std::max(0, policy.retry_delay_ms);
}

// Sleeps in short slices; returns false when cancelled meanwhile.
static inline bool sleep_unless_cancelled(
    int delay_ms,
    GCancellable* cancellable) {

    constexpr int kSliceMs = 50;
    int remaining = delay_ms;
    while (remaining > 0) {
        if (cancellable && g_cancellable_is_cancelled(cancellable)) return false;
        const int slice = std::min(remaining, kSliceMs);
        std::this_thread::sleep_for(std::chrono::milliseconds(slice));
        remaining -= slice;
    }
    return !(cancellable && g_cancellable_is_cancelled(cancellable));
}

// Owns the objects of one request attempt.
struct HttpAttempt {
    SoupMessage* msg{nullptr};
    GBytes* bytes{nullptr};
    GError* gerr{nullptr};
    guint status{0};

    HttpAttempt() = default;
    HttpAttempt(const HttpAttempt&) = delete;
    HttpAttempt& operator=(const HttpAttempt&) = delete;
    ~HttpAttempt() {
        g_clear_error(&gerr);
        if (bytes) g_bytes_unref(bytes);
        if (msg) g_object_unref(msg);
    }

    bool cancelled() const {
        return g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_CANCELLED);
    }
    gsize body_size() const {
        return bytes ? g_bytes_get_size(bytes) : 0;
    }
    const char* header(const char* name) const {
        return soup_message_headers_get_one(soup_message_get_response_headers(msg), name);
    }
};

static inline std::string describe_http_failure(
    const std::string& service_name,
    const HttpAttempt& attempt) {

    std::ostringstream oss;
    oss << service_name << " request failed with status " << attempt.status;
    if (attempt.gerr && attempt.gerr->message) oss << ": " << attempt.gerr->message;
    return oss.str();
}

// GET url as text. Follows up to policy.max_redirects Location headers
// without spending attempts; retries transient failures until max_attempts.
static inline bool http_get_text_with_retry(
    const std::string& service_name,
    const std::string& url,
    const std::string& user_agent,
    const char* accept,
    const HttpRetryPolicy& policy,
    GCancellable* cancellable,
    std::string& body,
    std::string& err) {

    body.clear();
    err.clear();

    SoupSession* session = soup_session_new_with_options(
        "user-agent", user_agent.c_str(),
        "timeout", static_cast<guint>(std::max(1, policy.timeout_sec)),
        nullptr);
    if (!session) {
        err = "Failed to create SoupSession";
        return false;
    }

    const int max_attempts = std::max(1, policy.max_attempts);
    const std::string cancelled_message = service_name + " request cancelled";
    std::string current_url = url;
    int redirects = 0;
    int attempt_no = 0;
    bool ok = false;

    while (attempt_no < max_attempts) {
        if (cancellable && g_cancellable_is_cancelled(cancellable)) {
            err = cancelled_message;
            break;
        }

        HttpAttempt attempt;
        attempt.msg = soup_message_new("GET", current_url.c_str());
        if (!attempt.msg) {
            err = "Failed to create SoupMessage for " + current_url;
            break;
        }
        if (accept && accept[0] != '\0') {
            soup_message_headers_replace(soup_message_get_request_headers(attempt.msg), "Accept", accept);
        }
        attempt.bytes = soup_session_send_and_read(session, attempt.msg, cancellable, &attempt.gerr);
        attempt.status = soup_message_get_status(attempt.msg);

        if (attempt.cancelled()) {
            err = cancelled_message;
            break;
        }

        if (SOUP_STATUS_IS_REDIRECTION(attempt.status) && redirects < std::max(0, policy.max_redirects)) {
            if (const char* location = attempt.header("Location")) {
                current_url = location;
                ++redirects;
                continue;
            }
        }

        const bool success = SOUP_STATUS_IS_SUCCESSFUL(attempt.status);
        if (success && attempt.body_size() > 0) {
            gsize len = 0;
            const auto* data = static_cast<const gchar*>(g_bytes_get_data(attempt.bytes, &len));
            body.assign(data, len);
            ok = true;
            break;
        }

        ++attempt_no;
        const bool transient = success ||
            http_status_is_retryable(attempt.status) ||
            gerror_is_retryable(attempt.gerr);
        if (transient && attempt_no < max_attempts) {
            if (!sleep_unless_cancelled(compute_retry_delay_ms(policy, attempt.msg), cancellable)) {
                err = cancelled_message;
                break;
            }
            continue;
        }

        err = success
            ? service_name + " response body is empty"
            : describe_http_failure(service_name, attempt);
        break;
    }

    g_object_unref(session);
    return ok;
}

}  // namespace musicdl::detail
