#include "curl.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace {
    std::once_flag curl_init_flag;
    CURLcode curl_init_result = CURLE_OK;

    size_t write_cb_default(void* contents, size_t size, size_t nmemb, void* userp) {
        static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
        return size * nmemb;
    }
}

void ensure_curl_global_init() {
    std::call_once(curl_init_flag, [] {
        curl_init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    if (curl_init_result != CURLE_OK) {
        throw SetupError(std::string("curl_global_init() failed: ") + curl_easy_strerror(curl_init_result));
    }
}

CURLHandler::CURLHandler(
    const std::string& api_key,
    bool verify_ssl,
    long max_connections
) : verify_ssl(verify_ssl), max_connections(max_connections) {
    ensure_curl_global_init();

    headers = curl_slist_append(headers, "Content-Type: application/json");
    // Large prompts would otherwise wait on a 100-continue round trip
    headers = curl_slist_append(headers, "Expect:");
    if (!api_key.empty()) {
        std::string token_header = "Authorization: Bearer " + api_key;
        headers = curl_slist_append(headers, token_header.c_str());
    }
    if (!headers) {
        throw SetupError("Could not build request headers.");
    }

    share = curl_share_init();
    if (!share) {
        curl_slist_free_all(headers);
        throw SetupError("curl_share_init() failed.");
    }
    curl_share_setopt(share, CURLSHOPT_LOCKFUNC, &CURLHandler::lock_share);
    curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, &CURLHandler::unlock_share);
    curl_share_setopt(share, CURLSHOPT_USERDATA, this);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
}

CURLHandler::~CURLHandler() {
    curl_share_cleanup(share);
    curl_slist_free_all(headers);
}

void CURLHandler::lock_share(CURL*, curl_lock_data data, curl_lock_access, void* userp) {
    static_cast<CURLHandler*>(userp)->share_locks[data].lock();
}

void CURLHandler::unlock_share(CURL*, curl_lock_data data, void* userp) {
    static_cast<CURLHandler*>(userp)->share_locks[data].unlock();
}

TransportResponse CURLHandler::post_json(
    const std::string& url,
    const std::string& body,
    std::chrono::milliseconds timeout
) {
    TransportResponse out;
    CURL* ephemeral = curl_easy_init();
    if (!ephemeral) {
        out.state = TransportState::FAILED;
        out.error = "curl_easy_init() failed";
        return out;
    }

    std::string response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(ephemeral, CURLOPT_URL, url.c_str());
    curl_easy_setopt(ephemeral, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(ephemeral, CURLOPT_POST, 1L);
    curl_easy_setopt(ephemeral, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(ephemeral, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(ephemeral, CURLOPT_WRITEFUNCTION, write_cb_default);
    curl_easy_setopt(ephemeral, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(ephemeral, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(ephemeral, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    // Timeouts must not rely on SIGALRM with many threads in flight
    curl_easy_setopt(ephemeral, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(ephemeral, CURLOPT_SHARE, share);
    curl_easy_setopt(ephemeral, CURLOPT_MAXCONNECTS, max_connections);
    curl_easy_setopt(ephemeral, CURLOPT_SSL_VERIFYPEER, verify_ssl ? 1L : 0L);
    curl_easy_setopt(ephemeral, CURLOPT_SSL_VERIFYHOST, verify_ssl ? 2L : 0L);

    auto res = curl_easy_perform(ephemeral);

    if (Logger.enabled(DEBUG)) {
        double name_lookup = 0, connect = 0, ssl = 0, start_transfer = 0, total = 0;
        curl_easy_getinfo(ephemeral, CURLINFO_NAMELOOKUP_TIME, &name_lookup);
        curl_easy_getinfo(ephemeral, CURLINFO_CONNECT_TIME, &connect);
        curl_easy_getinfo(ephemeral, CURLINFO_APPCONNECT_TIME, &ssl);
        curl_easy_getinfo(ephemeral, CURLINFO_STARTTRANSFER_TIME, &start_transfer);
        curl_easy_getinfo(ephemeral, CURLINFO_TOTAL_TIME, &total);
        Logger.debug(
            "timing: DNS=" + format_fixed(name_lookup, 4) +
            "s, TCP=" + format_fixed(connect - name_lookup, 4) +
            "s, SSL=" + format_fixed(ssl > 0 ? ssl - connect : 0.0, 4) +
            "s, TTFB=" + format_fixed(start_transfer, 4) +
            "s, Total=" + format_fixed(total, 4) + "s");
    }

    if (res == CURLE_OK) {
        out.state = TransportState::RESPONDED;
        curl_easy_getinfo(ephemeral, CURLINFO_RESPONSE_CODE, &out.http_status);
        out.body = std::move(response);
    } else if (res == CURLE_OPERATION_TIMEDOUT) {
        out.state = TransportState::TIMED_OUT;
        out.error = "Request timeout";
    } else {
        out.state = TransportState::FAILED;
        out.error = error_buffer[0] != '\0' ? std::string(error_buffer) : std::string(curl_easy_strerror(res));
    }
    curl_easy_cleanup(ephemeral);
    return out;
}
