#pragma once
#include <array>
#include <mutex>
#include <optional>
#include <string>
#include <curl/curl.h>
#include "transport.hpp"

// Production transport. Every call runs its own easy handle, but all handles
// are attached to one share handle so connections, DNS lookups and TLS
// sessions are pooled across every simulated user.
class CURLHandler final : public HttpTransport {
public:
    CURLHandler(
        const std::string& api_key,
        bool verify_ssl,
        long max_connections);

    ~CURLHandler() override;

    CURLHandler(const CURLHandler&) = delete;

    CURLHandler& operator=(const CURLHandler&) = delete;

    TransportResponse post_json(
        const std::string& url,
        const std::string& body,
        std::chrono::milliseconds timeout
    ) override;

    static void lock_share(CURL* handle, curl_lock_data data, curl_lock_access access, void* userp);

    static void unlock_share(CURL* handle, curl_lock_data data, void* userp);

private:
    bool verify_ssl;
    long max_connections;
    curl_slist* headers = nullptr;
    CURLSH* share = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> share_locks;
};

// Initialises libcurl once per process. Throws SetupError on failure.
void ensure_curl_global_init();
