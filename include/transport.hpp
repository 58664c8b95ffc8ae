#pragma once
#include <chrono>
#include <string>

enum class TransportState {
    RESPONDED,  // an HTTP status line came back, whatever the code
    TIMED_OUT,
    FAILED,     // connection, DNS, TLS, ...
};

struct TransportResponse {
    TransportState state = TransportState::FAILED;
    long http_status = 0;
    std::string body;
    std::string error;
};

// Sends a JSON body to an endpoint. Implementations must be safe to call from
// many threads at once.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual TransportResponse post_json(
        const std::string& url,
        const std::string& body,
        std::chrono::milliseconds timeout
    ) = 0;
};
