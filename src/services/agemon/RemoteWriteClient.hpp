#pragma once

#include "ShutdownSignal.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>

struct BasicCredentials {
    std::string username;
    std::string password;
};

// Attempts made within one tick. Backoff doubles from initialBackoff and
// never exceeds maxBackoff.
struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds initialBackoff{500};
    std::chrono::milliseconds maxBackoff{5000};
    std::chrono::milliseconds requestTimeout{10000};
    std::chrono::milliseconds connectTimeout{3000};
};

struct RemoteWriteSettings {
    std::string url;
    std::optional<BasicCredentials> credentials;
    RetryPolicy retry;
    std::string userAgent;
};

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::optional<BasicCredentials> credentials;
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds connectTimeout{0};
};

struct HttpResponse {
    bool transportOk = false;
    long statusCode = 0;
    std::string errorMessage;
    std::string body;
};

using HttpPoster = std::function<HttpResponse(const HttpRequest&)>;

enum class SendStatus {
    Success,
    TransientFailure,
    PermanentFailure,
    Cancelled
};

struct SendResult {
    SendStatus status = SendStatus::TransientFailure;
    int attempts = 0;
    long statusCode = 0;
    std::string error;
};

class RemoteWriteClient {
public:
    // An empty poster sends through cpr.
    RemoteWriteClient(RemoteWriteSettings settings, ShutdownSignal& shutdown, HttpPoster poster = HttpPoster());

    // Attempt spans are children of parent when one is given.
    SendResult Send(const std::string& payload, const ScopedSpan* parent = nullptr);

    const RemoteWriteSettings& Settings() const;

    static SendStatus Classify(const HttpResponse& response);
    static std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, int attempt);
    static std::map<std::string, std::string> BuildHeaders(const std::string& userAgent, const std::string& traceparent);
    static const char* StatusName(SendStatus status);

private:
    HttpResponse Post(const HttpRequest& request) const;
    HttpResponse PostWithCpr(const HttpRequest& request) const;

    RemoteWriteSettings settings_;
    ShutdownSignal& shutdown_;
    HttpPoster poster_;
};
