#include "RemoteWriteClient.hpp"
#include "Tracing.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <iostream>
#include <utility>

namespace {
constexpr const char* kContentType = "application/x-protobuf";
constexpr const char* kContentEncoding = "snappy";
constexpr const char* kRemoteWriteVersion = "0.1.0";
constexpr size_t kMaxLoggedBodyBytes = 256;

std::string Excerpt(const std::string& body) {
    if (body.size() <= kMaxLoggedBodyBytes) {
        return body;
    }
    return body.substr(0, kMaxLoggedBodyBytes) + "...";
}

std::string DescribeFailure(const HttpResponse& response) {
    if (!response.transportOk) {
        return response.errorMessage.empty() ? "transport error" : response.errorMessage;
    }

    std::string message = "HTTP " + std::to_string(response.statusCode);
    if (!response.body.empty()) {
        message += ": " + Excerpt(response.body);
    }
    return message;
}

void LogRetry(int attempt, int maxAttempts, std::chrono::milliseconds wait, const std::string& reason) {
    std::cerr << "[RemoteWrite] Request failed (Attempt " << (attempt + 1) << "/" << maxAttempts
              << "): " << reason << ". Retrying in " << wait.count() << "ms..." << std::endl;
}
} // namespace

RemoteWriteClient::RemoteWriteClient(RemoteWriteSettings settings, ShutdownSignal& shutdown, HttpPoster poster)
    : settings_(std::move(settings)),
      shutdown_(shutdown),
      poster_(std::move(poster)) {}

SendResult RemoteWriteClient::Send(const std::string& payload, const ScopedSpan* parent) {
    SendResult result;
    const int maxAttempts = std::max(1, settings_.retry.maxAttempts);

    for (int attempt = 0; attempt < maxAttempts; ++attempt) {
        if (shutdown_.Triggered()) {
            result.status = SendStatus::Cancelled;
            result.error = "shutdown requested";
            return result;
        }

        ScopedSpan span(Tracer::Instance(), "agemon.remote_write", parent);
        span.SetAttribute("http.method", "POST");
        span.SetAttribute("http.url", settings_.url);
        span.SetAttribute("retry.attempt", static_cast<int64_t>(attempt + 1));

        HttpRequest request;
        request.url = settings_.url;
        request.headers = BuildHeaders(settings_.userAgent, span.TraceParent());
        request.body = payload;
        request.credentials = settings_.credentials;
        request.timeout = settings_.retry.requestTimeout;
        request.connectTimeout = settings_.retry.connectTimeout;

        const HttpResponse response = Post(request);
        const SendStatus status = Classify(response);
        span.SetAttribute("http.status_code", static_cast<int64_t>(response.statusCode));
        span.End(status == SendStatus::Success);

        result.attempts = attempt + 1;
        result.statusCode = response.statusCode;
        result.status = status;

        if (status == SendStatus::Success) {
            result.error.clear();
            return result;
        }

        result.error = DescribeFailure(response);
        if (shutdown_.Triggered()) {
            result.status = SendStatus::Cancelled;
            return result;
        }

        if (status == SendStatus::PermanentFailure) {
            std::cerr << "[RemoteWrite] Rejected by " << settings_.url << ": " << result.error
                      << ". Not retrying." << std::endl;
            return result;
        }

        if (attempt + 1 < maxAttempts) {
            const auto wait = BackoffDelay(settings_.retry, attempt);
            LogRetry(attempt, maxAttempts, wait, result.error);
            if (!shutdown_.WaitFor(wait)) {
                result.status = SendStatus::Cancelled;
                return result;
            }
        }
    }

    std::cerr << "[RemoteWrite] Giving up after " << result.attempts << " attempt(s): " << result.error << std::endl;
    return result;
}

const RemoteWriteSettings& RemoteWriteClient::Settings() const {
    return settings_;
}

SendStatus RemoteWriteClient::Classify(const HttpResponse& response) {
    if (!response.transportOk) {
        return SendStatus::TransientFailure;
    }

    if (response.statusCode >= 200 && response.statusCode < 300) {
        return SendStatus::Success;
    }

    if (response.statusCode >= 500 && response.statusCode < 600) {
        return SendStatus::TransientFailure;
    }

    return SendStatus::PermanentFailure;
}

std::chrono::milliseconds RemoteWriteClient::BackoffDelay(const RetryPolicy& policy, int attempt) {
    auto delay = policy.initialBackoff;
    for (int i = 0; i < attempt && delay < policy.maxBackoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy.maxBackoff);
}

std::map<std::string, std::string> RemoteWriteClient::BuildHeaders(
    const std::string& userAgent,
    const std::string& traceparent) {
    std::map<std::string, std::string> headers{
        {"Content-Type", kContentType},
        {"Content-Encoding", kContentEncoding},
        {"X-Prometheus-Remote-Write-Version", kRemoteWriteVersion}
    };
    if (!userAgent.empty()) {
        headers["User-Agent"] = userAgent;
    }
    if (!traceparent.empty()) {
        headers["traceparent"] = traceparent;
    }
    return headers;
}

const char* RemoteWriteClient::StatusName(SendStatus status) {
    switch (status) {
    case SendStatus::Success:
        return "sent";
    case SendStatus::TransientFailure:
        return "transient failure";
    case SendStatus::PermanentFailure:
        return "rejected";
    case SendStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

HttpResponse RemoteWriteClient::Post(const HttpRequest& request) const {
    if (poster_) {
        return poster_(request);
    }
    return PostWithCpr(request);
}

HttpResponse RemoteWriteClient::PostWithCpr(const HttpRequest& request) const {
    cpr::Header headers;
    for (const auto& [name, value] : request.headers) {
        headers[name] = value;
    }

    cpr::Session session;
    session.SetUrl(cpr::Url{request.url});
    session.SetHeader(headers);
    session.SetBody(cpr::Body{request.body});
    session.SetTimeout(cpr::Timeout{request.timeout});
    session.SetConnectTimeout(cpr::ConnectTimeout{request.connectTimeout});
    if (request.credentials) {
        session.SetAuth(cpr::Authentication{
            request.credentials->username,
            request.credentials->password,
            cpr::AuthMode::BASIC});
    }

    // Returning false from the progress callback aborts the transfer.
    ShutdownSignal& shutdown = shutdown_;
    session.SetProgressCallback(cpr::ProgressCallback{[&shutdown](auto&&...) {
        return !shutdown.Triggered();
    }});

    const cpr::Response raw = session.Post();

    HttpResponse response;
    response.transportOk = raw.error.code == cpr::ErrorCode::OK;
    response.statusCode = raw.status_code;
    response.errorMessage = raw.error.message;
    response.body = raw.text;
    return response;
}
