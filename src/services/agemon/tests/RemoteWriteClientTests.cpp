#include "RemoteWriteClient.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

HttpResponse Status(long statusCode, const std::string& body = std::string()) {
    HttpResponse response;
    response.transportOk = true;
    response.statusCode = statusCode;
    response.body = body;
    return response;
}

HttpResponse TransportError(const std::string& message) {
    HttpResponse response;
    response.transportOk = false;
    response.errorMessage = message;
    return response;
}

// Replays scripted responses and records every request it receives.
struct ScriptedPoster {
    std::vector<HttpResponse> responses;
    std::vector<HttpRequest> requests;

    HttpPoster Bind() {
        return [this](const HttpRequest& request) {
            requests.push_back(request);
            const size_t index = requests.size() - 1;
            return index < responses.size() ? responses[index] : responses.back();
        };
    }
};

RemoteWriteSettings FastSettings() {
    RemoteWriteSettings settings;
    settings.url = "http://prometheus.test:9090/api/v1/write";
    settings.userAgent = "agemon/test";
    settings.retry.maxAttempts = 3;
    settings.retry.initialBackoff = std::chrono::milliseconds(1);
    settings.retry.maxBackoff = std::chrono::milliseconds(4);
    settings.retry.requestTimeout = std::chrono::milliseconds(1500);
    settings.retry.connectTimeout = std::chrono::milliseconds(700);
    return settings;
}
} // namespace

int main() {
    const std::string payload("\x0a\x02\x08\x01", 4);

    // Accepted on the first attempt.
    {
        ShutdownSignal shutdown;
        ScriptedPoster poster;
        poster.responses = {Status(204)};
        RemoteWriteClient client(FastSettings(), shutdown, poster.Bind());

        const SendResult result = client.Send(payload);
        if (result.status != SendStatus::Success || result.attempts != 1 || result.statusCode != 204) {
            return Fail("Expected success on the first attempt.");
        }
        if (poster.requests.size() != 1) {
            return Fail("Expected exactly one request.");
        }

        const HttpRequest& request = poster.requests.front();
        if (request.url != "http://prometheus.test:9090/api/v1/write" || request.body != payload) {
            return Fail("Request should post the payload to the configured URL.");
        }
        if (request.headers.at("Content-Type") != "application/x-protobuf"
            || request.headers.at("Content-Encoding") != "snappy"
            || request.headers.at("X-Prometheus-Remote-Write-Version") != "0.1.0"
            || request.headers.at("User-Agent") != "agemon/test") {
            return Fail("Remote-write headers are missing or wrong.");
        }
        auto traceparent = request.headers.find("traceparent");
        if (traceparent == request.headers.end() || traceparent->second.size() != 55
            || traceparent->second.compare(0, 3, "00-") != 0) {
            return Fail("Each attempt should carry a W3C traceparent header.");
        }
        if (request.credentials) {
            return Fail("No credentials should be sent when none are configured.");
        }
        if (request.timeout != std::chrono::milliseconds(1500) || request.connectTimeout != std::chrono::milliseconds(700)) {
            return Fail("Request timeouts should come from the retry policy.");
        }
    }

    // Basic credentials are attached when configured.
    {
        ShutdownSignal shutdown;
        ScriptedPoster poster;
        poster.responses = {Status(200)};
        RemoteWriteSettings settings = FastSettings();
        settings.credentials = BasicCredentials{"agent", "s3cret"};
        RemoteWriteClient client(settings, shutdown, poster.Bind());

        if (client.Send(payload).status != SendStatus::Success) {
            return Fail("Expected success with credentials.");
        }
        const HttpRequest& request = poster.requests.front();
        if (!request.credentials || request.credentials->username != "agent" || request.credentials->password != "s3cret") {
            return Fail("Configured credentials should be attached to the request.");
        }
        if (client.Settings().credentials->username != "agent") {
            return Fail("Settings() should expose the configured credentials.");
        }
    }

    // Server errors are retried until one succeeds.
    {
        ShutdownSignal shutdown;
        ScriptedPoster poster;
        poster.responses = {Status(500), TransportError("Connection refused"), Status(200)};
        RemoteWriteClient client(FastSettings(), shutdown, poster.Bind());

        const SendResult result = client.Send(payload);
        if (result.status != SendStatus::Success || result.attempts != 3 || !result.error.empty()) {
            return Fail("Expected success on the third attempt.");
        }
        if (poster.requests[0].headers.at("traceparent") == poster.requests[1].headers.at("traceparent")) {
            return Fail("Each attempt should get its own span.");
        }
    }

    // Attempts started under a tick span stay in the tick's trace.
    {
        ShutdownSignal shutdown;
        ScriptedPoster poster;
        poster.responses = {Status(502), Status(204)};
        RemoteWriteClient client(FastSettings(), shutdown, poster.Bind());

        ScopedSpan tick(Tracer::Instance(), "agemon.tick");
        const SendResult result = client.Send(payload, &tick);
        tick.End(result.status == SendStatus::Success);
        if (result.status != SendStatus::Success || poster.requests.size() != 2) {
            return Fail("Expected success on the second attempt.");
        }

        const std::string tickTraceId = tick.TraceParent().substr(3, 32);
        const std::string tickSpanId = tick.TraceParent().substr(36, 16);
        for (const auto& request : poster.requests) {
            const std::string& traceparent = request.headers.at("traceparent");
            if (traceparent.size() != 55 || traceparent.substr(3, 32) != tickTraceId) {
                return Fail("Attempt traceparent should carry the tick's trace id, got " + traceparent);
            }
            if (traceparent.substr(36, 16) == tickSpanId) {
                return Fail("Attempt spans need their own span id.");
            }
        }
        if (poster.requests[0].headers.at("traceparent") == poster.requests[1].headers.at("traceparent")) {
            return Fail("Retries under one tick should still get distinct spans.");
        }
    }

    // Persistent server errors exhaust the attempts.
    {
        ShutdownSignal shutdown;
        ScriptedPoster poster;
        poster.responses = {Status(503, "overloaded")};
        RemoteWriteClient client(FastSettings(), shutdown, poster.Bind());

        const SendResult result = client.Send(payload);
        if (result.status != SendStatus::TransientFailure || result.attempts != 3 || poster.requests.size() != 3) {
            return Fail("Expected three attempts and a transient failure.");
        }
        if (result.statusCode != 503 || result.error.find("overloaded") == std::string::npos) {
            return Fail("Failure should report the last status and response body.");
        }
    }

    // Client errors are not retried.
    {
        ShutdownSignal shutdown;
        ScriptedPoster poster;
        poster.responses = {Status(400, "out of order sample"), Status(204)};
        RemoteWriteClient client(FastSettings(), shutdown, poster.Bind());

        const SendResult result = client.Send(payload);
        if (result.status != SendStatus::PermanentFailure || result.attempts != 1 || poster.requests.size() != 1) {
            return Fail("A 4xx response must not be retried.");
        }
        if (result.error.find("HTTP 400") == std::string::npos) {
            return Fail("Permanent failure should name the status code.");
        }
    }

    // A single configured attempt means no retries at all.
    {
        ShutdownSignal shutdown;
        ScriptedPoster poster;
        poster.responses = {TransportError("timeout")};
        RemoteWriteSettings settings = FastSettings();
        settings.retry.maxAttempts = 1;
        RemoteWriteClient client(settings, shutdown, poster.Bind());

        const SendResult result = client.Send(payload);
        if (result.status != SendStatus::TransientFailure || result.attempts != 1 || result.error != "timeout") {
            return Fail("Expected one attempt with the transport error reported.");
        }
    }

    // Shutdown before sending.
    {
        ShutdownSignal shutdown;
        shutdown.Trigger();
        ScriptedPoster poster;
        poster.responses = {Status(204)};
        RemoteWriteClient client(FastSettings(), shutdown, poster.Bind());

        const SendResult result = client.Send(payload);
        if (result.status != SendStatus::Cancelled || result.attempts != 0 || !poster.requests.empty()) {
            return Fail("No request should be made once shutdown is requested.");
        }
    }

    // Shutdown while an attempt is in flight stops further retries.
    {
        ShutdownSignal shutdown;
        int calls = 0;
        RemoteWriteSettings settings = FastSettings();
        settings.retry.initialBackoff = std::chrono::milliseconds(60000);
        settings.retry.maxBackoff = std::chrono::milliseconds(60000);
        RemoteWriteClient client(settings, shutdown, [&](const HttpRequest&) {
            ++calls;
            shutdown.Trigger();
            return Status(502);
        });

        const SendResult result = client.Send(payload);
        if (result.status != SendStatus::Cancelled || result.attempts != 1 || calls != 1) {
            return Fail("Shutdown during an attempt should cancel the send without waiting.");
        }
    }

    // Classification.
    if (RemoteWriteClient::Classify(Status(299)) != SendStatus::Success
        || RemoteWriteClient::Classify(Status(599)) != SendStatus::TransientFailure
        || RemoteWriteClient::Classify(Status(404)) != SendStatus::PermanentFailure
        || RemoteWriteClient::Classify(Status(302)) != SendStatus::PermanentFailure
        || RemoteWriteClient::Classify(Status(100)) != SendStatus::PermanentFailure
        || RemoteWriteClient::Classify(TransportError("reset")) != SendStatus::TransientFailure) {
        return Fail("Unexpected response classification.");
    }

    // Backoff doubles and is capped.
    RetryPolicy policy;
    const long expected[] = {500, 1000, 2000, 4000, 5000, 5000};
    for (int attempt = 0; attempt < 6; ++attempt) {
        if (RemoteWriteClient::BackoffDelay(policy, attempt).count() != expected[attempt]) {
            return Fail("Unexpected backoff for attempt " + std::to_string(attempt));
        }
    }
    if (policy.maxAttempts != 3 || policy.requestTimeout != std::chrono::milliseconds(10000)) {
        return Fail("Unexpected default retry policy.");
    }

    const auto headers = RemoteWriteClient::BuildHeaders("", "");
    if (headers.count("User-Agent") != 0 || headers.count("traceparent") != 0 || headers.size() != 3) {
        return Fail("Optional headers should be omitted when empty.");
    }

    if (std::string(RemoteWriteClient::StatusName(SendStatus::PermanentFailure)) != "rejected") {
        return Fail("Unexpected status name.");
    }

    return 0;
}
