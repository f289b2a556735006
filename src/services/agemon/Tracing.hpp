#pragma once

#include <cstdint>
#include <string>

#if AGEMON_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/tracer.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#endif

struct TraceConfig {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName;
    std::string hostname;
};

class Tracer;

// Span that ends itself (as failed) if the owner never calls End().
// A child span shares its parent's trace id.
class ScopedSpan {
public:
    ScopedSpan(Tracer& tracer, const std::string& name, const ScopedSpan* parent = nullptr);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    const std::string& TraceParent() const;
    void SetAttribute(const std::string& key, const std::string& value);
    void SetAttribute(const std::string& key, int64_t value);
    void End(bool success);

private:
    Tracer& tracer_;
    std::string traceparent_;
    bool ended_ = false;
#if AGEMON_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span_;
#endif
};

class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceConfig& config);
    bool Enabled() const;
    void Shutdown();

    // W3C traceparent with random ids, used when no exporter is configured.
    static std::string RandomTraceParent();

private:
    friend class ScopedSpan;

    Tracer() = default;

    bool enabled_ = false;
#if AGEMON_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};
