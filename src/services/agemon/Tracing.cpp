#include "Tracing.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>

#if AGEMON_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/span_startoptions.h>
#include <opentelemetry/trace/status_code.h>
#endif

namespace {
constexpr const char* kDefaultServiceName = "agemon";

std::string RandomHex(size_t bytes) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);

    std::ostringstream out;
    out << std::hex << std::nouppercase;
    for (size_t i = 0; i < bytes; ++i) {
        out << std::setw(2) << std::setfill('0') << dist(rng);
    }
    return out.str();
}

std::string BuildTraceParentFromIds(const std::string& traceId, const std::string& spanId, bool sampled) {
    return "00-" + traceId + "-" + spanId + "-" + (sampled ? "01" : "00");
}

#if AGEMON_ENABLE_OTEL
std::string BuildTraceParentFromContext(const opentelemetry::trace::SpanContext& context) {
    if (!context.IsValid()) {
        return Tracer::RandomTraceParent();
    }

    char traceId[32];
    char spanId[16];
    context.trace_id().ToLowerBase16(traceId);
    context.span_id().ToLowerBase16(spanId);
    return BuildTraceParentFromIds(
        std::string(traceId, sizeof(traceId)),
        std::string(spanId, sizeof(spanId)),
        context.trace_flags().IsSampled());
}
#endif
} // namespace

ScopedSpan::ScopedSpan(Tracer& tracer, const std::string& name, const ScopedSpan* parent)
    : tracer_(tracer) {
#if AGEMON_ENABLE_OTEL
    if (tracer_.enabled_ && tracer_.tracer_) {
        opentelemetry::trace::StartSpanOptions options;
        if (parent != nullptr && parent->span_) {
            options.parent = parent->span_->GetContext();
        }
        span_ = tracer_.tracer_->StartSpan(name, options);
        traceparent_ = BuildTraceParentFromContext(span_->GetContext());
        return;
    }
#else
    (void)name;
#endif

    // traceparent is "00-<32 hex trace id>-<16 hex span id>-<flags>".
    if (parent != nullptr && parent->traceparent_.size() == 55) {
        traceparent_ = BuildTraceParentFromIds(parent->traceparent_.substr(3, 32), RandomHex(8), true);
        return;
    }
    traceparent_ = Tracer::RandomTraceParent();
}

ScopedSpan::~ScopedSpan() {
    if (!ended_) {
        End(false);
    }
}

const std::string& ScopedSpan::TraceParent() const {
    return traceparent_;
}

void ScopedSpan::SetAttribute(const std::string& key, const std::string& value) {
#if AGEMON_ENABLE_OTEL
    if (span_) {
        span_->SetAttribute(key, value);
    }
#else
    (void)key;
    (void)value;
#endif
}

void ScopedSpan::SetAttribute(const std::string& key, int64_t value) {
#if AGEMON_ENABLE_OTEL
    if (span_) {
        span_->SetAttribute(key, value);
    }
#else
    (void)key;
    (void)value;
#endif
}

void ScopedSpan::End(bool success) {
    if (ended_) {
        return;
    }
    ended_ = true;

#if AGEMON_ENABLE_OTEL
    if (span_) {
        span_->SetStatus(
            success ? opentelemetry::trace::StatusCode::kOk : opentelemetry::trace::StatusCode::kError);
        span_->End();
    }
#else
    (void)success;
#endif
}

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    if (!config.enabled) {
        enabled_ = false;
        return;
    }

#if AGEMON_ENABLE_OTEL
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!config.endpoint.empty()) {
        options.url = config.endpoint;
    }

    auto exporter = std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options);
    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(
        std::move(exporter),
        opentelemetry::sdk::trace::BatchSpanProcessorOptions{});
    const std::string serviceName = config.serviceName.empty() ? kDefaultServiceName : config.serviceName;
    auto resource = opentelemetry::sdk::resource::Resource::Create({
        {"service.name", serviceName},
        {"host.name", config.hostname}
    });
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(std::move(processor), resource);

    std::shared_ptr<opentelemetry::trace::TracerProvider> apiProvider = provider_;
    opentelemetry::trace::Provider::SetTracerProvider(apiProvider);
    tracer_ = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(serviceName);
    enabled_ = true;
    std::cout << "[Agemon] Tracing enabled, exporting to "
              << (config.endpoint.empty() ? options.url : config.endpoint) << std::endl;
#else
    std::cerr << "[Agemon] Tracing requested but agemon was built without AGEMON_ENABLE_OTEL" << std::endl;
    enabled_ = false;
#endif
}

bool Tracer::Enabled() const {
    return enabled_;
}

void Tracer::Shutdown() {
#if AGEMON_ENABLE_OTEL
    if (provider_) {
        provider_->Shutdown();
    }
#endif
}

std::string Tracer::RandomTraceParent() {
    return BuildTraceParentFromIds(RandomHex(16), RandomHex(8), true);
}
