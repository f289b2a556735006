#pragma once

#include "HostSnapshot.hpp"
#include "RateTracker.hpp"

#include <cstdint>
#include <string>
#include <vector>

constexpr const char* kMetricNameLabel = "__name__";
constexpr const char* kHostnameLabel = "hostname";

struct Label {
    std::string name;
    std::string value;
};

struct TimeSeriesSample {
    std::vector<Label> labels;
    double value = 0.0;
    int64_t timestampMs = 0;
};

enum class MetricKind {
    Gauge,
    Counter,
    Info
};

struct MetricDescriptor {
    std::string name;
    MetricKind kind = MetricKind::Gauge;
    std::string help;
};

// One tick's worth of series, in catalogue order, plus the metadata of every
// metric family that appears in it.
struct SeriesBatch {
    std::vector<TimeSeriesSample> samples;
    std::vector<MetricDescriptor> metadata;
};

class SeriesBuilder {
public:
    explicit SeriesBuilder(std::string hostname);

    SeriesBatch Build(const Snapshot& snapshot, const RateSet& rates, int64_t timestampMs) const;

    const std::string& Hostname() const;

    // used / total, or 0 when total is 0.
    static double Ratio(uint64_t used, uint64_t total);

private:
    std::string hostname_;
};
