#include "WriteRequestEncoder.hpp"

#include "Utf8.hpp"
#include "remote.pb.h"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <snappy.h>

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace {
bool IsNameStart(char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
}

bool IsNameChar(char ch) {
    return IsNameStart(ch) || (ch >= '0' && ch <= '9');
}

prometheus::MetricMetadata::MetricType ToWireType(MetricKind kind) {
    switch (kind) {
    case MetricKind::Counter:
        return prometheus::MetricMetadata::COUNTER;
    case MetricKind::Gauge:
        return prometheus::MetricMetadata::GAUGE;
    case MetricKind::Info:
        return prometheus::MetricMetadata::INFO;
    }
    return prometheus::MetricMetadata::UNKNOWN;
}

std::string DescribeSeries(const std::vector<Label>& labels) {
    std::ostringstream out;
    out << "{";
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i > 0) {
            out << ",";
        }
        out << labels[i].name << "=\"" << labels[i].value << "\"";
    }
    out << "}";
    return out.str();
}

// Checks one series' sorted labels; returns an empty string when valid.
std::string CheckLabels(const std::vector<Label>& labels) {
    int metricNames = 0;
    for (size_t i = 0; i < labels.size(); ++i) {
        const Label& label = labels[i];
        if (i > 0 && labels[i - 1].name == label.name) {
            return "duplicate label name \"" + label.name + "\"";
        }

        if (label.name == kMetricNameLabel) {
            ++metricNames;
            if (!WriteRequestEncoder::IsValidMetricName(label.value)) {
                return "invalid metric name \"" + label.value + "\"";
            }
            continue;
        }

        if (!WriteRequestEncoder::IsValidLabelName(label.name)) {
            return "invalid label name \"" + label.name + "\"";
        }
        if (label.name.rfind("__", 0) == 0) {
            return "reserved label name \"" + label.name + "\"";
        }
        if (label.value.empty()) {
            return "empty value for label \"" + label.name + "\"";
        }
        if (!IsValidUtf8(label.value)) {
            return "invalid UTF-8 in value of label \"" + label.name + "\"";
        }
    }

    if (metricNames != 1) {
        return "series must carry exactly one " + std::string(kMetricNameLabel) + " label";
    }
    return {};
}

std::string LabelSetKey(const std::vector<Label>& labels) {
    std::string key;
    for (const auto& label : labels) {
        key.append(std::to_string(label.name.size())).append(":").append(label.name);
        key.append(std::to_string(label.value.size())).append(":").append(label.value);
    }
    return key;
}
} // namespace

WriteRequestEncoder::WriteRequestEncoder(bool includeMetadata)
    : includeMetadata_(includeMetadata) {}

bool WriteRequestEncoder::Encode(const SeriesBatch& batch, std::string& outPayload, std::string& outError) const {
    outPayload.clear();

    prometheus::WriteRequest request;
    if (!BuildRequest(batch, request, outError)) {
        return false;
    }

    std::string serialized;
    {
        google::protobuf::io::StringOutputStream stream(&serialized);
        google::protobuf::io::CodedOutputStream coded(&stream);
        coded.SetSerializationDeterministic(true);
        if (!request.SerializeToCodedStream(&coded)) {
            outError = "protobuf serialization failed";
            return false;
        }
    }

    snappy::Compress(serialized.data(), serialized.size(), &outPayload);
    return true;
}

bool WriteRequestEncoder::BuildRequest(
    const SeriesBatch& batch,
    prometheus::WriteRequest& outRequest,
    std::string& outError) const {
    outRequest.Clear();

    std::set<std::string> labelSets;
    for (const auto& sample : batch.samples) {
        std::vector<Label> labels = SortedLabels(sample.labels);

        const std::string problem = CheckLabels(labels);
        if (!problem.empty()) {
            outError = problem + " in series " + DescribeSeries(labels);
            return false;
        }

        if (!labelSets.insert(LabelSetKey(labels)).second) {
            outError = "duplicate series " + DescribeSeries(labels);
            return false;
        }

        prometheus::TimeSeries* series = outRequest.add_timeseries();
        for (auto& label : labels) {
            prometheus::Label* wireLabel = series->add_labels();
            wireLabel->set_name(std::move(label.name));
            wireLabel->set_value(std::move(label.value));
        }

        prometheus::Sample* wireSample = series->add_samples();
        wireSample->set_value(sample.value);
        wireSample->set_timestamp(sample.timestampMs);
    }

    if (includeMetadata_) {
        for (const auto& metric : batch.metadata) {
            prometheus::MetricMetadata* metadata = outRequest.add_metadata();
            metadata->set_type(ToWireType(metric.kind));
            metadata->set_metric_family_name(metric.name);
            metadata->set_help(metric.help);
        }
    }

    return true;
}

std::vector<Label> WriteRequestEncoder::SortedLabels(std::vector<Label> labels) {
    std::stable_sort(labels.begin(), labels.end(), [](const Label& left, const Label& right) {
        return left.name < right.name;
    });
    return labels;
}

bool WriteRequestEncoder::IsValidMetricName(const std::string& name) {
    if (name.empty() || !(IsNameStart(name.front()) || name.front() == ':')) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char ch) {
        return IsNameChar(ch) || ch == ':';
    });
}

bool WriteRequestEncoder::IsValidLabelName(const std::string& name) {
    if (name.empty() || !IsNameStart(name.front())) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), IsNameChar);
}
