#include "SeriesJson.hpp"

#include "WriteRequestEncoder.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <utility>

std::string SeriesJson::Dump(const SeriesBatch& batch, int indent) {
    nlohmann::json series = nlohmann::json::array();

    for (const auto& sample : batch.samples) {
        nlohmann::json labels = nlohmann::json::object();
        for (const auto& label : WriteRequestEncoder::SortedLabels(sample.labels)) {
            labels[label.name] = label.value;
        }

        nlohmann::json entry = {
            {"labels", labels},
            {"timestamp_ms", sample.timestampMs}
        };
        // JSON has no NaN or Infinity.
        if (std::isfinite(sample.value)) {
            entry["value"] = sample.value;
        } else {
            entry["value"] = nullptr;
        }
        series.push_back(std::move(entry));
    }

    return series.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}
