#pragma once

#include "SeriesBuilder.hpp"

#include <string>
#include <vector>

namespace prometheus {
class WriteRequest;
}

class WriteRequestEncoder {
public:
    explicit WriteRequestEncoder(bool includeMetadata = true);

    // Validates the batch, serializes it deterministically and Snappy
    // compresses it. On failure outPayload is left empty and outError says
    // which series was rejected.
    bool Encode(const SeriesBatch& batch, std::string& outPayload, std::string& outError) const;

    bool BuildRequest(const SeriesBatch& batch, prometheus::WriteRequest& outRequest, std::string& outError) const;

    static std::vector<Label> SortedLabels(std::vector<Label> labels);
    static bool IsValidMetricName(const std::string& name);
    static bool IsValidLabelName(const std::string& name);

private:
    bool includeMetadata_;
};
