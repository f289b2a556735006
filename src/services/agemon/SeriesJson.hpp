#pragma once

#include "SeriesBuilder.hpp"

#include <string>

class SeriesJson {
public:
    // JSON array of {"labels", "value", "timestamp_ms"} objects, in request
    // order. Used by --dry-run.
    static std::string Dump(const SeriesBatch& batch, int indent = 2);
};
