#pragma once

#include "HostSnapshot.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

// Cumulative counters from the previous tick. Empty until the first tick
// has been tracked.
struct RateState {
    bool initialized = false;
    double timestampSeconds = 0.0;
    std::optional<DiskIoCounters> diskIo;
    std::map<std::string, NetworkCounters> interfaces;
};

struct DiskIoRates {
    double readBytesPerSecond = 0.0;
    double writtenBytesPerSecond = 0.0;
};

struct NetworkRates {
    double receivedBytesPerSecond = 0.0;
    double transmittedBytesPerSecond = 0.0;
    double receivedPacketsPerSecond = 0.0;
    double transmittedPacketsPerSecond = 0.0;
    double receiveErrorsPerSecond = 0.0;
    double transmitErrorsPerSecond = 0.0;
};

// Rates for the counters that had a previous value. Interfaces missing from
// the map had no baseline and get no rate series this tick.
struct RateSet {
    std::optional<DiskIoRates> diskIo;
    std::map<std::string, NetworkRates> interfaces;
};

struct RateUpdate {
    RateSet rates;
    RateState next;
};

class RateTracker {
public:
    // Per-second rate of a monotonic counter; 0 on counter reset or when time
    // did not advance.
    static double ComputeRate(uint64_t previous, uint64_t current, double elapsedSeconds);

    static RateUpdate Track(const RateState& previous, const Snapshot& current);
};
