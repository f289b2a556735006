#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct CpuReading {
    double usagePercent = 0.0;
    std::vector<double> coreUsagePercent;
    int logicalCores = 0;
};

struct MemoryReading {
    uint64_t totalBytes = 0;
    uint64_t usedBytes = 0;
    uint64_t availableBytes = 0;
    uint64_t freeBytes = 0;
};

struct SwapReading {
    uint64_t totalBytes = 0;
    uint64_t usedBytes = 0;
};

struct DiskRecord {
    std::string mountPoint;
    std::string device;
    std::string fsType;
    uint64_t totalBytes = 0;
    uint64_t availableBytes = 0;
    bool removable = false;
};

struct NetworkCounters {
    uint64_t receivedBytes = 0;
    uint64_t transmittedBytes = 0;
    uint64_t receivedPackets = 0;
    uint64_t transmittedPackets = 0;
    uint64_t receiveErrors = 0;
    uint64_t transmitErrors = 0;
};

struct NetworkInterfaceRecord {
    std::string name;
    NetworkCounters counters;
};

struct TemperatureRecord {
    std::string sensor;
    double celsius = 0.0;
    std::optional<double> criticalCelsius;
};

// Host-wide cumulative block I/O since boot.
struct DiskIoCounters {
    uint64_t readBytes = 0;
    uint64_t writtenBytes = 0;
};

struct LoadAverages {
    double oneMinute = 0.0;
    double fiveMinutes = 0.0;
    double fifteenMinutes = 0.0;
};

struct SystemIdentity {
    std::string osName;
    std::string osVersion;
    std::string kernelVersion;
    std::string arch;
};

// Everything the host reported at one instant. Resources the source could
// not read are absent from the vectors or left unset.
struct Snapshot {
    double monotonicSeconds = 0.0;
    int64_t wallTimeMs = 0;

    std::optional<CpuReading> cpu;
    std::optional<MemoryReading> memory;
    std::optional<SwapReading> swap;
    std::vector<DiskRecord> disks;
    std::vector<NetworkInterfaceRecord> interfaces;
    std::vector<TemperatureRecord> temperatures;
    std::optional<DiskIoCounters> diskIo;
    std::optional<LoadAverages> load;
    std::optional<double> uptimeSeconds;
    std::optional<int64_t> bootTimeSeconds;
    SystemIdentity identity;
};
