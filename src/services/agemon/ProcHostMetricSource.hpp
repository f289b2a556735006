#pragma once

#include "HostMetricSource.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct CpuTimes {
    unsigned long long idle = 0;
    unsigned long long total = 0;
};

struct MountEntry {
    std::string device;
    std::string mountPoint;
    std::string fsType;
};

class ProcHostMetricSource : public HostMetricSource {
public:
    explicit ProcHostMetricSource(
        std::string procRoot = "/proc",
        std::string sysRoot = "/sys",
        std::string etcRoot = "/etc");

    Snapshot Refresh() override;

    // Index 0 is the aggregate "cpu" line, followed by one entry per core.
    static bool ParseCpuTimes(const std::string& statText, std::vector<CpuTimes>& out);
    static std::optional<int64_t> ParseBootTime(const std::string& statText);
    static double BusyPercent(const CpuTimes& previous, const CpuTimes& current);
    static bool ParseMemInfo(const std::string& text, MemoryReading& memory, SwapReading& swap);
    static std::vector<MountEntry> ParseMounts(const std::string& text);
    static std::vector<NetworkInterfaceRecord> ParseNetDev(const std::string& text);
    static std::optional<DiskIoCounters> ParseDiskStats(
        const std::string& text,
        const std::function<bool(const std::string&)>& isWholeDevice);
    static std::optional<LoadAverages> ParseLoadAvg(const std::string& text);
    static std::optional<double> ParseUptime(const std::string& text);
    static void ParseOsRelease(const std::string& text, SystemIdentity& identity);
    static bool IsPseudoFilesystem(const std::string& fsType);

private:
    std::optional<CpuReading> CollectCpu(const std::string& statText);
    void CollectDisks(std::vector<DiskRecord>& disks) const;
    void CollectTemperatures(std::vector<TemperatureRecord>& temperatures) const;
    bool IsRemovable(const std::string& device) const;
    bool IsWholeBlockDevice(const std::string& name) const;
    SystemIdentity ReadIdentity() const;

    std::string procRoot_;
    std::string sysRoot_;
    std::string etcRoot_;
    std::vector<CpuTimes> prevCpuTimes_;
};
