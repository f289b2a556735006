#include "SeriesBuilder.hpp"

#include "Utf8.hpp"

#include <set>
#include <utility>

namespace {
const MetricDescriptor kCpuUsage{"system_cpu_usage_percent", MetricKind::Gauge, "Aggregate CPU usage in percent."};
const MetricDescriptor kCpuCoreUsage{
    "system_cpu_core_usage_percent", MetricKind::Gauge, "Per-core CPU usage in percent."};
const MetricDescriptor kCpuLogicalCores{
    "system_cpu_logical_cores", MetricKind::Gauge, "Number of logical CPU cores."};

const MetricDescriptor kMemoryTotal{"system_memory_total_bytes", MetricKind::Gauge, "Total physical memory."};
const MetricDescriptor kMemoryUsed{"system_memory_used_bytes", MetricKind::Gauge, "Physical memory in use."};
const MetricDescriptor kMemoryAvailable{
    "system_memory_available_bytes", MetricKind::Gauge, "Physical memory available for new allocations."};
const MetricDescriptor kMemoryUsageRatio{
    "system_memory_usage_ratio", MetricKind::Gauge, "Used over total physical memory."};

const MetricDescriptor kSwapTotal{"system_swap_total_bytes", MetricKind::Gauge, "Total swap space."};
const MetricDescriptor kSwapUsed{"system_swap_used_bytes", MetricKind::Gauge, "Swap space in use."};
const MetricDescriptor kSwapUsageRatio{"system_swap_usage_ratio", MetricKind::Gauge, "Used over total swap space."};

const MetricDescriptor kDiskTotal{"system_disk_total_bytes", MetricKind::Gauge, "Filesystem capacity."};
const MetricDescriptor kDiskAvailable{
    "system_disk_available_bytes", MetricKind::Gauge, "Filesystem space available to unprivileged users."};
const MetricDescriptor kDiskUsed{"system_disk_used_bytes", MetricKind::Gauge, "Filesystem space in use."};
const MetricDescriptor kDiskUsageRatio{
    "system_disk_usage_ratio", MetricKind::Gauge, "Used over total filesystem space."};
const MetricDescriptor kDiskRemovable{
    "system_disk_removable", MetricKind::Gauge, "1 if the filesystem is on removable media."};

const MetricDescriptor kDiskIoReadTotal{
    "system_disk_io_read_bytes_total", MetricKind::Counter, "Bytes read from block devices since boot."};
const MetricDescriptor kDiskIoWrittenTotal{
    "system_disk_io_written_bytes_total", MetricKind::Counter, "Bytes written to block devices since boot."};
const MetricDescriptor kDiskIoReadRate{
    "system_disk_io_read_bytes_per_second", MetricKind::Gauge, "Block device read throughput."};
const MetricDescriptor kDiskIoWrittenRate{
    "system_disk_io_written_bytes_per_second", MetricKind::Gauge, "Block device write throughput."};

const MetricDescriptor kNetReceivedBytesTotal{
    "system_network_received_bytes_total", MetricKind::Counter, "Bytes received on the interface."};
const MetricDescriptor kNetTransmittedBytesTotal{
    "system_network_transmitted_bytes_total", MetricKind::Counter, "Bytes transmitted on the interface."};
const MetricDescriptor kNetReceivedPacketsTotal{
    "system_network_received_packets_total", MetricKind::Counter, "Packets received on the interface."};
const MetricDescriptor kNetTransmittedPacketsTotal{
    "system_network_transmitted_packets_total", MetricKind::Counter, "Packets transmitted on the interface."};
const MetricDescriptor kNetReceiveErrorsTotal{
    "system_network_receive_errors_total", MetricKind::Counter, "Receive errors on the interface."};
const MetricDescriptor kNetTransmitErrorsTotal{
    "system_network_transmit_errors_total", MetricKind::Counter, "Transmit errors on the interface."};
const MetricDescriptor kNetReceivedBytesRate{
    "system_network_received_bytes_per_second", MetricKind::Gauge, "Receive throughput in bytes."};
const MetricDescriptor kNetTransmittedBytesRate{
    "system_network_transmitted_bytes_per_second", MetricKind::Gauge, "Transmit throughput in bytes."};
const MetricDescriptor kNetReceivedPacketsRate{
    "system_network_received_packets_per_second", MetricKind::Gauge, "Receive throughput in packets."};
const MetricDescriptor kNetTransmittedPacketsRate{
    "system_network_transmitted_packets_per_second", MetricKind::Gauge, "Transmit throughput in packets."};
const MetricDescriptor kNetReceiveErrorsRate{
    "system_network_receive_errors_per_second", MetricKind::Gauge, "Receive errors per second."};
const MetricDescriptor kNetTransmitErrorsRate{
    "system_network_transmit_errors_per_second", MetricKind::Gauge, "Transmit errors per second."};

const MetricDescriptor kTemperature{"system_temperature_celsius", MetricKind::Gauge, "Sensor temperature."};
const MetricDescriptor kTemperatureCritical{
    "system_temperature_critical_celsius", MetricKind::Gauge, "Critical threshold reported by the sensor."};

const MetricDescriptor kLoad1{"system_load_average_1m", MetricKind::Gauge, "One minute load average."};
const MetricDescriptor kLoad5{"system_load_average_5m", MetricKind::Gauge, "Five minute load average."};
const MetricDescriptor kLoad15{"system_load_average_15m", MetricKind::Gauge, "Fifteen minute load average."};

const MetricDescriptor kUptime{"system_uptime_seconds", MetricKind::Gauge, "Seconds since boot."};
const MetricDescriptor kBootTime{"system_boot_time_seconds", MetricKind::Gauge, "Boot time as Unix seconds."};

const MetricDescriptor kSystemInfo{"system_info", MetricKind::Info, "Operating system identity; always 1."};

class BatchWriter {
public:
    BatchWriter(const std::string& hostname, int64_t timestampMs)
        : hostname_(hostname),
          timestampMs_(timestampMs) {}

    void Add(const MetricDescriptor& metric, std::vector<Label> labels, double value) {
        TimeSeriesSample sample;
        sample.labels.reserve(labels.size() + 2);
        sample.labels.push_back({kMetricNameLabel, metric.name});
        sample.labels.push_back({kHostnameLabel, hostname_});
        for (auto& label : labels) {
            if (!label.value.empty() && IsValidUtf8(label.value)) {
                sample.labels.push_back(std::move(label));
            }
        }
        sample.value = value;
        sample.timestampMs = timestampMs_;
        batch_.samples.push_back(std::move(sample));

        if (families_.insert(metric.name).second) {
            batch_.metadata.push_back(metric);
        }
    }

    void Add(const MetricDescriptor& metric, double value) {
        Add(metric, {}, value);
    }

    SeriesBatch Take() {
        return std::move(batch_);
    }

private:
    const std::string& hostname_;
    int64_t timestampMs_;
    SeriesBatch batch_;
    std::set<std::string> families_;
};

void AddCpu(BatchWriter& writer, const CpuReading& cpu) {
    writer.Add(kCpuUsage, cpu.usagePercent);
    for (size_t core = 0; core < cpu.coreUsagePercent.size(); ++core) {
        writer.Add(kCpuCoreUsage, {{"cpu", std::to_string(core)}}, cpu.coreUsagePercent[core]);
    }
    writer.Add(kCpuLogicalCores, static_cast<double>(cpu.logicalCores));
}

void AddMemory(BatchWriter& writer, const MemoryReading& memory) {
    writer.Add(kMemoryTotal, static_cast<double>(memory.totalBytes));
    writer.Add(kMemoryUsed, static_cast<double>(memory.usedBytes));
    writer.Add(kMemoryAvailable, static_cast<double>(memory.availableBytes));
    writer.Add(kMemoryUsageRatio, SeriesBuilder::Ratio(memory.usedBytes, memory.totalBytes));
}

void AddSwap(BatchWriter& writer, const SwapReading& swap) {
    writer.Add(kSwapTotal, static_cast<double>(swap.totalBytes));
    writer.Add(kSwapUsed, static_cast<double>(swap.usedBytes));
    writer.Add(kSwapUsageRatio, SeriesBuilder::Ratio(swap.usedBytes, swap.totalBytes));
}

void AddDisks(BatchWriter& writer, const std::vector<DiskRecord>& disks) {
    std::set<std::string> seen;
    for (const auto& disk : disks) {
        if (disk.mountPoint.empty() || !seen.insert(disk.mountPoint).second) {
            continue;
        }
        // A label that cannot be encoded drops the whole mount.
        if (!IsValidUtf8(disk.mountPoint) || !IsValidUtf8(disk.device) || !IsValidUtf8(disk.fsType)) {
            continue;
        }

        const uint64_t used = disk.totalBytes > disk.availableBytes ? disk.totalBytes - disk.availableBytes : 0;
        const std::vector<Label> labels = {
            {"mount_point", disk.mountPoint},
            {"device", disk.device},
            {"fs_type", disk.fsType}
        };

        writer.Add(kDiskTotal, labels, static_cast<double>(disk.totalBytes));
        writer.Add(kDiskAvailable, labels, static_cast<double>(disk.availableBytes));
        writer.Add(kDiskUsed, labels, static_cast<double>(used));
        writer.Add(kDiskUsageRatio, labels, SeriesBuilder::Ratio(used, disk.totalBytes));
        writer.Add(kDiskRemovable, labels, disk.removable ? 1.0 : 0.0);
    }
}

void AddDiskIo(BatchWriter& writer, const std::optional<DiskIoCounters>& counters, const RateSet& rates) {
    if (!counters) {
        return;
    }

    writer.Add(kDiskIoReadTotal, static_cast<double>(counters->readBytes));
    writer.Add(kDiskIoWrittenTotal, static_cast<double>(counters->writtenBytes));
    if (rates.diskIo) {
        writer.Add(kDiskIoReadRate, rates.diskIo->readBytesPerSecond);
        writer.Add(kDiskIoWrittenRate, rates.diskIo->writtenBytesPerSecond);
    }
}

void AddNetwork(BatchWriter& writer, const std::vector<NetworkInterfaceRecord>& interfaces, const RateSet& rates) {
    std::set<std::string> seen;
    for (const auto& record : interfaces) {
        if (record.name.empty() || !IsValidUtf8(record.name) || !seen.insert(record.name).second) {
            continue;
        }

        const std::vector<Label> labels = {{"interface", record.name}};
        const NetworkCounters& counters = record.counters;
        writer.Add(kNetReceivedBytesTotal, labels, static_cast<double>(counters.receivedBytes));
        writer.Add(kNetTransmittedBytesTotal, labels, static_cast<double>(counters.transmittedBytes));
        writer.Add(kNetReceivedPacketsTotal, labels, static_cast<double>(counters.receivedPackets));
        writer.Add(kNetTransmittedPacketsTotal, labels, static_cast<double>(counters.transmittedPackets));
        writer.Add(kNetReceiveErrorsTotal, labels, static_cast<double>(counters.receiveErrors));
        writer.Add(kNetTransmitErrorsTotal, labels, static_cast<double>(counters.transmitErrors));

        auto it = rates.interfaces.find(record.name);
        if (it == rates.interfaces.end()) {
            continue;
        }

        const NetworkRates& rate = it->second;
        writer.Add(kNetReceivedBytesRate, labels, rate.receivedBytesPerSecond);
        writer.Add(kNetTransmittedBytesRate, labels, rate.transmittedBytesPerSecond);
        writer.Add(kNetReceivedPacketsRate, labels, rate.receivedPacketsPerSecond);
        writer.Add(kNetTransmittedPacketsRate, labels, rate.transmittedPacketsPerSecond);
        writer.Add(kNetReceiveErrorsRate, labels, rate.receiveErrorsPerSecond);
        writer.Add(kNetTransmitErrorsRate, labels, rate.transmitErrorsPerSecond);
    }
}

void AddTemperatures(BatchWriter& writer, const std::vector<TemperatureRecord>& temperatures) {
    std::set<std::string> seen;
    for (const auto& record : temperatures) {
        if (record.sensor.empty() || !IsValidUtf8(record.sensor) || !seen.insert(record.sensor).second) {
            continue;
        }

        const std::vector<Label> labels = {{"sensor", record.sensor}};
        writer.Add(kTemperature, labels, record.celsius);
        if (record.criticalCelsius) {
            writer.Add(kTemperatureCritical, labels, *record.criticalCelsius);
        }
    }
}
} // namespace

SeriesBuilder::SeriesBuilder(std::string hostname)
    : hostname_(std::move(hostname)) {}

SeriesBatch SeriesBuilder::Build(const Snapshot& snapshot, const RateSet& rates, int64_t timestampMs) const {
    BatchWriter writer(hostname_, timestampMs);

    if (snapshot.cpu) {
        AddCpu(writer, *snapshot.cpu);
    }
    if (snapshot.memory) {
        AddMemory(writer, *snapshot.memory);
    }
    if (snapshot.swap) {
        AddSwap(writer, *snapshot.swap);
    }
    AddDisks(writer, snapshot.disks);
    AddDiskIo(writer, snapshot.diskIo, rates);
    AddNetwork(writer, snapshot.interfaces, rates);
    AddTemperatures(writer, snapshot.temperatures);

    if (snapshot.load) {
        writer.Add(kLoad1, snapshot.load->oneMinute);
        writer.Add(kLoad5, snapshot.load->fiveMinutes);
        writer.Add(kLoad15, snapshot.load->fifteenMinutes);
    }

    if (snapshot.uptimeSeconds) {
        writer.Add(kUptime, *snapshot.uptimeSeconds);
    }
    if (snapshot.bootTimeSeconds) {
        writer.Add(kBootTime, static_cast<double>(*snapshot.bootTimeSeconds));
    }

    const SystemIdentity& identity = snapshot.identity;
    writer.Add(
        kSystemInfo,
        {
            {"os_name", identity.osName},
            {"os_version", identity.osVersion},
            {"kernel_version", identity.kernelVersion},
            {"arch", identity.arch}
        },
        1.0);

    return writer.Take();
}

const std::string& SeriesBuilder::Hostname() const {
    return hostname_;
}

double SeriesBuilder::Ratio(uint64_t used, uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(used) / static_cast<double>(total);
}
