#include "ProcHostMetricSource.hpp"

#include <sys/statvfs.h>
#include <sys/utsname.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace {
constexpr uint64_t kSectorBytes = 512;

bool ReadFile(const fs::path& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

bool ReadTrimmed(const fs::path& path, std::string& out) {
    std::string raw;
    if (!ReadFile(path, raw)) {
        return false;
    }
    out = Trim(raw);
    return true;
}

bool ReadLong(const fs::path& path, long long& out) {
    std::string text;
    if (!ReadTrimmed(path, text) || text.empty()) {
        return false;
    }

    std::istringstream iss(text);
    iss >> out;
    return !iss.fail();
}

// /proc/self/mounts escapes whitespace and backslashes as \ooo.
std::string DecodeMountField(const std::string& field) {
    std::string decoded;
    decoded.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const std::string digits = field.substr(i + 1, 3);
            const bool octal = digits.size() == 3 && std::all_of(digits.begin(), digits.end(), [](char ch) {
                return ch >= '0' && ch <= '7';
            });
            if (octal) {
                decoded.push_back(static_cast<char>(std::stoi(digits, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        decoded.push_back(field[i]);
    }
    return decoded;
}

std::string StripQuotes(std::string value) {
    if (value.size() >= 2) {
        const char first = value.front();
        if ((first == '"' || first == '\'') && value.back() == first) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

std::vector<fs::path> SortedEntries(const fs::path& dir) {
    std::vector<fs::path> entries;
    std::error_code error;
    fs::directory_iterator it(dir, error);
    if (error) {
        return entries;
    }

    for (const auto& entry : it) {
        entries.push_back(entry.path());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

bool IsVirtualBlockDevice(const std::string& name) {
    return name.rfind("loop", 0) == 0
        || name.rfind("ram", 0) == 0
        || name.rfind("zram", 0) == 0
        || name.rfind("dm-", 0) == 0
        || name.rfind("md", 0) == 0;
}

double MonotonicSeconds() {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}

int64_t WallTimeMs() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}
} // namespace

ProcHostMetricSource::ProcHostMetricSource(std::string procRoot, std::string sysRoot, std::string etcRoot)
    : procRoot_(std::move(procRoot)),
      sysRoot_(std::move(sysRoot)),
      etcRoot_(std::move(etcRoot)) {}

Snapshot ProcHostMetricSource::Refresh() {
    Snapshot snapshot;
    snapshot.monotonicSeconds = MonotonicSeconds();
    snapshot.wallTimeMs = WallTimeMs();

    const fs::path proc(procRoot_);
    std::string text;

    if (ReadFile(proc / "stat", text)) {
        snapshot.cpu = CollectCpu(text);
        snapshot.bootTimeSeconds = ParseBootTime(text);
    }

    if (ReadFile(proc / "meminfo", text)) {
        MemoryReading memory;
        SwapReading swap;
        if (ParseMemInfo(text, memory, swap)) {
            snapshot.memory = memory;
            snapshot.swap = swap;
        }
    }

    CollectDisks(snapshot.disks);

    if (ReadFile(proc / "net" / "dev", text)) {
        snapshot.interfaces = ParseNetDev(text);
    }

    CollectTemperatures(snapshot.temperatures);

    if (ReadFile(proc / "diskstats", text)) {
        snapshot.diskIo = ParseDiskStats(text, [this](const std::string& name) {
            return IsWholeBlockDevice(name);
        });
    }

    if (ReadFile(proc / "loadavg", text)) {
        snapshot.load = ParseLoadAvg(text);
    }

    if (ReadFile(proc / "uptime", text)) {
        snapshot.uptimeSeconds = ParseUptime(text);
    }

    snapshot.identity = ReadIdentity();
    return snapshot;
}

bool ProcHostMetricSource::ParseCpuTimes(const std::string& statText, std::vector<CpuTimes>& out) {
    out.clear();
    bool sawAggregate = false;

    std::istringstream stream(statText);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.rfind("cpu", 0) != 0) {
            if (!out.empty()) {
                break;
            }
            continue;
        }

        std::istringstream iss(line);
        std::string label;
        iss >> label;

        unsigned long long user = 0;
        unsigned long long nice = 0;
        unsigned long long system = 0;
        unsigned long long idleVal = 0;
        unsigned long long iowait = 0;
        unsigned long long irq = 0;
        unsigned long long softirq = 0;
        unsigned long long steal = 0;

        if (!(iss >> user >> nice >> system >> idleVal)) {
            continue;
        }
        iss >> iowait >> irq >> softirq >> steal;

        // guest and guest_nice are already included in user and nice.
        CpuTimes times;
        times.idle = idleVal + iowait;
        times.total = user + nice + system + idleVal + iowait + irq + softirq + steal;

        if (label == "cpu") {
            sawAggregate = true;
            out.insert(out.begin(), times);
        } else {
            out.push_back(times);
        }
    }

    return sawAggregate;
}

std::optional<int64_t> ProcHostMetricSource::ParseBootTime(const std::string& statText) {
    std::istringstream stream(statText);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.rfind("btime ", 0) == 0) {
            std::istringstream iss(line.substr(6));
            long long value = 0;
            if (iss >> value) {
                return static_cast<int64_t>(value);
            }
        }
    }
    return std::nullopt;
}

double ProcHostMetricSource::BusyPercent(const CpuTimes& previous, const CpuTimes& current) {
    if (current.total <= previous.total || current.idle < previous.idle) {
        return 0.0;
    }

    const unsigned long long totalDelta = current.total - previous.total;
    const unsigned long long idleDelta = current.idle - previous.idle;
    if (idleDelta >= totalDelta) {
        return 0.0;
    }

    return static_cast<double>(totalDelta - idleDelta) / static_cast<double>(totalDelta) * 100.0;
}

bool ProcHostMetricSource::ParseMemInfo(const std::string& text, MemoryReading& memory, SwapReading& swap) {
    unsigned long long totalKb = 0;
    unsigned long long freeKb = 0;
    unsigned long long availableKb = 0;
    unsigned long long swapTotalKb = 0;
    unsigned long long swapFreeKb = 0;
    bool haveAvailable = false;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        std::istringstream iss(line);
        std::string key;
        unsigned long long value = 0;
        if (!(iss >> key >> value)) {
            continue;
        }

        if (key == "MemTotal:") {
            totalKb = value;
        } else if (key == "MemFree:") {
            freeKb = value;
        } else if (key == "MemAvailable:") {
            availableKb = value;
            haveAvailable = true;
        } else if (key == "SwapTotal:") {
            swapTotalKb = value;
        } else if (key == "SwapFree:") {
            swapFreeKb = value;
        }
    }

    if (totalKb == 0) {
        return false;
    }

    // Kernels older than 3.14 have no MemAvailable.
    if (!haveAvailable) {
        availableKb = freeKb;
    }

    memory.totalBytes = totalKb * 1024;
    memory.freeBytes = freeKb * 1024;
    memory.availableBytes = std::min(availableKb, totalKb) * 1024;
    memory.usedBytes = memory.totalBytes - memory.availableBytes;

    swap.totalBytes = swapTotalKb * 1024;
    swap.usedBytes = swapTotalKb > swapFreeKb ? (swapTotalKb - swapFreeKb) * 1024 : 0;
    return true;
}

bool ProcHostMetricSource::IsPseudoFilesystem(const std::string& fsType) {
    static const std::unordered_set<std::string> pseudo = {
        "proc", "sysfs", "devtmpfs", "devpts", "tmpfs", "cgroup", "cgroup2", "pstore", "securityfs",
        "bpf", "autofs", "mqueue", "hugetlbfs", "configfs", "debugfs", "tracefs", "nsfs", "ramfs",
        "fusectl", "fuse.portal", "overlay", "squashfs", "binfmt_misc", "rpc_pipefs", "efivarfs",
        "selinuxfs", "fuse.gvfsd-fuse", "nfsd"
    };
    return pseudo.count(fsType) != 0;
}

std::vector<MountEntry> ProcHostMetricSource::ParseMounts(const std::string& text) {
    std::vector<MountEntry> mounts;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        std::istringstream iss(line);
        std::string device;
        std::string mountPoint;
        std::string fsType;
        if (!(iss >> device >> mountPoint >> fsType)) {
            continue;
        }

        if (IsPseudoFilesystem(fsType)) {
            continue;
        }

        MountEntry entry;
        entry.device = DecodeMountField(device);
        entry.mountPoint = DecodeMountField(mountPoint);
        entry.fsType = fsType;

        // A later mount on the same path hides the earlier one.
        auto existing = std::find_if(mounts.begin(), mounts.end(), [&](const MountEntry& mount) {
            return mount.mountPoint == entry.mountPoint;
        });
        if (existing != mounts.end()) {
            *existing = std::move(entry);
        } else {
            mounts.push_back(std::move(entry));
        }
    }

    return mounts;
}

std::vector<NetworkInterfaceRecord> ProcHostMetricSource::ParseNetDev(const std::string& text) {
    std::vector<NetworkInterfaceRecord> interfaces;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }

        const std::string name = Trim(line.substr(0, colon));
        if (name.empty() || name == "lo" || name.find('|') != std::string::npos) {
            continue;
        }

        std::istringstream iss(line.substr(colon + 1));
        unsigned long long fields[16] = {};
        int parsed = 0;
        while (parsed < 16 && iss >> fields[parsed]) {
            ++parsed;
        }
        if (parsed < 11) {
            continue;
        }

        NetworkInterfaceRecord record;
        record.name = name;
        record.counters.receivedBytes = fields[0];
        record.counters.receivedPackets = fields[1];
        record.counters.receiveErrors = fields[2];
        record.counters.transmittedBytes = fields[8];
        record.counters.transmittedPackets = fields[9];
        record.counters.transmitErrors = fields[10];
        interfaces.push_back(std::move(record));
    }

    return interfaces;
}

std::optional<DiskIoCounters> ProcHostMetricSource::ParseDiskStats(
    const std::string& text,
    const std::function<bool(const std::string&)>& isWholeDevice) {
    DiskIoCounters counters;
    bool parsedAny = false;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        std::istringstream iss(line);
        unsigned major = 0;
        unsigned minor = 0;
        std::string name;
        unsigned long long reads = 0;
        unsigned long long readsMerged = 0;
        unsigned long long sectorsRead = 0;
        unsigned long long readTimeMs = 0;
        unsigned long long writes = 0;
        unsigned long long writesMerged = 0;
        unsigned long long sectorsWritten = 0;
        if (!(iss >> major >> minor >> name >> reads >> readsMerged >> sectorsRead >> readTimeMs
                  >> writes >> writesMerged >> sectorsWritten)) {
            continue;
        }
        parsedAny = true;

        if (IsVirtualBlockDevice(name) || (isWholeDevice && !isWholeDevice(name))) {
            continue;
        }

        counters.readBytes += sectorsRead * kSectorBytes;
        counters.writtenBytes += sectorsWritten * kSectorBytes;
    }

    if (!parsedAny) {
        return std::nullopt;
    }
    return counters;
}

std::optional<LoadAverages> ProcHostMetricSource::ParseLoadAvg(const std::string& text) {
    std::istringstream iss(text);
    LoadAverages load;
    if (!(iss >> load.oneMinute >> load.fiveMinutes >> load.fifteenMinutes)) {
        return std::nullopt;
    }
    return load;
}

std::optional<double> ProcHostMetricSource::ParseUptime(const std::string& text) {
    std::istringstream iss(text);
    double uptime = 0.0;
    if (!(iss >> uptime)) {
        return std::nullopt;
    }
    return uptime;
}

void ProcHostMetricSource::ParseOsRelease(const std::string& text, SystemIdentity& identity) {
    std::string version;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        const auto equals = line.find('=');
        if (equals == std::string::npos || line.front() == '#') {
            continue;
        }

        const std::string key = Trim(line.substr(0, equals));
        const std::string value = StripQuotes(Trim(line.substr(equals + 1)));
        if (key == "NAME") {
            identity.osName = value;
        } else if (key == "VERSION_ID") {
            identity.osVersion = value;
        } else if (key == "VERSION") {
            version = value;
        }
    }

    if (identity.osVersion.empty()) {
        identity.osVersion = version;
    }
}

std::optional<CpuReading> ProcHostMetricSource::CollectCpu(const std::string& statText) {
    std::vector<CpuTimes> times;
    if (!ParseCpuTimes(statText, times)) {
        return std::nullopt;
    }

    CpuReading cpu;
    const bool havePrevious = prevCpuTimes_.size() == times.size();
    cpu.logicalCores = static_cast<int>(times.size()) - 1;
    cpu.usagePercent = havePrevious ? BusyPercent(prevCpuTimes_[0], times[0]) : 0.0;
    cpu.coreUsagePercent.assign(static_cast<size_t>(cpu.logicalCores), 0.0);
    if (havePrevious) {
        for (size_t core = 1; core < times.size(); ++core) {
            cpu.coreUsagePercent[core - 1] = BusyPercent(prevCpuTimes_[core], times[core]);
        }
    }

    prevCpuTimes_ = std::move(times);
    return cpu;
}

void ProcHostMetricSource::CollectDisks(std::vector<DiskRecord>& disks) const {
    std::string text;
    if (!ReadFile(fs::path(procRoot_) / "self" / "mounts", text)) {
        return;
    }

    for (const auto& mount : ParseMounts(text)) {
        struct statvfs vfs {};
        if (::statvfs(mount.mountPoint.c_str(), &vfs) != 0) {
            continue;
        }

        DiskRecord disk;
        disk.mountPoint = mount.mountPoint;
        disk.device = mount.device;
        disk.fsType = mount.fsType;
        disk.totalBytes = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
        disk.availableBytes = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
        disk.removable = IsRemovable(mount.device);
        disks.push_back(std::move(disk));
    }
}

void ProcHostMetricSource::CollectTemperatures(std::vector<TemperatureRecord>& temperatures) const {
    for (const auto& chip : SortedEntries(fs::path(sysRoot_) / "class" / "hwmon")) {
        std::string chipName;
        if (!ReadTrimmed(chip / "name", chipName) || chipName.empty()) {
            chipName = chip.filename().string();
        }

        std::vector<std::pair<int, std::string>> inputs;
        for (const auto& file : SortedEntries(chip)) {
            const std::string name = file.filename().string();
            const auto suffix = name.find("_input");
            if (name.rfind("temp", 0) != 0 || suffix == std::string::npos || suffix + 6 != name.size()) {
                continue;
            }

            const std::string index = name.substr(4, suffix - 4);
            if (index.empty() || !std::all_of(index.begin(), index.end(), [](unsigned char ch) {
                    return std::isdigit(ch) != 0;
                })) {
                continue;
            }
            inputs.emplace_back(std::stoi(index), "temp" + index);
        }
        std::sort(inputs.begin(), inputs.end());

        for (const auto& [index, base] : inputs) {
            long long milliCelsius = 0;
            if (!ReadLong(chip / (base + "_input"), milliCelsius)) {
                continue;
            }

            std::string label;
            if (!ReadTrimmed(chip / (base + "_label"), label) || label.empty()) {
                label = base;
            }

            TemperatureRecord record;
            record.sensor = chipName + " " + label;
            record.celsius = static_cast<double>(milliCelsius) / 1000.0;

            long long critical = 0;
            if (ReadLong(chip / (base + "_crit"), critical)) {
                record.criticalCelsius = static_cast<double>(critical) / 1000.0;
            }
            temperatures.push_back(std::move(record));
        }
    }
}

bool ProcHostMetricSource::IsRemovable(const std::string& device) const {
    if (device.rfind("/dev/", 0) != 0) {
        return false;
    }

    const std::string name = device.substr(5);
    const fs::path block = fs::path(sysRoot_) / "block";
    std::string flag;
    if (ReadTrimmed(block / name / "removable", flag)) {
        return flag == "1";
    }

    // Partitions live under their parent disk.
    std::error_code error;
    for (const auto& disk : SortedEntries(block)) {
        if (fs::exists(disk / name, error) && ReadTrimmed(disk / "removable", flag)) {
            return flag == "1";
        }
    }
    return false;
}

bool ProcHostMetricSource::IsWholeBlockDevice(const std::string& name) const {
    std::error_code error;
    return fs::exists(fs::path(sysRoot_) / "block" / name, error);
}

SystemIdentity ProcHostMetricSource::ReadIdentity() const {
    SystemIdentity identity;

    std::string text;
    if (ReadFile(fs::path(etcRoot_) / "os-release", text)) {
        ParseOsRelease(text, identity);
    }

    struct utsname info;
    if (uname(&info) == 0) {
        identity.kernelVersion = info.release;
        identity.arch = info.machine;
    }

    if (identity.osName.empty()) {
        identity.osName = "Linux";
    }
    return identity;
}
