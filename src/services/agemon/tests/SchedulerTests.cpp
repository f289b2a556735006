#include "Scheduler.hpp"

#include "remote.pb.h"

#include <nlohmann/json.hpp>
#include <snappy.h>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

// Hands out prepared snapshots in order; throws when told to.
class ScriptedSource : public HostMetricSource {
public:
    Snapshot Refresh() override {
        ++refreshes;
        if (failNext) {
            failNext = false;
            throw std::runtime_error("procfs unavailable");
        }
        Snapshot snapshot = snapshots.at(next);
        if (next + 1 < snapshots.size()) {
            ++next;
        }
        return snapshot;
    }

    std::vector<Snapshot> snapshots;
    size_t next = 0;
    bool failNext = false;
    int refreshes = 0;
};

DiskRecord MakeDisk(const std::string& mountPoint, const std::string& device) {
    DiskRecord disk;
    disk.mountPoint = mountPoint;
    disk.device = device;
    disk.fsType = "ext4";
    disk.totalBytes = 4000;
    disk.availableBytes = 1000;
    return disk;
}

Snapshot MakeSnapshot(double seconds, uint64_t readBytes) {
    Snapshot snapshot;
    snapshot.monotonicSeconds = seconds;
    snapshot.cpu = CpuReading{10.0, {5.0, 15.0}, 2};
    snapshot.memory = MemoryReading{1000, 250, 750, 500};
    snapshot.diskIo = DiskIoCounters{readBytes, 0};
    snapshot.identity.osName = "Linux";
    return snapshot;
}

RemoteWriteSettings FastSettings() {
    RemoteWriteSettings settings;
    settings.url = "http://127.0.0.1:9/api/v1/write";
    settings.retry.maxAttempts = 2;
    settings.retry.initialBackoff = std::chrono::milliseconds(1);
    settings.retry.maxBackoff = std::chrono::milliseconds(1);
    return settings;
}

bool DecodeRequest(const std::string& payload, prometheus::WriteRequest& request) {
    std::string raw;
    return snappy::Uncompress(payload.data(), payload.size(), &raw) && request.ParseFromString(raw);
}

const prometheus::TimeSeries* FindSeries(const prometheus::WriteRequest& request, const std::string& name) {
    for (const auto& series : request.timeseries()) {
        for (const auto& label : series.labels()) {
            if (label.name() == "__name__" && label.value() == name) {
                return &series;
            }
        }
    }
    return nullptr;
}
} // namespace

int main() {
    // Two ticks delivered; the second carries rates.
    {
        ScriptedSource source;
        source.snapshots = {MakeSnapshot(0.0, 100), MakeSnapshot(10.0, 1100)};

        ShutdownSignal shutdown;
        std::vector<std::string> bodies;
        Scheduler* current = nullptr;
        bool sawSendingPhase = false;
        RemoteWriteClient client(FastSettings(), shutdown, [&](const HttpRequest& request) {
            bodies.push_back(request.body);
            sawSendingPhase = current != nullptr && current->Phase() == TickPhase::Sending;
            HttpResponse response;
            response.transportOk = true;
            response.statusCode = 204;
            return response;
        });

        Scheduler scheduler(
            source, SeriesBuilder("node-a"), WriteRequestEncoder(), client, shutdown, std::chrono::milliseconds(1000));
        current = &scheduler;

        RateState state;
        const TickReport first = scheduler.RunTick(state);
        if (!first.collected || !first.encoded || !first.Delivered() || first.seriesCount == 0) {
            return Fail("First tick should be collected, encoded and delivered.");
        }
        if (!sawSendingPhase || scheduler.Phase() != TickPhase::Idle) {
            return Fail("Tick should pass through Sending and end Idle.");
        }
        if (!state.initialized || !state.diskIo || state.diskIo->readBytes != 100) {
            return Fail("Rate state should hold the first tick's counters.");
        }
        if (first.payloadBytes != bodies.front().size()) {
            return Fail("Report should record the payload size.");
        }

        prometheus::WriteRequest request;
        if (!DecodeRequest(bodies.front(), request)) {
            return Fail("Posted body should be a Snappy compressed WriteRequest.");
        }
        if (static_cast<size_t>(request.timeseries_size()) != first.seriesCount) {
            return Fail("Series count in the report should match the request.");
        }
        if (FindSeries(request, "system_disk_io_read_bytes_per_second") != nullptr) {
            return Fail("First tick must not carry rate series.");
        }
        for (const auto& series : request.timeseries()) {
            if (series.samples(0).timestamp() != first.timestampMs) {
                return Fail("All series should carry the tick timestamp.");
            }
        }

        const TickReport second = scheduler.RunTick(state);
        if (!second.Delivered() || second.timestampMs < first.timestampMs) {
            return Fail("Second tick should be delivered with a later timestamp.");
        }
        prometheus::WriteRequest secondRequest;
        if (!DecodeRequest(bodies.back(), secondRequest)) {
            return Fail("Second body failed to decode.");
        }
        const prometheus::TimeSeries* readRate = FindSeries(secondRequest, "system_disk_io_read_bytes_per_second");
        if (readRate == nullptr || readRate->samples(0).value() != 100.0) {
            return Fail("Second tick should report 100 bytes/sec read.");
        }
        if (second.seriesCount != first.seriesCount + 2) {
            return Fail("Second tick should add exactly the two disk I/O rate series.");
        }
        if (scheduler.TicksRun() != 2) {
            return Fail("Expected two ticks counted.");
        }
    }

    // Failed sends and failed collections.
    {
        ScriptedSource source;
        source.snapshots = {MakeSnapshot(0.0, 100), MakeSnapshot(10.0, 600), MakeSnapshot(20.0, 900)};

        ShutdownSignal shutdown;
        int posts = 0;
        RemoteWriteClient client(FastSettings(), shutdown, [&](const HttpRequest&) {
            ++posts;
            HttpResponse response;
            response.transportOk = true;
            response.statusCode = 400;
            response.body = "bad request";
            return response;
        });
        Scheduler scheduler(
            source, SeriesBuilder("node-a"), WriteRequestEncoder(false), client, shutdown, std::chrono::milliseconds(1000));

        RateState state;
        const TickReport rejected = scheduler.RunTick(state);
        if (rejected.Delivered() || !rejected.send || rejected.send->status != SendStatus::PermanentFailure) {
            return Fail("A 4xx response should make the tick undelivered.");
        }
        if (posts != 1) {
            return Fail("Permanent failures should not be retried.");
        }
        if (!state.initialized || state.timestampSeconds != 0.0) {
            return Fail("Rate state must advance even when the send fails.");
        }

        source.failNext = true;
        const TickReport broken = scheduler.RunTick(state);
        if (broken.collected || broken.encoded || broken.send || broken.error.find("procfs unavailable") == std::string::npos) {
            return Fail("A throwing source should abandon the tick with its error.");
        }
        if (state.timestampSeconds != 0.0 || posts != 1) {
            return Fail("An abandoned collection must not touch the rate state or send anything.");
        }
        if (scheduler.Phase() != TickPhase::Idle) {
            return Fail("Abandoned tick should leave the scheduler Idle.");
        }

        const TickReport recovered = scheduler.RunTick(state);
        if (!recovered.collected || state.timestampSeconds != 10.0 || !state.diskIo || state.diskIo->readBytes != 600) {
            return Fail("The next tick should resume from the last collected counters.");
        }
        if (scheduler.TicksRun() != 3) {
            return Fail("Abandoned ticks still count as ticks.");
        }
    }

    // Dry run prints JSON and never posts.
    {
        ScriptedSource source;
        source.snapshots = {MakeSnapshot(0.0, 100)};

        ShutdownSignal shutdown;
        int posts = 0;
        RemoteWriteClient client(FastSettings(), shutdown, [&](const HttpRequest&) {
            ++posts;
            return HttpResponse();
        });

        std::ostringstream out;
        Scheduler scheduler(
            source, SeriesBuilder("node-a"), WriteRequestEncoder(), client, shutdown, std::chrono::milliseconds(1000), &out);

        RateState state;
        const TickReport report = scheduler.RunTick(state);
        if (posts != 0 || report.send) {
            return Fail("Dry run must not send anything.");
        }
        if (!report.encoded) {
            return Fail("Dry run should still validate the batch.");
        }

        const nlohmann::json dumped = nlohmann::json::parse(out.str());
        if (!dumped.is_array() || dumped.size() != report.seriesCount) {
            return Fail("Dry run output should list every series.");
        }
        if (dumped.front()["labels"]["__name__"] != "system_cpu_usage_percent") {
            return Fail("Dry run output should follow series order.");
        }
    }

    // A mount point that is not UTF-8 drops that disk from the dry-run output.
    {
        ScriptedSource source;
        Snapshot snapshot = MakeSnapshot(0.0, 100);
        snapshot.disks = {MakeDisk("/", "/dev/sda1"), MakeDisk("/media/caf\xe9", "/dev/sdb1")};
        source.snapshots = {snapshot};

        ShutdownSignal shutdown;
        RemoteWriteClient client(FastSettings(), shutdown, [](const HttpRequest&) {
            return HttpResponse();
        });

        std::ostringstream out;
        Scheduler scheduler(
            source, SeriesBuilder("node-a"), WriteRequestEncoder(), client, shutdown, std::chrono::milliseconds(1000), &out);

        RateState state;
        const TickReport report = scheduler.RunTick(state);
        if (!report.encoded || !report.error.empty()) {
            return Fail("Dry run with an unencodable mount point should still succeed: " + report.error);
        }

        const nlohmann::json dumped = nlohmann::json::parse(out.str());
        int rootDisk = 0;
        int otherDisks = 0;
        for (const auto& entry : dumped) {
            const auto& labels = entry.at("labels");
            if (!labels.contains("mount_point")) {
                continue;
            }
            if (labels.at("mount_point") == "/") {
                ++rootDisk;
            } else {
                ++otherDisks;
            }
        }
        if (rootDisk != 5 || otherDisks != 0) {
            return Fail("Only the readable disk should appear in the dry-run output.");
        }
    }

    // The same snapshot still produces a request a server can parse.
    {
        ScriptedSource source;
        Snapshot snapshot = MakeSnapshot(0.0, 100);
        snapshot.disks = {MakeDisk("/media/caf\xe9", "/dev/sdb1"), MakeDisk("/", "/dev/sda1")};
        source.snapshots = {snapshot};

        ShutdownSignal shutdown;
        std::vector<std::string> bodies;
        RemoteWriteClient client(FastSettings(), shutdown, [&](const HttpRequest& request) {
            bodies.push_back(request.body);
            HttpResponse response;
            response.transportOk = true;
            response.statusCode = 204;
            return response;
        });

        Scheduler scheduler(
            source, SeriesBuilder("node-a"), WriteRequestEncoder(), client, shutdown, std::chrono::milliseconds(1000));

        RateState state;
        const TickReport report = scheduler.RunTick(state);
        if (!report.Delivered() || bodies.size() != 1) {
            return Fail("Tick with an unencodable mount point should still be delivered: " + report.error);
        }

        prometheus::WriteRequest request;
        if (!DecodeRequest(bodies.front(), request)) {
            return Fail("Delivered payload should decode.");
        }
        const prometheus::TimeSeries* disk = FindSeries(request, "system_disk_total_bytes");
        if (disk == nullptr) {
            return Fail("The readable disk should still be reported.");
        }
        for (const auto& label : disk->labels()) {
            if (label.name() == "mount_point" && label.value() != "/") {
                return Fail("Unexpected mount point " + label.value());
            }
        }
    }

    // Run() keeps ticking until shutdown.
    {
        ScriptedSource source;
        source.snapshots = {MakeSnapshot(0.0, 100), MakeSnapshot(1.0, 200), MakeSnapshot(2.0, 300)};

        ShutdownSignal shutdown;
        int posts = 0;
        RemoteWriteClient client(FastSettings(), shutdown, [&](const HttpRequest&) {
            if (++posts == 2) {
                shutdown.Trigger();
            }
            HttpResponse response;
            response.transportOk = true;
            response.statusCode = 200;
            return response;
        });
        Scheduler scheduler(
            source, SeriesBuilder("node-a"), WriteRequestEncoder(), client, shutdown, std::chrono::milliseconds(5));

        scheduler.Run();
        if (scheduler.TicksRun() != 2 || posts != 2 || source.refreshes != 2) {
            return Fail("Run should stop right after shutdown is requested.");
        }
    }

    {
        ShutdownSignal shutdown;
        shutdown.Trigger();
        ScriptedSource source;
        source.snapshots = {MakeSnapshot(0.0, 100)};
        RemoteWriteClient client(FastSettings(), shutdown, [](const HttpRequest&) { return HttpResponse(); });
        Scheduler scheduler(
            source, SeriesBuilder("node-a"), WriteRequestEncoder(), client, shutdown, std::chrono::milliseconds(5));
        scheduler.Run();
        if (scheduler.TicksRun() != 0 || source.refreshes != 0) {
            return Fail("Run should not tick once shutdown was already requested.");
        }
    }

    // Deadlines stay on the fixed cadence unless a tick overruns.
    using Clock = Scheduler::Clock;
    const Clock::time_point start = Clock::now();
    const Clock::duration interval = std::chrono::seconds(15);
    if (Scheduler::NextDeadline(start, start + std::chrono::seconds(2), interval) != start + interval) {
        return Fail("A short tick should not shift the cadence.");
    }
    const Clock::time_point late = start + std::chrono::seconds(20);
    if (Scheduler::NextDeadline(start, late, interval) != late) {
        return Fail("An overrunning tick should be followed immediately, never earlier than it finished.");
    }

    return 0;
}
