#pragma once

#include "HostMetricSource.hpp"
#include "RateTracker.hpp"
#include "RemoteWriteClient.hpp"
#include "SeriesBuilder.hpp"
#include "ShutdownSignal.hpp"
#include "WriteRequestEncoder.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

enum class TickPhase {
    Idle,
    Collecting,
    Building,
    Sending
};

struct TickReport {
    int64_t timestampMs = 0;
    bool collected = false;
    bool encoded = false;
    size_t seriesCount = 0;
    size_t payloadBytes = 0;
    std::optional<SendResult> send;
    std::string error;

    bool Delivered() const;
};

class Scheduler {
public:
    using Clock = std::chrono::steady_clock;

    // With dryRunOut set, each tick's series are printed there as JSON
    // instead of being sent.
    Scheduler(
        HostMetricSource& source,
        SeriesBuilder builder,
        WriteRequestEncoder encoder,
        RemoteWriteClient& client,
        ShutdownSignal& shutdown,
        std::chrono::milliseconds interval,
        std::ostream* dryRunOut = nullptr);

    // Runs ticks until shutdown is signalled.
    void Run();

    // One Idle -> Collecting -> Building -> Sending -> Idle pass. rateState
    // is advanced exactly once whenever a snapshot was collected.
    TickReport RunTick(RateState& rateState);

    TickPhase Phase() const;
    uint64_t TicksRun() const;

    // Deadline following a tick scheduled at `scheduled` that finished at
    // `finished`; never earlier than `finished`.
    static Clock::time_point NextDeadline(
        Clock::time_point scheduled,
        Clock::time_point finished,
        Clock::duration interval);

private:
    HostMetricSource& source_;
    SeriesBuilder builder_;
    WriteRequestEncoder encoder_;
    RemoteWriteClient& client_;
    ShutdownSignal& shutdown_;
    std::chrono::milliseconds interval_;
    std::ostream* dryRunOut_;
    std::atomic<TickPhase> phase_{TickPhase::Idle};
    std::atomic<uint64_t> ticksRun_{0};
};
