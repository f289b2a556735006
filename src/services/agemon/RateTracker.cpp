#include "RateTracker.hpp"

namespace {
NetworkRates InterfaceRates(const NetworkCounters& previous, const NetworkCounters& current, double elapsed) {
    NetworkRates rates;
    rates.receivedBytesPerSecond = RateTracker::ComputeRate(previous.receivedBytes, current.receivedBytes, elapsed);
    rates.transmittedBytesPerSecond =
        RateTracker::ComputeRate(previous.transmittedBytes, current.transmittedBytes, elapsed);
    rates.receivedPacketsPerSecond =
        RateTracker::ComputeRate(previous.receivedPackets, current.receivedPackets, elapsed);
    rates.transmittedPacketsPerSecond =
        RateTracker::ComputeRate(previous.transmittedPackets, current.transmittedPackets, elapsed);
    rates.receiveErrorsPerSecond = RateTracker::ComputeRate(previous.receiveErrors, current.receiveErrors, elapsed);
    rates.transmitErrorsPerSecond =
        RateTracker::ComputeRate(previous.transmitErrors, current.transmitErrors, elapsed);
    return rates;
}
} // namespace

double RateTracker::ComputeRate(uint64_t previous, uint64_t current, double elapsedSeconds) {
    if (elapsedSeconds <= 0.0 || current < previous) {
        return 0.0;
    }

    return static_cast<double>(current - previous) / elapsedSeconds;
}

RateUpdate RateTracker::Track(const RateState& previous, const Snapshot& current) {
    RateUpdate update;

    update.next.initialized = true;
    update.next.timestampSeconds = current.monotonicSeconds;
    update.next.diskIo = current.diskIo;
    for (const auto& record : current.interfaces) {
        update.next.interfaces.emplace(record.name, record.counters);
    }

    if (!previous.initialized) {
        return update;
    }

    const double elapsed = current.monotonicSeconds - previous.timestampSeconds;

    if (previous.diskIo && current.diskIo) {
        DiskIoRates rates;
        rates.readBytesPerSecond = ComputeRate(previous.diskIo->readBytes, current.diskIo->readBytes, elapsed);
        rates.writtenBytesPerSecond =
            ComputeRate(previous.diskIo->writtenBytes, current.diskIo->writtenBytes, elapsed);
        update.rates.diskIo = rates;
    }

    for (const auto& record : current.interfaces) {
        auto it = previous.interfaces.find(record.name);
        if (it == previous.interfaces.end()) {
            continue;
        }
        update.rates.interfaces.emplace(record.name, InterfaceRates(it->second, record.counters, elapsed));
    }

    return update;
}
