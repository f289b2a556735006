#include "Scheduler.hpp"

#include "SeriesJson.hpp"
#include "Tracing.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace {
int64_t WallClockMs() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

class PhaseGuard {
public:
    explicit PhaseGuard(std::atomic<TickPhase>& phase)
        : phase_(phase) {}

    ~PhaseGuard() {
        phase_ = TickPhase::Idle;
    }

    void Enter(TickPhase phase) {
        phase_ = phase;
    }

private:
    std::atomic<TickPhase>& phase_;
};

void LogTick(const TickReport& report) {
    if (!report.send) {
        return;
    }

    const SendResult& send = *report.send;
    std::ostream& out = send.status == SendStatus::Success ? std::cout : std::cerr;
    out << "[Scheduler] Tick " << report.timestampMs << ": " << report.seriesCount << " series, "
        << report.payloadBytes << " bytes, " << RemoteWriteClient::StatusName(send.status)
        << " after " << send.attempts << " attempt(s)";
    if (!send.error.empty()) {
        out << " (" << send.error << ")";
    }
    out << std::endl;
}
} // namespace

bool TickReport::Delivered() const {
    return send && send->status == SendStatus::Success;
}

Scheduler::Scheduler(
    HostMetricSource& source,
    SeriesBuilder builder,
    WriteRequestEncoder encoder,
    RemoteWriteClient& client,
    ShutdownSignal& shutdown,
    std::chrono::milliseconds interval,
    std::ostream* dryRunOut)
    : source_(source),
      builder_(std::move(builder)),
      encoder_(encoder),
      client_(client),
      shutdown_(shutdown),
      interval_(interval),
      dryRunOut_(dryRunOut) {}

void Scheduler::Run() {
    RateState rateState;
    Clock::time_point scheduled = Clock::now();

    std::cout << "[Scheduler] Pushing every " << interval_.count() << "ms" << std::endl;
    while (!shutdown_.Triggered()) {
        RunTick(rateState);

        scheduled = NextDeadline(scheduled, Clock::now(), interval_);
        if (!shutdown_.WaitUntil(scheduled)) {
            break;
        }
    }
    std::cout << "[Scheduler] Stopped after " << TicksRun() << " tick(s)" << std::endl;
}

TickReport Scheduler::RunTick(RateState& rateState) {
    TickReport report;
    report.timestampMs = WallClockMs();
    ++ticksRun_;

    PhaseGuard phase(phase_);
    ScopedSpan span(Tracer::Instance(), "agemon.tick");

    phase.Enter(TickPhase::Collecting);
    Snapshot snapshot;
    try {
        snapshot = source_.Refresh();
    } catch (const std::exception& ex) {
        report.error = std::string("collection failed: ") + ex.what();
        std::cerr << "[Scheduler] Tick abandoned, " << report.error << std::endl;
        return report;
    }
    report.collected = true;

    RateUpdate update = RateTracker::Track(rateState, snapshot);
    rateState = std::move(update.next);

    phase.Enter(TickPhase::Building);
    SeriesBatch batch;
    std::string payload;
    try {
        batch = builder_.Build(snapshot, update.rates, report.timestampMs);
        report.seriesCount = batch.samples.size();

        std::string encodeError;
        if (!encoder_.Encode(batch, payload, encodeError)) {
            report.error = "encoding failed: " + encodeError;
            std::cerr << "[Encoder] Tick abandoned, " << encodeError << std::endl;
            return report;
        }
    } catch (const std::exception& ex) {
        report.error = std::string("building failed: ") + ex.what();
        std::cerr << "[Scheduler] Tick abandoned, " << report.error << std::endl;
        return report;
    }
    report.encoded = true;
    report.payloadBytes = payload.size();
    span.SetAttribute("series.count", static_cast<int64_t>(report.seriesCount));

    if (dryRunOut_ != nullptr) {
        try {
            *dryRunOut_ << SeriesJson::Dump(batch) << std::endl;
        } catch (const std::exception& ex) {
            report.error = std::string("dry-run output failed: ") + ex.what();
            std::cerr << "[Scheduler] Tick abandoned, " << report.error << std::endl;
            span.End(false);
            return report;
        }
        span.End(true);
        return report;
    }

    phase.Enter(TickPhase::Sending);
    report.send = client_.Send(payload, &span);
    span.End(report.Delivered());
    LogTick(report);
    return report;
}

TickPhase Scheduler::Phase() const {
    return phase_;
}

uint64_t Scheduler::TicksRun() const {
    return ticksRun_;
}

Scheduler::Clock::time_point Scheduler::NextDeadline(
    Clock::time_point scheduled,
    Clock::time_point finished,
    Clock::duration interval) {
    const Clock::time_point next = scheduled + interval;
    return next > finished ? next : finished;
}
