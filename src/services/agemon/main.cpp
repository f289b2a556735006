#include "AgentConfig.hpp"
#include "ProcHostMetricSource.hpp"
#include "RemoteWriteClient.hpp"
#include "Scheduler.hpp"
#include "SeriesBuilder.hpp"
#include "ShutdownSignal.hpp"
#include "Tracing.hpp"
#include "Utf8.hpp"
#include "WriteRequestEncoder.hpp"

#include <csignal>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#ifndef AGEMON_VERSION
#define AGEMON_VERSION "0.1.0"
#endif

namespace {
std::string DetectHostname() {
    char hostnameBuffer[256] = {};
    if (gethostname(hostnameBuffer, sizeof(hostnameBuffer) - 1) == 0 && hostnameBuffer[0] != '\0'
        && IsValidUtf8(hostnameBuffer)) {
        return hostnameBuffer;
    }
    return "unknown-host";
}

sigset_t ShutdownSignals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    return signals;
}

// Blocks SIGINT/SIGTERM in every thread and turns them into a shutdown
// request from a dedicated waiter thread.
class SignalWaiter {
public:
    explicit SignalWaiter(ShutdownSignal& shutdown)
        : shutdown_(shutdown),
          signals_(ShutdownSignals()) {
        const int rc = pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
        if (rc != 0) {
            std::cerr << "[Agemon] Unable to block shutdown signals: " << std::strerror(rc) << std::endl;
        }
        worker_ = std::thread(&SignalWaiter::Run, this);
    }

    ~SignalWaiter() {
        if (!shutdown_.Triggered()) {
            // Wake the waiter so it can observe the shutdown and exit.
            pthread_kill(worker_.native_handle(), SIGTERM);
        }
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    SignalWaiter(const SignalWaiter&) = delete;
    SignalWaiter& operator=(const SignalWaiter&) = delete;

private:
    void Run() {
        int received = 0;
        if (sigwait(&signals_, &received) == 0 && !shutdown_.Triggered()) {
            std::cout << "[Agemon] Received " << (received == SIGINT ? "SIGINT" : "SIGTERM")
                      << ", shutting down." << std::endl;
        }
        shutdown_.Trigger();
    }

    ShutdownSignal& shutdown_;
    sigset_t signals_;
    std::thread worker_;
};
} // namespace

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "agemon";
    const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    AgentConfig config;
    std::string configError;
    switch (AgentConfigLoader::Load(args, AgentConfigLoader::ProcessEnvironment(), config, configError)) {
    case ConfigStatus::Ok:
        break;
    case ConfigStatus::ShowHelp:
        std::cout << AgentConfigLoader::Usage(program);
        return 0;
    case ConfigStatus::UsageError:
        std::cerr << "[Agemon] " << configError << "\n\n" << AgentConfigLoader::Usage(program);
        return 2;
    case ConfigStatus::InvalidValue:
        std::cerr << "[Agemon] Invalid configuration: " << configError << std::endl;
        return 1;
    }

    if (config.hostname.empty()) {
        config.hostname = DetectHostname();
    }
    config.tracing.hostname = config.hostname;

    std::cout << "[Agemon] Starting " AGEMON_VERSION " on " << config.hostname << std::endl;
    std::cout << "[Agemon] Remote write: " << config.remoteWriteUrl
              << (config.credentials ? " (basic auth as " + config.credentials->username + ")" : std::string())
              << (config.dryRun ? " [dry run]" : "") << std::endl;

    ShutdownSignal shutdown;
    SignalWaiter signalWaiter(shutdown);

    Tracer::Instance().Configure(config.tracing);

    RemoteWriteSettings settings;
    settings.url = config.remoteWriteUrl;
    settings.credentials = config.credentials;
    settings.retry = config.retry;
    settings.userAgent = "agemon/" AGEMON_VERSION;

    ProcHostMetricSource source;
    RemoteWriteClient client(settings, shutdown);
    Scheduler scheduler(
        source,
        SeriesBuilder(config.hostname),
        WriteRequestEncoder(config.sendMetadata),
        client,
        shutdown,
        config.interval,
        config.dryRun ? &std::cout : nullptr);

    scheduler.Run();

    Tracer::Instance().Shutdown();
    std::cout << "[Agemon] Stopped." << std::endl;
    return 0;
}
