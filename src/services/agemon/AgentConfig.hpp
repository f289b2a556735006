#pragma once

#include "RemoteWriteClient.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct AgentConfig {
    std::chrono::seconds interval{15};
    std::string remoteWriteUrl = "http://localhost:9090/api/v1/write";
    std::optional<BasicCredentials> credentials;
    std::string hostname;
    RetryPolicy retry;
    bool sendMetadata = true;
    bool dryRun = false;
    TraceConfig tracing;
};

enum class ConfigStatus {
    Ok,
    ShowHelp,
    UsageError,
    InvalidValue
};

class AgentConfigLoader {
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    // Environment first, then command-line flags on top. args excludes the
    // program name.
    static ConfigStatus Load(
        const std::vector<std::string>& args,
        const EnvLookup& env,
        AgentConfig& outConfig,
        std::string& outError);

    static EnvLookup ProcessEnvironment();
    static std::string Usage(const std::string& program);

    static std::optional<bool> ParseBool(const std::string& value);
    static std::optional<int> ParsePositiveInt(const std::string& value);
};
