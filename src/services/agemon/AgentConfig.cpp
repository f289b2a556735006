#include "AgentConfig.hpp"

#include "Utf8.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <sstream>
#include <utility>

namespace {
std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool IsHttpUrl(const std::string& url) {
    const std::string lowered = ToLower(url);
    const bool http = lowered.rfind("http://", 0) == 0 && lowered.size() > 7;
    const bool https = lowered.rfind("https://", 0) == 0 && lowered.size() > 8;
    return http || https;
}

bool ReadPasswordFile(const std::string& path, std::string& outPassword) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::getline(file, outPassword);
    while (!outPassword.empty() && (outPassword.back() == '\r' || outPassword.back() == '\n')) {
        outPassword.pop_back();
    }
    return true;
}

struct RawSettings {
    std::optional<std::string> interval;
    std::optional<std::string> url;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> passwordFile;
    std::optional<std::string> hostname;
    std::optional<std::string> maxAttempts;
    std::optional<std::string> timeout;
    std::optional<std::string> sendMetadata;
    std::optional<std::string> dryRun;
    std::optional<std::string> otelEnabled;
    std::optional<std::string> otelEndpoint;
};

void ReadEnvironment(const AgentConfigLoader::EnvLookup& env, RawSettings& raw) {
    if (!env) {
        return;
    }

    raw.interval = env("AGEMON_INTERVAL");
    raw.url = env("AGEMON_REMOTE_WRITE_URL");
    raw.username = env("AGEMON_REMOTE_WRITE_USERNAME");
    raw.password = env("AGEMON_REMOTE_WRITE_PASSWORD");
    raw.hostname = env("AGEMON_HOSTNAME");
    raw.maxAttempts = env("AGEMON_MAX_ATTEMPTS");
    raw.timeout = env("AGEMON_TIMEOUT");
    raw.sendMetadata = env("AGEMON_SEND_METADATA");
    raw.dryRun = env("AGEMON_DRY_RUN");
    raw.otelEnabled = env("AGEMON_OTEL_ENABLED");
    raw.otelEndpoint = env("AGEMON_OTEL_ENDPOINT");
}

ConfigStatus ReadArguments(const std::vector<std::string>& args, RawSettings& raw, std::string& outError) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            return ConfigStatus::ShowHelp;
        }
        if (arg == "--dry-run") {
            raw.dryRun = "true";
            continue;
        }
        if (arg == "--no-metadata") {
            raw.sendMetadata = "false";
            continue;
        }

        std::optional<std::string>* target = nullptr;
        if (arg == "--interval") {
            target = &raw.interval;
        } else if (arg == "--remote-write-url") {
            target = &raw.url;
        } else if (arg == "--username") {
            target = &raw.username;
        } else if (arg == "--password-file") {
            target = &raw.passwordFile;
        } else if (arg == "--hostname") {
            target = &raw.hostname;
        } else if (arg == "--max-attempts") {
            target = &raw.maxAttempts;
        } else if (arg == "--timeout") {
            target = &raw.timeout;
        } else {
            outError = "unknown option " + arg;
            return ConfigStatus::UsageError;
        }

        if (i + 1 >= args.size()) {
            outError = arg + " requires a value";
            return ConfigStatus::UsageError;
        }
        *target = args[++i];
    }

    return ConfigStatus::Ok;
}
} // namespace

ConfigStatus AgentConfigLoader::Load(
    const std::vector<std::string>& args,
    const EnvLookup& env,
    AgentConfig& outConfig,
    std::string& outError) {
    RawSettings raw;
    ReadEnvironment(env, raw);

    const ConfigStatus argStatus = ReadArguments(args, raw, outError);
    if (argStatus != ConfigStatus::Ok) {
        return argStatus;
    }

    AgentConfig config;

    if (raw.interval) {
        const auto seconds = ParsePositiveInt(*raw.interval);
        if (!seconds) {
            outError = "interval must be a positive number of seconds, got \"" + *raw.interval + "\"";
            return ConfigStatus::InvalidValue;
        }
        config.interval = std::chrono::seconds(*seconds);
    }

    if (raw.url) {
        config.remoteWriteUrl = *raw.url;
    }
    if (!IsHttpUrl(config.remoteWriteUrl)) {
        outError = "remote write URL must start with http:// or https://, got \"" + config.remoteWriteUrl + "\"";
        return ConfigStatus::InvalidValue;
    }

    if (raw.passwordFile) {
        std::string password;
        if (!ReadPasswordFile(*raw.passwordFile, password)) {
            outError = "unable to read password file " + *raw.passwordFile;
            return ConfigStatus::InvalidValue;
        }
        raw.password = password;
    }

    const bool haveUsername = raw.username && !raw.username->empty();
    const bool havePassword = raw.password && !raw.password->empty();
    if (havePassword && !haveUsername) {
        outError = "a remote write password is configured without a username";
        return ConfigStatus::InvalidValue;
    }
    if (haveUsername) {
        config.credentials = BasicCredentials{*raw.username, havePassword ? *raw.password : std::string()};
    }

    if (raw.hostname) {
        if (!IsValidUtf8(*raw.hostname)) {
            outError = "hostname must be valid UTF-8";
            return ConfigStatus::InvalidValue;
        }
        config.hostname = *raw.hostname;
    }

    if (raw.maxAttempts) {
        const auto attempts = ParsePositiveInt(*raw.maxAttempts);
        if (!attempts) {
            outError = "max attempts must be a positive integer, got \"" + *raw.maxAttempts + "\"";
            return ConfigStatus::InvalidValue;
        }
        config.retry.maxAttempts = *attempts;
    }

    if (raw.timeout) {
        const auto seconds = ParsePositiveInt(*raw.timeout);
        if (!seconds) {
            outError = "timeout must be a positive number of seconds, got \"" + *raw.timeout + "\"";
            return ConfigStatus::InvalidValue;
        }
        config.retry.requestTimeout = std::chrono::seconds(*seconds);
    }

    const std::pair<const std::optional<std::string>*, bool*> flags[] = {
        {&raw.sendMetadata, &config.sendMetadata},
        {&raw.dryRun, &config.dryRun},
        {&raw.otelEnabled, &config.tracing.enabled}
    };
    for (const auto& [value, target] : flags) {
        if (!*value) {
            continue;
        }
        const auto parsed = ParseBool(**value);
        if (!parsed) {
            outError = "expected a boolean (true/false, yes/no, 1/0), got \"" + **value + "\"";
            return ConfigStatus::InvalidValue;
        }
        *target = *parsed;
    }

    if (raw.otelEndpoint) {
        config.tracing.endpoint = *raw.otelEndpoint;
    }
    config.tracing.serviceName = "agemon";

    outConfig = std::move(config);
    return ConfigStatus::Ok;
}

AgentConfigLoader::EnvLookup AgentConfigLoader::ProcessEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::string AgentConfigLoader::Usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Push host metrics to a Prometheus remote write endpoint.\n"
        << "\n"
        << "Options:\n"
        << "  --interval <seconds>       Collection interval (AGEMON_INTERVAL, default 15)\n"
        << "  --remote-write-url <url>   Endpoint (AGEMON_REMOTE_WRITE_URL,\n"
        << "                             default http://localhost:9090/api/v1/write)\n"
        << "  --username <name>          Basic auth user (AGEMON_REMOTE_WRITE_USERNAME)\n"
        << "  --password-file <path>     Basic auth password file\n"
        << "                             (or AGEMON_REMOTE_WRITE_PASSWORD)\n"
        << "  --hostname <name>          Value of the hostname label (AGEMON_HOSTNAME)\n"
        << "  --max-attempts <n>         Send attempts per tick (AGEMON_MAX_ATTEMPTS, default 3)\n"
        << "  --timeout <seconds>        Per-request timeout (AGEMON_TIMEOUT, default 10)\n"
        << "  --no-metadata              Do not send metric metadata (AGEMON_SEND_METADATA)\n"
        << "  --dry-run                  Print series as JSON instead of sending (AGEMON_DRY_RUN)\n"
        << "  -h, --help                 Show this help\n";
    return out.str();
}

std::optional<bool> AgentConfigLoader::ParseBool(const std::string& value) {
    const std::string normalized = ToLower(value);
    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }
    return std::nullopt;
}

std::optional<int> AgentConfigLoader::ParsePositiveInt(const std::string& value) {
    try {
        size_t index = 0;
        const int parsed = std::stoi(value, &index);
        if (index == value.size() && parsed > 0) {
            return parsed;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    return std::nullopt;
}
