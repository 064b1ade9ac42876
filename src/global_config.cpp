#include "global_config.h"
#include "errors.h"
#include "logger.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace pem {

namespace {

constexpr double kMaxCombineToleranceSeconds = 86400.0;

std::optional<std::string> systemLookup(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

int parseInt(const std::string& name, const std::string& text, int minimum) {
    size_t consumed = 0;
    long value = 0;
    try {
        value = std::stol(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(name + " must be an integer, got '" + text + "'");
    }
    if (consumed != text.size()) {
        throw ConfigError(name + " must be an integer, got '" + text + "'");
    }
    if (value < minimum || value > 1000000000L) {
        throw ConfigError(name + " must be at least " + std::to_string(minimum) + ", got " + text);
    }
    return static_cast<int>(value);
}

double parseDouble(const std::string& name, const std::string& text, double maximum) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(name + " must be a number, got '" + text + "'");
    }
    if (consumed != text.size() || !std::isfinite(value) || value < 0) {
        throw ConfigError(name + " must be a non-negative number, got '" + text + "'");
    }
    if (value > maximum) {
        throw ConfigError(name + " must not exceed " + std::to_string(maximum) + ", got " + text);
    }
    return value;
}

bool parseBool(const std::string& name, const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }
    throw ConfigError(name + " must be a boolean, got '" + text + "'");
}

} // namespace

Settings Settings::fromEnvironment(const EnvLookup& lookup) {
    EnvLookup get = lookup ? lookup : EnvLookup(systemLookup);
    Settings settings;

    if (auto v = get("TZ")) settings.timezone = *v;
    if (auto v = get("UPEM_DEFAULT_PAST_MINUTES")) settings.defaultPastMinutes = parseDouble("UPEM_DEFAULT_PAST_MINUTES", *v, utils::kMaxWindowMinutes);
    if (auto v = get("UPEM_DEFAULT_FUTURE_MINUTES")) settings.defaultFutureMinutes = parseDouble("UPEM_DEFAULT_FUTURE_MINUTES", *v, utils::kMaxWindowMinutes);

    if (auto v = get("UPEM_UNIFI_PROTECT_ADDRESS")) settings.protectAddress = *v;
    if (auto v = get("UPEM_UNIFI_PROTECT_USERNAME")) settings.protectUsername = *v;
    if (auto v = get("UPEM_UNIFI_PROTECT_PASSWORD")) settings.protectPassword = *v;

    if (auto v = get("UPEM_LOG_INTERVAL")) settings.logIntervalSeconds = parseInt("UPEM_LOG_INTERVAL", *v, 1);
    if (auto v = get("UPEM_MAX_RETRIES")) settings.maxRetries = parseInt("UPEM_MAX_RETRIES", *v, 1);
    if (auto v = get("UPEM_RETRY_DELAY")) settings.retryDelaySeconds = parseInt("UPEM_RETRY_DELAY", *v, 0);
    if (auto v = get("UPEM_EXPORT_TIMEOUT")) settings.exportTimeoutSeconds = parseInt("UPEM_EXPORT_TIMEOUT", *v, 1);
    if (auto v = get("UPEM_EXPORT_WORKERS")) settings.exportWorkers = parseInt("UPEM_EXPORT_WORKERS", *v, 1);

    if (auto v = get("UPEM_KEEP_SPLIT_FILES")) settings.keepSplitFiles = parseBool("UPEM_KEEP_SPLIT_FILES", *v);
    if (auto v = get("UPEM_COMBINE_TOLERANCE")) settings.combineToleranceSeconds = parseDouble("UPEM_COMBINE_TOLERANCE", *v, kMaxCombineToleranceSeconds);
    if (auto v = get("UPEM_COMBINE_METHOD")) {
        if (*v != "ffmpeg" && *v != "binary" && *v != "none") {
            throw ConfigError("UPEM_COMBINE_METHOD must be ffmpeg, binary or none, got '" + *v + "'");
        }
        settings.combineMethod = *v;
    }

    if (auto v = get("UPEM_DOWNLOADS_DIR")) settings.downloadsDir = *v;
    if (auto v = get("UPEM_EXPORTER_COMMAND")) settings.exporterCommand = *v;
    if (auto v = get("UPEM_FFMPEG_COMMAND")) settings.ffmpegCommand = *v;

    return settings;
}

std::vector<std::string> Settings::missingCredentials() const {
    std::vector<std::string> missing;
    if (protectAddress.empty()) missing.push_back("UPEM_UNIFI_PROTECT_ADDRESS");
    if (protectUsername.empty()) missing.push_back("UPEM_UNIFI_PROTECT_USERNAME");
    if (protectPassword.empty()) missing.push_back("UPEM_UNIFI_PROTECT_PASSWORD");
    return missing;
}

GlobalConfig& GlobalConfig::getInstance() {
    static GlobalConfig instance;
    return instance;
}

bool GlobalConfig::initialize(int port, int httpThreads, const std::string& staticDir) {
    Settings settings;
    try {
        settings = Settings::fromEnvironment();
    } catch (const ConfigError& e) {
        LOG_ERROR("GlobalConfig", std::string("Invalid configuration: ") + e.what());
        return false;
    }

    settings.port = port;
    settings.httpThreads = httpThreads;
    settings.staticDir = staticDir;

    LOG_INFO("GlobalConfig", "UPEM_UNIFI_PROTECT_ADDRESS: " + settings.protectAddress);
    LOG_INFO("GlobalConfig", "UPEM_UNIFI_PROTECT_USERNAME: " + settings.protectUsername);
    LOG_INFO("GlobalConfig", std::string("UPEM_UNIFI_PROTECT_PASSWORD: ") +
             (settings.protectPassword.empty() ? "Not Set" : "***"));
    LOG_INFO("GlobalConfig", "Timezone: " + settings.timezone);
    LOG_INFO("GlobalConfig", "Default window: " + std::to_string(settings.defaultPastMinutes) + " min past, " +
             std::to_string(settings.defaultFutureMinutes) + " min future");
    LOG_INFO("GlobalConfig", "Export: " + std::to_string(settings.maxRetries) + " attempt(s), " +
             std::to_string(settings.retryDelaySeconds) + "s delay, " +
             std::to_string(settings.exportTimeoutSeconds) + "s timeout, " +
             std::to_string(settings.exportWorkers) + " worker(s)");
    LOG_INFO("GlobalConfig", "Combine: method " + settings.combineMethod + ", tolerance " +
             std::to_string(settings.combineToleranceSeconds) + "s, keep split files " +
             (settings.keepSplitFiles ? "true" : "false"));
    LOG_INFO("GlobalConfig", "Downloads folder: " + settings.downloadsDir);

    auto missing = settings.missingCredentials();
    if (!missing.empty()) {
        std::string joined;
        for (const auto& name : missing) {
            joined += (joined.empty() ? "" : ", ") + name;
        }
        LOG_ERROR("GlobalConfig", "Missing environment variables: " + joined);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = settings;
    }

    LOG_INFO("GlobalConfig", "All required environment variables are set. Proceeding with startup...");
    return true;
}

Settings GlobalConfig::getSettings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

void GlobalConfig::setSettings(const Settings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
}

} // namespace pem
