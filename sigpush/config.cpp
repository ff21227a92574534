#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <fstream>
#include <utility>

namespace {

// Runtime overrides, highest precedence.
const std::pair<const char*, const char*> kEnvironmentOverrides[] = {
    {"SIGPUSH_SERVER_URL", kServerUrlKey},
    {"SIGPUSH_SERVER_USERNAME", kServerUsernameKey},
    {"SIGPUSH_SERVER_PASSWORD", kServerPasswordKey},
};

} // namespace

void StepConfig::Set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> StepConfig::Get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> StepConfig::MissingKeys(const std::vector<std::string>& required) const {
    std::vector<std::string> missing;
    for (const auto& key : required) {
        if (!Get(key)) {
            missing.push_back(key);
        }
    }
    return missing;
}

Config& Config::Instance() {
    static Config instance;
    return instance;
}

Config::ServerConfig Config::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("top level must be a JSON object");
    }

    ServerConfig config;
    try {
        if (j.contains("log_level")) config.log_level = j.at("log_level").get<std::string>();
        if (j.contains("verbose")) config.verbose = j.at("verbose").get<bool>();

        if (j.contains("step-config")) {
            const auto& step = j.at("step-config");
            if (!step.is_object()) {
                throw ConfigError("'step-config' must be a JSON object");
            }
            for (const auto& item : step.items()) {
                if (!item.value().is_string()) {
                    throw ConfigError("value of '" + item.key() + "' must be a string");
                }
                config.step_config.Set(item.key(), item.value().get<std::string>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(e.what());
    }
    return config;
}

void Config::Load(const std::string& path) {
    config_ = ServerConfig{};

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::Warn("Config file not found at " + path + ". Using defaults.", "Config");
    } else {
        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError("failed to parse " + path + ": " + e.what());
        }
        config_ = FromJson(j);
        Logger::Info("Configuration loaded from " + path, "Config");
    }

    ApplyEnvironment();
}

void Config::ApplyEnvironment() {
    for (const auto& override_entry : kEnvironmentOverrides) {
        const char* value = std::getenv(override_entry.first);
        if (value && *value) {
            config_.step_config.Set(override_entry.second, value);
            Logger::Debug(std::string("Using ") + override_entry.second + " from " + override_entry.first, "Config");
        }
    }
}

const Config::ServerConfig& Config::Get() const {
    return config_;
}
