#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Step configuration keys read by the push step.
constexpr const char* kServerUrlKey = "container-image-signature-server-url";
constexpr const char* kServerUsernameKey = "container-image-signature-server-username";
constexpr const char* kServerPasswordKey = "container-image-signature-server-password";

class StepConfig {
public:
    void Set(const std::string& key, const std::string& value);

    // Empty values are treated as absent.
    std::optional<std::string> Get(const std::string& key) const;

    // Keys from `required` that are absent, in the order given.
    std::vector<std::string> MissingKeys(const std::vector<std::string>& required) const;

private:
    std::map<std::string, std::string> values_;
};

class Config {
public:
    struct ServerConfig {
        std::string log_level = "INFO";
        bool verbose = false; // Trace the HTTP exchange at DEBUG level
        StepConfig step_config;
    };

    static Config& Instance();

    // Replaces the current configuration with the contents of `path`, then
    // applies environment overrides. A missing file keeps the defaults.
    // Throws ConfigError on malformed content.
    void Load(const std::string& path);
    const ServerConfig& Get() const;

    // Parses an already decoded document. Throws ConfigError.
    static ServerConfig FromJson(const nlohmann::json& j);

private:
    Config() = default;
    ServerConfig config_;

    void ApplyEnvironment();
};

#endif // CONFIG_HPP
