/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json + environment).
 *
 * Provides a unified way to access backend, task and server settings
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "infrastructure/ChatCompletionClient.hpp"

namespace answerlens::infrastructure {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct AppSettings
 * @brief Fully resolved configuration.
 */
struct AppSettings {
    BackendSettings backend;
    double temperature = 0.7;
    int insightMaxTokens = 300;
    int traitMaxTokens = 400;
    std::string appName = "AnswerLens Onboarding Analysis";
    std::string appVersion = "1.0.0";
    bool debug = false;
    std::string serverHost = "0.0.0.0";
    int serverPort = 8000;
};

class ConfigLoader {
public:
    /** @brief Looks up an environment variable; empty optional when unset. */
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Resolves, reads, overrides and validates the settings.
     * @throws ConfigError on a malformed file or invalid values.
     */
    static AppSettings Load();

    /**
     * @brief Same as Load() with an explicit file (may be nullopt) and environment.
     */
    static AppSettings Load(const std::optional<std::filesystem::path>& settingsPath, const EnvLookup& env);

    /**
     * @brief Picks the settings file: $ANSWERLENS_CONFIG, ./settings.json,
     * then $XDG_CONFIG_HOME/answerlens/settings.json.
     * @return The first existing candidate, or nullopt.
     */
    static std::optional<std::filesystem::path> ResolveSettingsPath(const EnvLookup& env);

    /** @brief Reads the process environment. */
    static std::optional<std::string> GetEnv(const std::string& name);

private:
    static nlohmann::json ReadFile(const std::filesystem::path& path);
    static void ApplyEnvironment(nlohmann::json& raw, const EnvLookup& env);
    static AppSettings FromJson(const nlohmann::json& raw);
    static void Validate(const AppSettings& settings);
};

} // namespace answerlens::infrastructure
