/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace answerlens::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c){ return std::tolower(c); });
    return value;
}

bool ParseBool(const std::string& name, const std::string& value) {
    std::string lowered = ToLower(value);
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") return true;
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off" || lowered.empty()) return false;
    throw ConfigError(name + " must be a boolean, got \"" + value + "\"");
}

int ParseInt(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(name + " must be an integer, got \"" + value + "\"");
    }
    if (consumed != value.size()) {
        throw ConfigError(name + " must be an integer, got \"" + value + "\"");
    }
    return parsed;
}

} // namespace

std::optional<std::string> ConfigLoader::GetEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

AppSettings ConfigLoader::Load() {
    EnvLookup env = &ConfigLoader::GetEnv;
    return Load(ResolveSettingsPath(env), env);
}

AppSettings ConfigLoader::Load(const std::optional<fs::path>& settingsPath, const EnvLookup& env) {
    json raw = json::object();
    if (settingsPath) {
        raw = ReadFile(*settingsPath);
    }
    ApplyEnvironment(raw, env);

    AppSettings settings = FromJson(raw);
    Validate(settings);
    return settings;
}

std::optional<fs::path> ConfigLoader::ResolveSettingsPath(const EnvLookup& env) {
    auto explicitPath = env("ANSWERLENS_CONFIG");
    if (explicitPath && !explicitPath->empty()) {
        // An explicitly named file must exist.
        if (!fs::exists(*explicitPath)) {
            throw ConfigError("settings file not found: " + *explicitPath);
        }
        return fs::path(*explicitPath);
    }

    fs::path local = fs::current_path() / "settings.json";
    if (fs::exists(local)) {
        return local;
    }
    fs::path user = PathUtils::GetAppConfigDir() / "settings.json";
    if (fs::exists(user)) {
        return user;
    }
    return std::nullopt;
}

json ConfigLoader::ReadFile(const fs::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("cannot open settings file: " + path.string());
    }

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw ConfigError("invalid JSON in " + path.string() + ": " + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("settings file must hold a JSON object: " + path.string());
    }
    std::cerr << "[ConfigLoader] Loaded settings from " << path.string() << std::endl;
    return j;
}

void ConfigLoader::ApplyEnvironment(json& raw, const EnvLookup& env) {
    auto set = [&raw](const char* section, const char* key, json value) {
        if (section) {
            if (!raw.contains(section) || !raw[section].is_object()) raw[section] = json::object();
            raw[section][key] = std::move(value);
        } else {
            raw[key] = std::move(value);
        }
    };

    if (auto v = env("ANSWERLENS_API")) set("backend", "api", *v);
    if (auto v = env("ANSWERLENS_BASE_URL")) set("backend", "base_url", *v);
    if (auto v = env("OPENAI_API_KEY")) set("backend", "api_key", *v);
    if (auto v = env("ANSWERLENS_MODEL")) set("backend", "model", *v);
    if (auto v = env("ANSWERLENS_DEBUG")) set(nullptr, "debug", ParseBool("ANSWERLENS_DEBUG", *v));
    if (auto v = env("ANSWERLENS_PORT")) set("server", "port", ParseInt("ANSWERLENS_PORT", *v));
}

AppSettings ConfigLoader::FromJson(const json& raw) {
    AppSettings settings;
    try {
        const json backend = raw.value("backend", json::object());
        const json tasks = raw.value("tasks", json::object());
        const json server = raw.value("server", json::object());

        std::string api = ToLower(backend.value("api", std::string("ollama")));
        if (api == "ollama") {
            settings.backend.api = BackendSettings::Api::Ollama;
        } else if (api == "openai") {
            settings.backend.api = BackendSettings::Api::OpenAI;
        } else {
            throw ConfigError("backend.api must be \"ollama\" or \"openai\", got \"" + api + "\"");
        }

        const bool openai = settings.backend.api == BackendSettings::Api::OpenAI;
        settings.backend.baseUrl = backend.value("base_url",
            std::string(openai ? "https://api.openai.com" : "http://localhost:11434"));
        while (!settings.backend.baseUrl.empty() && settings.backend.baseUrl.back() == '/') {
            settings.backend.baseUrl.pop_back();
        }
        settings.backend.apiKey = backend.value("api_key", std::string());
        settings.backend.model = backend.value("model", std::string(openai ? "gpt-4o-mini" : "qwen2.5:7b"));
        settings.backend.readTimeoutSeconds = backend.value("read_timeout_seconds", settings.backend.readTimeoutSeconds);
        settings.temperature = backend.value("temperature", settings.temperature);

        settings.insightMaxTokens = tasks.value("insight_max_tokens", settings.insightMaxTokens);
        settings.traitMaxTokens = tasks.value("trait_max_tokens", settings.traitMaxTokens);

        settings.appName = raw.value("app_name", settings.appName);
        settings.appVersion = raw.value("app_version", settings.appVersion);
        settings.debug = raw.value("debug", settings.debug);
        settings.backend.debug = settings.debug;

        settings.serverHost = server.value("host", settings.serverHost);
        settings.serverPort = server.value("port", settings.serverPort);
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("settings value has the wrong type: ") + e.what());
    }
    return settings;
}

void ConfigLoader::Validate(const AppSettings& settings) {
    if (settings.backend.baseUrl.empty()) {
        throw ConfigError("backend.base_url must not be empty");
    }
    if (settings.backend.model.empty()) {
        throw ConfigError("backend.model must not be empty");
    }
    if (settings.backend.api == BackendSettings::Api::OpenAI && settings.backend.apiKey.empty()) {
        throw ConfigError("OPENAI_API_KEY (or backend.api_key) is required for the openai backend");
    }
    if (settings.backend.readTimeoutSeconds <= 0) {
        throw ConfigError("backend.read_timeout_seconds must be positive");
    }
    if (settings.temperature < 0.0 || settings.temperature > 2.0) {
        throw ConfigError("backend.temperature must be within [0, 2]");
    }
    if (settings.insightMaxTokens <= 0 || settings.traitMaxTokens <= 0) {
        throw ConfigError("tasks.*_max_tokens must be positive");
    }
    if (settings.serverPort < 1 || settings.serverPort > 65535) {
        throw ConfigError("server.port must be within 1..65535");
    }
}

} // namespace answerlens::infrastructure
