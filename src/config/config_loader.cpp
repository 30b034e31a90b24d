#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace codebox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyProviderConfig(ProviderConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("apiKey") && source["apiKey"].is_string()) {
        target.api_key = source["apiKey"].get<std::string>();
    }
    if (source.contains("apiBase") && source["apiBase"].is_string()) {
        target.api_base = source["apiBase"].get<std::string>();
    }
}

std::vector<std::string> ReadStringList(const nlohmann::json& source, const std::string& key) {
    if (!source[key].is_array()) {
        throw ConfigError("sandbox." + key + " must be an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : source[key]) {
        if (!item.is_string()) {
            throw ConfigError("sandbox." + key + " must be an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

void ApplySandboxConfig(SandboxConfig& sandbox, const nlohmann::json& source) {
    if (!source.is_object()) {
        throw ConfigError("sandbox must be an object");
    }
    if (source.contains("maxExecutionSeconds")) {
        if (!source["maxExecutionSeconds"].is_number()) {
            throw ConfigError("sandbox.maxExecutionSeconds must be a number");
        }
        sandbox.max_execution_seconds = source["maxExecutionSeconds"].get<double>();
    }
    if (source.contains("maxOutputChars")) {
        if (!source["maxOutputChars"].is_number_integer()) {
            throw ConfigError("sandbox.maxOutputChars must be an integer");
        }
        sandbox.max_output_chars = source["maxOutputChars"].get<int>();
    }
    if (source.contains("allowedImports")) {
        sandbox.allowed_imports = ReadStringList(source, "allowedImports");
    }
    if (source.contains("blockedNames")) {
        sandbox.blocked_names = ReadStringList(source, "blockedNames");
    }
    if (source.contains("pythonExecutable")) {
        if (!source["pythonExecutable"].is_string()) {
            throw ConfigError("sandbox.pythonExecutable must be a string");
        }
        sandbox.python_executable = source["pythonExecutable"].get<std::string>();
    }
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

double ParseStrictDouble(const char* name, const std::string& value) {
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " is not a number: " + value);
    }
    if (consumed != value.size()) {
        throw ConfigError(std::string(name) + " is not a number: " + value);
    }
    return parsed;
}

int ParseStrictInt(const char* name, const std::string& value) {
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " is not an integer: " + value);
    }
    if (consumed != value.size()) {
        throw ConfigError(std::string(name) + " is not an integer: " + value);
    }
    return parsed;
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        const auto start = item.find_first_not_of(" \t");
        if (start == std::string::npos) {
            continue;
        }
        const auto end = item.find_last_not_of(" \t");
        items.push_back(item.substr(start, end - start + 1));
    }
    return items;
}

void ValidateSandbox(const SandboxConfig& sandbox) {
    if (!(sandbox.max_execution_seconds > 0.0)) {
        throw ConfigError("sandbox.maxExecutionSeconds must be positive");
    }
    if (sandbox.max_output_chars <= 0) {
        throw ConfigError("sandbox.maxOutputChars must be positive");
    }
    if (sandbox.python_executable.empty()) {
        throw ConfigError("sandbox.pythonExecutable must not be empty");
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("CODEBOX_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return GetHomePath() / ".codebox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ConfigError("config root must be an object");
    }

    if (data.contains("sandbox")) {
        ApplySandboxConfig(config.sandbox, data["sandbox"]);
    }

    if (data.contains("generator") && data["generator"].is_object()) {
        const auto& generator = data["generator"];
        if (generator.contains("model") && generator["model"].is_string()) {
            config.generator.model = generator["model"].get<std::string>();
        }
        if (generator.contains("maxTokens") && generator["maxTokens"].is_number_integer()) {
            config.generator.max_tokens = generator["maxTokens"].get<int>();
        }
        if (generator.contains("temperature") && generator["temperature"].is_number()) {
            config.generator.temperature = generator["temperature"].get<double>();
        }
        if (generator.contains("timeoutS") && generator["timeoutS"].is_number_integer()) {
            config.generator.timeout_s = generator["timeoutS"].get<int>();
        }
    }

    if (data.contains("providers") && data["providers"].is_object()) {
        const auto& providers = data["providers"];
        if (providers.contains("useProxyForLLM") && providers["useProxyForLLM"].is_boolean()) {
            config.providers.use_proxy_for_llm = providers["useProxyForLLM"].get<bool>();
        }
        if (providers.contains("anthropic")) {
            ApplyProviderConfig(config.providers.anthropic, providers["anthropic"]);
        }
        if (providers.contains("openai")) {
            ApplyProviderConfig(config.providers.openai, providers["openai"]);
        }
        if (providers.contains("openrouter")) {
            ApplyProviderConfig(config.providers.openrouter, providers["openrouter"]);
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            utils::LogLevel level{};
            if (utils::ParseLogLevel(logging["level"].get<std::string>(), level)) {
                config.logging.min_level = level;
            }
        }
    }
}

void ApplyEnvironment(Config& config) {
    const auto max_seconds = GetEnv("CODEBOX_SANDBOX__MAX_EXECUTION_SECONDS");
    if (!max_seconds.empty()) {
        config.sandbox.max_execution_seconds =
            ParseStrictDouble("CODEBOX_SANDBOX__MAX_EXECUTION_SECONDS", max_seconds);
    }

    const auto max_output = GetEnv("CODEBOX_SANDBOX__MAX_OUTPUT_CHARS");
    if (!max_output.empty()) {
        config.sandbox.max_output_chars =
            ParseStrictInt("CODEBOX_SANDBOX__MAX_OUTPUT_CHARS", max_output);
    }

    const auto allowed_imports = GetEnv("CODEBOX_SANDBOX__ALLOWED_IMPORTS");
    if (!allowed_imports.empty()) {
        config.sandbox.allowed_imports = SplitCsv(allowed_imports);
    }

    const auto blocked_names = GetEnv("CODEBOX_SANDBOX__BLOCKED_NAMES");
    if (!blocked_names.empty()) {
        config.sandbox.blocked_names = SplitCsv(blocked_names);
    }

    const auto python = GetEnv("CODEBOX_SANDBOX__PYTHON");
    if (!python.empty()) {
        config.sandbox.python_executable = python;
    }

    const auto model = GetEnv("CODEBOX_GENERATOR__MODEL");
    if (!model.empty()) {
        config.generator.model = model;
    }

    const auto max_tokens = GetEnv("CODEBOX_GENERATOR__MAX_TOKENS");
    if (!max_tokens.empty()) {
        config.generator.max_tokens = ParseInt(max_tokens, config.generator.max_tokens);
    }

    const auto temperature = GetEnv("CODEBOX_GENERATOR__TEMPERATURE");
    if (!temperature.empty()) {
        config.generator.temperature = ParseDouble(temperature, config.generator.temperature);
    }

    const auto openai_key = GetEnvFallback("CODEBOX_PROVIDERS__OPENAI__API_KEY", "OPENAI_API_KEY");
    if (!openai_key.empty()) {
        config.providers.openai.api_key = openai_key;
    }

    const auto openai_base = GetEnv("CODEBOX_PROVIDERS__OPENAI__API_BASE");
    if (!openai_base.empty()) {
        config.providers.openai.api_base = openai_base;
    }

    const auto anthropic_key = GetEnv("CODEBOX_PROVIDERS__ANTHROPIC__API_KEY");
    if (!anthropic_key.empty()) {
        config.providers.anthropic.api_key = anthropic_key;
    }

    const auto anthropic_base = GetEnv("CODEBOX_PROVIDERS__ANTHROPIC__API_BASE");
    if (!anthropic_base.empty()) {
        config.providers.anthropic.api_base = anthropic_base;
    }

    const auto openrouter_key = GetEnv("CODEBOX_PROVIDERS__OPENROUTER__API_KEY");
    if (!openrouter_key.empty()) {
        config.providers.openrouter.api_key = openrouter_key;
    }

    const auto openrouter_base = GetEnv("CODEBOX_PROVIDERS__OPENROUTER__API_BASE");
    if (!openrouter_base.empty()) {
        config.providers.openrouter.api_base = openrouter_base;
    }

    const auto use_proxy_for_llm = GetEnv("CODEBOX_PROVIDERS__USE_PROXY_FOR_LLM");
    if (!use_proxy_for_llm.empty()) {
        config.providers.use_proxy_for_llm = ParseBool(use_proxy_for_llm);
    }

    const auto log_level = GetEnv("CODEBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        utils::LogLevel level{};
        if (utils::ParseLogLevel(log_level, level)) {
            config.logging.min_level = level;
        }
    }
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        std::ifstream input(path);
        if (!input.is_open()) {
            throw ConfigError("cannot open config file " + path.string());
        }
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            throw ConfigError("malformed JSON in " + path.string());
        }
        ApplyConfigFromJson(config, data);
    }

    ApplyEnvironment(config);
    ValidateSandbox(config.sandbox);
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace codebox::config
