#include "providers/http_llm_provider.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <string>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace codebox::providers {
namespace {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        parsed.port = std::stoi(host_port.substr(colon_pos + 1));
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

LLMResponse ErrorResponse(const std::string& text) {
    return LLMResponse{.content = "Error calling LLM: " + text, .finish_reason = "error"};
}

nlohmann::json BuildAnthropicPayload(const std::vector<Message>& messages,
                                     const std::string& model,
                                     int max_tokens,
                                     double temperature) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["max_tokens"] = max_tokens;
    payload["temperature"] = temperature;
    payload["messages"] = nlohmann::json::array();

    std::string system_prompt;
    for (const auto& msg : messages) {
        if (msg.role == "system") {
            if (!system_prompt.empty()) {
                system_prompt.append("\n");
            }
            system_prompt.append(msg.content);
            continue;
        }
        payload["messages"].push_back({
            {"role", msg.role},
            {"content", nlohmann::json::array({{{"type", "text"}, {"text", msg.content}}})}
        });
    }
    if (!system_prompt.empty()) {
        payload["system"] = system_prompt;
    }
    return payload;
}

nlohmann::json BuildOpenAiPayload(const std::vector<Message>& messages,
                                  const std::string& model,
                                  int max_tokens,
                                  double temperature) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["max_tokens"] = max_tokens;
    payload["temperature"] = temperature;
    payload["messages"] = nlohmann::json::array();
    for (const auto& msg : messages) {
        payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
    }
    return payload;
}

void ReadUsage(const nlohmann::json& usage,
               const char* prompt_key,
               const char* completion_key,
               LLMResponse& response) {
    if (!usage.is_object()) {
        return;
    }
    if (usage.contains(prompt_key) && usage[prompt_key].is_number_integer()) {
        response.usage["prompt_tokens"] = usage[prompt_key].get<int>();
    }
    if (usage.contains(completion_key) && usage[completion_key].is_number_integer()) {
        response.usage["completion_tokens"] = usage[completion_key].get<int>();
    }
    if (response.usage.count("prompt_tokens") && response.usage.count("completion_tokens")) {
        response.usage["total_tokens"] =
            response.usage["prompt_tokens"] + response.usage["completion_tokens"];
    }
}

}  // namespace

HttpLLMProvider::HttpLLMProvider(ProviderSettings settings)
    : settings_(std::move(settings)) {
    is_openrouter_ = (settings_.api_key.rfind("sk-or-", 0) == 0) ||
        (settings_.api_base.find("openrouter") != std::string::npos);
}

bool HttpLLMProvider::UsesAnthropicMessages(const std::string& model, const std::string& api_base) {
    if (api_base.find("openrouter") != std::string::npos) {
        return false;
    }
    const auto combined = ToLower(model + " " + api_base);
    return combined.find("anthropic") != std::string::npos ||
        combined.find("claude") != std::string::npos;
}

std::string HttpLLMProvider::NormalizeModel(const std::string& model, bool is_openrouter) {
    if (is_openrouter) {
        return model;
    }
    const auto slash = model.find('/');
    if (slash != std::string::npos) {
        const auto vendor = ToLower(model.substr(0, slash));
        if (vendor == "anthropic" || vendor == "openai") {
            return model.substr(slash + 1);
        }
    }
    return model;
}

LLMResponse HttpLLMProvider::Chat(
    const std::vector<Message>& messages,
    const std::string& model,
    int max_tokens,
    double temperature) {
    try {
        const auto requested = model.empty() ? settings_.model : model;
        const bool use_anthropic = !is_openrouter_ && UsesAnthropicMessages(requested, settings_.api_base);
        const auto chosen_model = NormalizeModel(requested, is_openrouter_);

        const auto payload = use_anthropic
            ? BuildAnthropicPayload(messages, chosen_model, max_tokens, temperature)
            : BuildOpenAiPayload(messages, chosen_model, max_tokens, temperature);

        std::string base_url = settings_.api_base;
        if (base_url.empty()) {
            base_url = use_anthropic ? "https://api.anthropic.com/v1" : "https://api.openai.com/v1";
        }

        const auto parsed = ParseUrl(base_url);
        const std::string endpoint = parsed.base_path + (use_anthropic ? "/messages" : "/chat/completions");

        std::string scheme_host_port = parsed.https ? "https://" : "http://";
        scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);
        auto client = std::make_unique<httplib::Client>(scheme_host_port);
        client->set_connection_timeout(settings_.timeout_s);
        client->set_read_timeout(settings_.timeout_s);

        if (settings_.use_proxy_for_llm) {
            const char* kProxyVars[] = {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"};
            std::string proxy_host;
            int proxy_port = 0;
            bool proxied = false;
            for (const auto* key : kProxyVars) {
                if (ParseProxyHostPort(GetEnv(key), proxy_host, proxy_port)) {
                    client->set_proxy(proxy_host, proxy_port);
                    proxied = true;
                    break;
                }
            }
            if (!proxied && (!GetEnv("ALL_PROXY").empty() || !GetEnv("all_proxy").empty())) {
                utils::Log(utils::LogLevel::kWarn, "llm",
                           "ALL_PROXY is set but cpp-httplib only supports HTTP proxy");
            }
        }

        utils::Log(utils::LogLevel::kInfo, "llm", "POST " + scheme_host_port + endpoint,
                   {{"model", chosen_model},
                    {"api_key", MaskKey(settings_.api_key)},
                    {"style", use_anthropic ? "anthropic" : "openai"}});

        httplib::Headers headers;
        if (!settings_.api_key.empty()) {
            if (use_anthropic) {
                headers.emplace("x-api-key", settings_.api_key);
                headers.emplace("anthropic-version", "2023-06-01");
            } else {
                headers.emplace("Authorization", "Bearer " + settings_.api_key);
            }
        }

        auto response = client->Post(endpoint.c_str(), headers, payload.dump(), "application/json");
        if (!response) {
            const auto err = response.error();
            const auto err_text = httplib::to_string(err);
            utils::Log(utils::LogLevel::kError, "llm", "request failed",
                       {{"httplib_error", std::to_string(static_cast<int>(err))}, {"detail", err_text}});
            return ErrorResponse("request failed (" + err_text + ")");
        }
        if (response->status >= 400) {
            utils::Log(utils::LogLevel::kError, "llm", "HTTP " + std::to_string(response->status),
                       {{"body", response->body.substr(0, 500)}});
            return ErrorResponse("HTTP " + std::to_string(response->status));
        }

        const auto json = nlohmann::json::parse(response->body, nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            return ErrorResponse("invalid response");
        }

        LLMResponse parsed_response{};
        if (use_anthropic) {
            if (json.contains("content") && json["content"].is_array()) {
                for (const auto& block : json["content"]) {
                    if (block.value("type", "") == "text") {
                        parsed_response.content += block.value("text", "");
                    }
                }
            }
            if (json.contains("stop_reason") && json["stop_reason"].is_string()) {
                parsed_response.finish_reason = json["stop_reason"].get<std::string>();
            }
            if (json.contains("usage")) {
                ReadUsage(json["usage"], "input_tokens", "output_tokens", parsed_response);
            }
            return parsed_response;
        }

        if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
            return ErrorResponse("invalid response");
        }
        const auto& choice = json["choices"][0];
        if (choice.contains("message") && choice["message"].contains("content") &&
            choice["message"]["content"].is_string()) {
            parsed_response.content = choice["message"]["content"].get<std::string>();
        }
        if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
            parsed_response.finish_reason = choice["finish_reason"].get<std::string>();
        }
        if (json.contains("usage")) {
            ReadUsage(json["usage"], "prompt_tokens", "completion_tokens", parsed_response);
        }
        return parsed_response;
    } catch (const std::exception& ex) {
        return ErrorResponse(ex.what());
    }
}

}  // namespace codebox::providers
