#include "providers/litellm_provider.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <string>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace sandforge::providers {
namespace {

using utils::LogLevel;

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
    const auto port_text = working.substr(colon_pos + 1);
    if (port_text.empty() ||
        !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    port = std::stoi(port_text);
    return !host.empty() && port > 0;
}

std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

void ConfigureProxy(httplib::Client& client) {
    const char* candidates[] = {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"};
    for (const auto* name : candidates) {
        std::string proxy_host;
        int proxy_port = 0;
        if (ParseProxyHostPort(GetEnv(name), proxy_host, proxy_port)) {
            client.set_proxy(proxy_host, proxy_port);
            return;
        }
    }
    if (!GetEnv("ALL_PROXY").empty() || !GetEnv("all_proxy").empty()) {
        utils::Log(LogLevel::kWarn, "llm", "ALL_PROXY is set but cpp-httplib only supports HTTP proxy");
    }
}

nlohmann::json BuildAnthropicPayload(const std::vector<Message>& messages,
                                     const std::string& model,
                                     int max_tokens,
                                     double temperature) {
    nlohmann::json payload;
    std::string system_prompt;
    payload["model"] = model;
    payload["max_tokens"] = max_tokens;
    payload["temperature"] = temperature;
    payload["messages"] = nlohmann::json::array();

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
    payload["messages"] = nlohmann::json::array();
    payload["max_tokens"] = max_tokens;
    payload["temperature"] = temperature;
    for (const auto& msg : messages) {
        payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
    }
    return payload;
}

LLMResponse ErrorResponse(const std::string& reason) {
    return LLMResponse{.content = "Error calling LLM: " + reason, .finish_reason = "error"};
}

LLMResponse ParseAnthropicResponse(const nlohmann::json& json) {
    LLMResponse parsed{};
    if (json.contains("content") && json["content"].is_array()) {
        for (const auto& block : json["content"]) {
            if (block.value("type", "") == "text") {
                parsed.content += block.value("text", "");
            }
        }
    }
    if (json.contains("stop_reason") && json["stop_reason"].is_string()) {
        parsed.finish_reason = json["stop_reason"].get<std::string>();
    }
    if (json.contains("usage") && json["usage"].is_object()) {
        const auto& usage = json["usage"];
        const int input = usage.value("input_tokens", 0);
        const int output = usage.value("output_tokens", 0);
        parsed.usage["prompt_tokens"] = input;
        parsed.usage["completion_tokens"] = output;
        parsed.usage["total_tokens"] = input + output;
    }
    return parsed;
}

LLMResponse ParseOpenAiResponse(const nlohmann::json& json) {
    if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty()) {
        return ErrorResponse("invalid response");
    }

    LLMResponse parsed{};
    const auto& choice = json["choices"][0];
    if (choice.contains("message") && choice["message"].is_object()) {
        const auto& message = choice["message"];
        if (message.contains("content") && message["content"].is_string()) {
            parsed.content = message["content"].get<std::string>();
        }
    }
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        parsed.finish_reason = choice["finish_reason"].get<std::string>();
    }
    if (json.contains("usage") && json["usage"].is_object()) {
        const auto& usage = json["usage"];
        for (const char* key : {"prompt_tokens", "completion_tokens", "total_tokens"}) {
            if (usage.contains(key) && usage[key].is_number_integer()) {
                parsed.usage[key] = usage[key].get<int>();
            }
        }
    }
    return parsed;
}

}  // namespace

bool ShouldUseAnthropicMessages(const std::string& model, const std::string& api_base) {
    const auto combined = ToLower(model + " " + api_base);
    return combined.find("anthropic") != std::string::npos ||
        combined.find("claude") != std::string::npos;
}

std::string StripProviderPrefix(const std::string& model) {
    const auto slash = model.find('/');
    if (slash == std::string::npos) {
        return model;
    }
    const auto prefix = ToLower(model.substr(0, slash));
    if (prefix == "anthropic" || prefix == "openai") {
        return model.substr(slash + 1);
    }
    return model;
}

LiteLLMProvider::LiteLLMProvider(ProviderSettings settings)
    : settings_(std::move(settings)) {
    is_openrouter_ = (!settings_.api_key.empty() && settings_.api_key.rfind("sk-or-", 0) == 0) ||
        (settings_.api_base.find("openrouter") != std::string::npos);
}

LLMResponse LiteLLMProvider::Chat(
    const std::vector<Message>& messages,
    const std::string& model,
    int max_tokens,
    double temperature) {
    const auto requested = model.empty() ? settings_.model : model;
    const bool use_anthropic = !is_openrouter_ && ShouldUseAnthropicMessages(requested, settings_.api_base);
    const auto chosen_model = is_openrouter_ ? requested : StripProviderPrefix(requested);

    const auto payload = use_anthropic
        ? BuildAnthropicPayload(messages, chosen_model, max_tokens, temperature)
        : BuildOpenAiPayload(messages, chosen_model, max_tokens, temperature);

    std::string base_url = settings_.api_base;
    if (base_url.empty()) {
        if (use_anthropic) {
            base_url = "https://api.anthropic.com/v1";
        } else {
            base_url = is_openrouter_ ? "https://openrouter.ai/api/v1" : "https://api.openai.com/v1";
        }
    }

    const auto parsed = ParseUrl(base_url);
    const std::string endpoint = parsed.base_path + (use_anthropic ? "/messages" : "/chat/completions");

    std::string scheme_host_port = parsed.https ? "https://" : "http://";
    scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);
    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    client->set_connection_timeout(settings_.timeout_s);
    client->set_read_timeout(settings_.timeout_s);

    if (settings_.use_proxy_for_llm) {
        ConfigureProxy(*client);
    }

    utils::Log(LogLevel::kDebug, "llm", "POST " + scheme_host_port + endpoint, {
        {"model", chosen_model},
        {"api_key", MaskKey(settings_.api_key)},
        {"style", use_anthropic ? "anthropic" : "openai"}});

    httplib::Headers headers{};
    if (!settings_.api_key.empty()) {
        if (use_anthropic) {
            headers.emplace("x-api-key", settings_.api_key);
            headers.emplace("anthropic-version", "2023-06-01");
        } else {
            headers.emplace("Authorization", "Bearer " + settings_.api_key);
        }
    }

    auto response = client->Post(endpoint, headers, payload.dump(), "application/json");
    if (!response) {
        const auto err = response.error();
        const auto err_text = httplib::to_string(err);
        utils::Log(LogLevel::kError, "llm", "request failed", {
            {"httplib_error", std::to_string(static_cast<int>(err))},
            {"detail", err_text}});
        return ErrorResponse("request failed (" + err_text + ")");
    }
    if (response->status >= 400) {
        utils::Log(LogLevel::kError, "llm", "HTTP " + std::to_string(response->status), {
            {"body", response->body.substr(0, 512)}});
        return ErrorResponse("HTTP " + std::to_string(response->status));
    }

    const auto json = nlohmann::json::parse(response->body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return ErrorResponse("invalid response");
    }
    return use_anthropic ? ParseAnthropicResponse(json) : ParseOpenAiResponse(json);
}

}  // namespace sandforge::providers
