/**
 * OllamaClient.cpp - HTTP client for the local Ollama inference server
 * 
 * Uses cpp-httplib for the requests and nlohmann/json for the payloads.
 * Generation is non-streaming: the whole completion arrives in one reply.
 */

#include "shlama/OllamaClient.hpp"
#include "shlama/ResponseCleaner.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace shlama {

static const std::string GENERATE_PATH = "/api/generate";
static const std::string TAGS_PATH = "/api/tags";
static const std::string FALLBACK_COMMAND = "echo \"Request unclear or potentially unsafe\"";

static const int GENERATE_CONNECT_TIMEOUT_SEC = 10;
static const int GENERATE_READ_TIMEOUT_SEC = 120;
static const int PROBE_TIMEOUT_SEC = 3;

struct OllamaClient::Impl {
    std::string server_url;
    std::string model;
    std::string system_prompt;
    std::unique_ptr<httplib::Client> client;
    
    Impl(const std::string& url, const std::string& model_name)
        : server_url(url),
          model(model_name),
          system_prompt(buildSystemPrompt(detectShellName())) {
        client = std::make_unique<httplib::Client>(server_url);
        client->set_write_timeout(GENERATE_CONNECT_TIMEOUT_SEC);
    }
    
    void useProbeTimeouts() {
        client->set_connection_timeout(PROBE_TIMEOUT_SEC);
        client->set_read_timeout(PROBE_TIMEOUT_SEC);
    }
    
    void useGenerateTimeouts() {
        client->set_connection_timeout(GENERATE_CONNECT_TIMEOUT_SEC);
        client->set_read_timeout(GENERATE_READ_TIMEOUT_SEC);
    }
    
    std::string describeHttpError(const httplib::Response& res) {
        std::string error = "Server error: HTTP " + std::to_string(res.status);
        try {
            json error_json = json::parse(res.body);
            if (error_json.contains("error") && error_json["error"].is_string()) {
                error += " - " + error_json["error"].get<std::string>();
            }
        } catch (const json::exception&) {
            // Body is not JSON; the status code says enough
        }
        return error;
    }
};

OllamaClient::OllamaClient(const std::string& server_url, const std::string& model)
    : impl_(std::make_unique<Impl>(server_url, model)) {}

OllamaClient::~OllamaClient() = default;

const std::string& OllamaClient::model() const {
    return impl_->model;
}

const std::string& OllamaClient::serverUrl() const {
    return impl_->server_url;
}

const std::string& OllamaClient::fallbackCommand() {
    return FALLBACK_COMMAND;
}

std::string OllamaClient::detectShellName() {
    const char* shell = std::getenv("SHELL");
    if (!shell || shell[0] == '\0') {
        return "sh";
    }
    std::string name = std::filesystem::path(shell).filename().string();
    return name.empty() ? "sh" : name;
}

std::string OllamaClient::buildSystemPrompt(const std::string& shell_name) {
    std::ostringstream prompt;
    prompt << "You translate requests into a single " << shell_name << " command.\n"
           << "Rules:\n"
           << "- Output exactly one command and nothing else. No explanations, no prose.\n"
           << "- No markdown, no code fences, no backticks, no quotes around the command.\n"
           << "- Prefer safe, non-destructive, read-only operations whenever possible.\n"
           << "- Never chain unrelated commands.\n"
           << "- If the request is unclear or dangerous, output exactly: " << FALLBACK_COMMAND;
    return prompt.str();
}

std::string OllamaClient::buildRequestBody(const std::string& model, const std::string& prompt,
                                           const std::string& system) {
    json request_body = {
        {"model", model},
        {"prompt", prompt},
        {"system", system},
        {"stream", false}
    };
    return request_body.dump();
}

GenerateResponse OllamaClient::generateCommand(const std::string& request) {
    GenerateResponse response;
    response.kind = ErrorKind::Inference;
    
    if (!impl_->client->is_valid()) {
        response.error = "Invalid server URL: " + impl_->server_url;
        return response;
    }
    
    impl_->useGenerateTimeouts();
    std::string body = buildRequestBody(impl_->model, request, impl_->system_prompt);
    auto res = impl_->client->Post(GENERATE_PATH, body, "application/json");
    
    if (!res) {
        response.error = "Network error: " + httplib::to_string(res.error());
        return response;
    }
    
    if (res->status != 200) {
        response.error = impl_->describeHttpError(*res);
        return response;
    }
    
    try {
        json res_json = json::parse(res->body);
        if (!res_json.contains("response") || !res_json["response"].is_string()) {
            response.error = "Invalid response structure: missing 'response' text";
            return response;
        }
        response.content = cleanResponse(res_json["response"].get<std::string>());
    } catch (const json::exception& e) {
        response.error = std::string("Invalid response JSON: ") + e.what();
        return response;
    }
    
    if (response.content.empty()) {
        response.error = "Empty response from model";
        response.kind = ErrorKind::EmptySuggestion;
        return response;
    }
    
    response.success = true;
    response.kind = ErrorKind::None;
    return response;
}

ModelListResponse OllamaClient::listModels() {
    ModelListResponse response;
    
    if (!impl_->client->is_valid()) {
        response.error = "Invalid server URL: " + impl_->server_url;
        return response;
    }
    
    impl_->useProbeTimeouts();
    auto res = impl_->client->Get(TAGS_PATH);
    
    if (!res) {
        response.error = "Network error: " + httplib::to_string(res.error());
        return response;
    }
    
    if (res->status != 200) {
        response.error = impl_->describeHttpError(*res);
        return response;
    }
    
    try {
        json res_json = json::parse(res->body);
        if (res_json.contains("models") && res_json["models"].is_array()) {
            for (const auto& entry : res_json["models"]) {
                if (entry.contains("name") && entry["name"].is_string()) {
                    response.models.push_back(entry["name"].get<std::string>());
                }
            }
        }
        response.success = true;
    } catch (const json::exception& e) {
        response.error = std::string("Invalid response JSON: ") + e.what();
    }
    
    return response;
}

bool OllamaClient::isReachable() {
    if (!impl_->client->is_valid()) return false;
    
    impl_->useProbeTimeouts();
    auto res = impl_->client->Get(TAGS_PATH);
    return static_cast<bool>(res);
}

} // namespace shlama
