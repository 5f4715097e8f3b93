/**
 * OllamaClient.hpp - HTTP client for the local Ollama inference server
 */

#pragma once

#include "shlama/Errors.hpp"

#include <memory>
#include <string>
#include <vector>

namespace shlama {

struct GenerateResponse {
    std::string content;   // Cleaned command, never fenced
    bool success = false;
    std::string error;
    ErrorKind kind = ErrorKind::None;
};

struct ModelListResponse {
    std::vector<std::string> models;
    bool success = false;
    std::string error;
};

// Turns a natural-language request into one shell command
class CommandGenerator {
public:
    virtual ~CommandGenerator() = default;
    virtual GenerateResponse generateCommand(const std::string& request) = 0;
};

class OllamaClient : public CommandGenerator {
public:
    // server_url: normalized base URL, e.g. http://localhost:11434
    OllamaClient(const std::string& server_url, const std::string& model);
    ~OllamaClient() override;
    
    // POST /api/generate with stream=false; one attempt, 120s read timeout
    GenerateResponse generateCommand(const std::string& request) override;
    
    // GET /api/tags
    ModelListResponse listModels();
    
    // Any HTTP answer from /api/tags within a few seconds
    bool isReachable();
    
    const std::string& model() const;
    const std::string& serverUrl() const;
    
    static std::string buildSystemPrompt(const std::string& shell_name);
    static std::string buildRequestBody(const std::string& model, const std::string& prompt,
                                        const std::string& system);
    
    // Basename of $SHELL, "sh" when unset
    static std::string detectShellName();
    
    static const std::string& fallbackCommand();
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace shlama
