/**
 * ServerLauncher.cpp - Make sure the inference server answers before generating
 */

#include "shlama/ServerLauncher.hpp"
#include "shlama/Config.hpp"
#include "shlama/Console.hpp"
#include "shlama/OllamaClient.hpp"
#include "shlama/Process.hpp"

#include <thread>
#include <unistd.h>

namespace shlama {

static const std::vector<std::string> INSTALLED_PATHS = {
    "/usr/local/bin/ollama",
    "/usr/bin/ollama",
    "/Applications/Ollama.app/Contents/Resources/ollama",
};

ServerLauncher::ServerLauncher(std::string server_url, ServerControl& control, Console& console,
                               ProbePolicy policy)
    : server_url_(std::move(server_url)),
      control_(control),
      console_(console),
      policy_(policy) {}

bool ServerLauncher::ensureReady() {
    if (control_.probe()) {
        console_.debug("Inference server is up at " + server_url_);
        return true;
    }
    
    if (!isLoopbackUrl(server_url_)) {
        console_.debug("Server " + server_url_ + " is remote; not attempting to start it");
        return false;
    }
    
    console_.info("Ollama is not running, starting it...");
    
    std::string error;
    if (!control_.launch(error)) {
        console_.debug("Launch failed: " + error);
        return false;
    }
    
    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        std::this_thread::sleep_for(policy_.interval);
        if (control_.probe()) {
            console_.debug("Server ready after " + std::to_string(attempt) + " poll(s)");
            return true;
        }
    }
    
    console_.debug("Server did not answer after " + std::to_string(policy_.max_attempts) + " polls");
    return false;
}

OllamaServerControl::OllamaServerControl(OllamaClient& client) : client_(client) {}

bool OllamaServerControl::probe() {
    return client_.isReachable();
}

std::vector<std::string> OllamaServerControl::launchCandidates() {
    std::vector<std::string> candidates;
    for (const auto& path : INSTALLED_PATHS) {
        if (access(path.c_str(), X_OK) == 0) {
            candidates.push_back(path);
        }
    }
    candidates.push_back("ollama");
    return candidates;
}

bool OllamaServerControl::launch(std::string& error_message) {
    std::string errors;
    for (const auto& exe : launchCandidates()) {
        std::string error;
        if (spawnDetached({exe, "serve"}, error)) {
            return true;
        }
        if (!errors.empty()) errors += "; ";
        errors += error;
    }
    error_message = errors;
    return false;
}

} // namespace shlama
