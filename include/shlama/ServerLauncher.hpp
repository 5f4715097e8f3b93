/**
 * ServerLauncher.hpp - Make sure the inference server answers before generating
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace shlama {

class Console;
class OllamaClient;

struct ProbePolicy {
    int max_attempts = 30;
    std::chrono::milliseconds interval{500};
};

// Low-level probe and launch actions against one server
class ServerControl {
public:
    virtual ~ServerControl() = default;
    virtual bool probe() = 0;
    virtual bool launch(std::string& error_message) = 0;
};

// What the request flow needs: a server that answers, or a clear "no"
class ServerMonitor {
public:
    virtual ~ServerMonitor() = default;
    virtual bool ensureReady() = 0;
};

class ServerLauncher : public ServerMonitor {
public:
    ServerLauncher(std::string server_url, ServerControl& control, Console& console,
                   ProbePolicy policy = ProbePolicy());
    
    // Probe; when unreachable and local, launch and poll until ready or out of attempts.
    // Remote servers are never launched.
    bool ensureReady() override;
    
private:
    std::string server_url_;
    ServerControl& control_;
    Console& console_;
    ProbePolicy policy_;
};

class OllamaServerControl : public ServerControl {
public:
    explicit OllamaServerControl(OllamaClient& client);
    
    bool probe() override;
    
    // Tries each launch candidate as "<exe> serve" until one starts
    bool launch(std::string& error_message) override;
    
    // Known install locations first, then "ollama" from PATH
    static std::vector<std::string> launchCandidates();
    
private:
    OllamaClient& client_;
};

} // namespace shlama
