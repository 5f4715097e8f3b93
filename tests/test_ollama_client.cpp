/**
 * test_ollama_client.cpp - OllamaClient against an in-process mock Ollama server
 */

#include "shlama/CommandBroker.hpp"
#include "shlama/Console.hpp"
#include "shlama/Executor.hpp"
#include "shlama/OllamaClient.hpp"
#include "shlama/ServerLauncher.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// Minimal stand-in for the Ollama REST API on an ephemeral loopback port
class MockOllama {
public:
    std::string generate_reply = R"({"model":"m","response":"ls -la","done":true})";
    int generate_status = 200;
    std::vector<json> generate_requests;
    int tags_calls = 0;
    
    MockOllama() {
        server_.Get("/api/tags", [this](const httplib::Request&, httplib::Response& res) {
            ++tags_calls;
            res.set_content(R"({"models":[{"name":"llama3.2:latest"},{"name":"mistral:7b"}]})",
                            "application/json");
        });
        server_.Post("/api/generate", [this](const httplib::Request& req, httplib::Response& res) {
            generate_requests.push_back(json::parse(req.body));
            res.status = generate_status;
            res.set_content(generate_reply, "application/json");
        });
        
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        while (!server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    
    ~MockOllama() {
        server_.stop();
        thread_.join();
    }
    
    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(port_);
    }
    
private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

class RecordingExecutor : public shlama::Executor {
public:
    std::vector<std::string> commands;
    
    shlama::ExecutionResult run(const std::string& command) override {
        commands.push_back(command);
        shlama::ExecutionResult result;
        result.started = true;
        result.exit_status = 0;
        return result;
    }
};

// Port that nothing listens on any more
std::string closedPortUrl() {
    std::string url;
    {
        MockOllama gone;
        url = gone.url();
    }
    return url;
}

} // anonymous namespace

void test_request_body_shape() {
    auto body = json::parse(shlama::OllamaClient::buildRequestBody("m1", "list files", "sys"));
    
    assert(body["model"] == "m1");
    assert(body["prompt"] == "list files");
    assert(body["system"] == "sys");
    assert(body["stream"] == false);
    assert(body.size() == 4);
    
    std::cout << "[PASS] test_request_body_shape\n";
}

void test_system_prompt_rules() {
    std::string prompt = shlama::OllamaClient::buildSystemPrompt("zsh");
    
    assert(prompt.find("zsh") != std::string::npos);
    assert(prompt.find("exactly one command") != std::string::npos);
    assert(prompt.find("markdown") != std::string::npos);
    assert(prompt.find(shlama::OllamaClient::fallbackCommand()) != std::string::npos);
    
    std::cout << "[PASS] test_system_prompt_rules\n";
}

void test_generate_sends_and_cleans() {
    MockOllama mock;
    mock.generate_reply = R"({"response":"```bash\nfind . -size +100M\n```","done":true})";
    
    shlama::OllamaClient client(mock.url(), "qwen2.5-coder:7b");
    auto response = client.generateCommand("find big files");
    
    assert(response.success);
    assert(response.kind == shlama::ErrorKind::None);
    assert(response.content == "find . -size +100M");
    assert(mock.generate_requests.size() == 1);
    assert(mock.generate_requests[0]["model"] == "qwen2.5-coder:7b");
    assert(mock.generate_requests[0]["prompt"] == "find big files");
    assert(mock.generate_requests[0]["stream"] == false);
    assert(!mock.generate_requests[0]["system"].get<std::string>().empty());
    
    std::cout << "[PASS] test_generate_sends_and_cleans\n";
}

void test_http_error_status() {
    MockOllama mock;
    mock.generate_status = 404;
    mock.generate_reply = R"({"error":"model 'nope' not found"})";
    
    shlama::OllamaClient client(mock.url(), "nope");
    auto response = client.generateCommand("anything");
    
    assert(!response.success);
    assert(response.kind == shlama::ErrorKind::Inference);
    assert(response.error.find("404") != std::string::npos);
    assert(response.error.find("not found") != std::string::npos);
    assert(response.content.empty());
    
    std::cout << "[PASS] test_http_error_status\n";
}

void test_malformed_and_empty_replies() {
    MockOllama mock;
    shlama::OllamaClient client(mock.url(), "m");
    
    mock.generate_reply = "not json";
    auto bad = client.generateCommand("x");
    assert(!bad.success);
    assert(bad.kind == shlama::ErrorKind::Inference);
    
    mock.generate_reply = R"({"done":true})";
    auto missing = client.generateCommand("x");
    assert(!missing.success);
    assert(missing.kind == shlama::ErrorKind::Inference);
    
    mock.generate_reply = R"({"response":"```\n```"})";
    auto empty = client.generateCommand("x");
    assert(!empty.success);
    assert(empty.kind == shlama::ErrorKind::EmptySuggestion);
    
    std::cout << "[PASS] test_malformed_and_empty_replies\n";
}

void test_unreachable_server() {
    shlama::OllamaClient client(closedPortUrl(), "m");
    
    assert(!client.isReachable());
    
    auto response = client.generateCommand("x");
    assert(!response.success);
    assert(response.kind == shlama::ErrorKind::Inference);
    assert(response.error.find("Network error") == 0);
    
    auto models = client.listModels();
    assert(!models.success);
    
    std::cout << "[PASS] test_unreachable_server\n";
}

void test_list_models_and_probe() {
    MockOllama mock;
    shlama::OllamaClient client(mock.url(), "m");
    
    assert(client.isReachable());
    
    auto models = client.listModels();
    assert(models.success);
    assert(models.models.size() == 2);
    assert(models.models[0] == "llama3.2:latest");
    assert(models.models[1] == "mistral:7b");
    
    std::cout << "[PASS] test_list_models_and_probe\n";
}

void test_end_to_end_confirmed_request() {
    MockOllama mock;
    mock.generate_reply = R"({"response":"Get-ChildItem -Force","done":true})";
    
    shlama::Configuration config{"qwen2.5-coder:7b", mock.url()};
    std::ostringstream out, err;
    shlama::Console console(out, err);
    std::istringstream input("y\n");
    
    shlama::OllamaClient client(config.server_url, config.model);
    shlama::OllamaServerControl control(client);
    shlama::ServerLauncher launcher(config.server_url, control, console);
    RecordingExecutor executor;
    
    shlama::CommandBroker broker(config, launcher, client, executor, input, console);
    auto outcome = broker.run({"list all files including hidden"});
    
    assert(outcome.state == shlama::BrokerState::Done);
    assert(outcome.suggestion == "Get-ChildItem -Force");
    assert(out.str().find("Get-ChildItem -Force") != std::string::npos);
    assert(executor.commands.size() == 1);
    assert(executor.commands[0] == "Get-ChildItem -Force");
    assert(mock.tags_calls >= 1);
    assert(mock.generate_requests.size() == 1);
    assert(mock.generate_requests[0]["prompt"] == "list all files including hidden");
    
    std::cout << "[PASS] test_end_to_end_confirmed_request\n";
}

int main() {
    std::cout << "Running OllamaClient tests...\n\n";
    
    test_request_body_shape();
    test_system_prompt_rules();
    test_generate_sends_and_cleans();
    test_http_error_status();
    test_malformed_and_empty_replies();
    test_unreachable_server();
    test_list_models_and_probe();
    test_end_to_end_confirmed_request();
    
    std::cout << "\nAll tests passed!\n";
    return 0;
}
