/**
 * Config.cpp - Model and server resolution, persisted model choice
 */

#include "shlama/Config.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>

namespace shlama {

static const std::string DEFAULT_MODEL = "qwen2.5-coder:7b";
static const std::string DEFAULT_SERVER_URL = "http://localhost:11434";
static const std::string DEFAULT_PORT = "11434";

namespace {

std::string getEnv(const char* name) {
    const char* value = std::getenv(name);
    if (!value) return "";
    return trim(value);
}

} // anonymous namespace

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

ConfigStore::ConfigStore(std::filesystem::path config_file)
    : config_file_(std::move(config_file)) {}

std::filesystem::path ConfigStore::defaultConfigPath() {
    std::string xdg = getEnv("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return std::filesystem::path(xdg) / "shlama" / "model";
    }
    std::string home = getEnv("HOME");
    if (!home.empty()) {
        return std::filesystem::path(home) / ".config" / "shlama" / "model";
    }
    return {};
}

std::string ConfigStore::getDefaultModel() {
    return DEFAULT_MODEL;
}

std::string ConfigStore::getDefaultServerUrl() {
    return DEFAULT_SERVER_URL;
}

Configuration ConfigStore::load() const {
    return Configuration{resolveModel(), resolveServerUrl()};
}

std::string ConfigStore::resolveModel() const {
    std::string env_model = getEnv("SHLAMA_MODEL");
    if (!env_model.empty()) {
        return env_model;
    }
    
    auto saved = savedModel();
    if (saved) {
        return *saved;
    }
    
    return DEFAULT_MODEL;
}

std::string ConfigStore::resolveServerUrl() const {
    std::string env_host = getEnv("OLLAMA_HOST");
    if (!env_host.empty()) {
        return normalizeServerUrl(env_host);
    }
    return DEFAULT_SERVER_URL;
}

std::optional<std::string> ConfigStore::savedModel() const {
    if (config_file_.empty()) return std::nullopt;
    
    std::ifstream file(config_file_);
    if (!file.good()) return std::nullopt;
    
    std::string line;
    std::getline(file, line);
    line = trim(line);
    if (line.empty()) return std::nullopt;
    return line;
}

bool ConfigStore::persistModel(const std::string& model, std::string& error_message) const {
    std::string value = trim(model);
    if (value.empty()) {
        error_message = "Empty model name.";
        return false;
    }
    
    if (config_file_.empty()) {
        error_message = "No configuration directory (neither XDG_CONFIG_HOME nor HOME is set).";
        return false;
    }
    
    std::error_code ec;
    auto dir = config_file_.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            error_message = "Cannot create " + dir.string() + ": " + ec.message();
            return false;
        }
    }
    
    std::ofstream file(config_file_, std::ios::trunc);
    if (!file.is_open()) {
        error_message = "Cannot open " + config_file_.string() + " for writing.";
        return false;
    }
    
    file << value << "\n";
    file.close();
    if (file.fail()) {
        error_message = "Failed writing " + config_file_.string() + ".";
        return false;
    }
    
    return true;
}

std::string normalizeServerUrl(const std::string& url) {
    std::string result = trim(url);
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    if (result.empty()) {
        return DEFAULT_SERVER_URL;
    }
    
    std::string scheme = "http://";
    size_t scheme_end = result.find("://");
    if (scheme_end != std::string::npos) {
        scheme = result.substr(0, scheme_end + 3);
        result = result.substr(scheme_end + 3);
    }
    
    // Only scheme, host and port are kept; httplib::Client takes no base path
    size_t slash = result.find('/');
    if (slash != std::string::npos) {
        result = result.substr(0, slash);
    }
    
    std::string host = result;
    std::string port;
    if (!result.empty() && result.front() == '[') {
        size_t close = result.find(']');
        if (close != std::string::npos) {
            host = result.substr(0, close + 1);
            if (close + 1 < result.size() && result[close + 1] == ':') {
                port = result.substr(close + 2);
            }
        }
    } else if (std::count(result.begin(), result.end(), ':') > 1) {
        host = "[" + result + "]";
    } else {
        size_t colon = result.rfind(':');
        if (colon != std::string::npos) {
            host = result.substr(0, colon);
            port = result.substr(colon + 1);
        }
    }
    
    if (host.empty() || host == "0.0.0.0") {
        host = "127.0.0.1";
    }
    if (port.empty()) {
        port = scheme == "https://" ? "443" : DEFAULT_PORT;
    }
    
    return scheme + host + ":" + port;
}

std::string hostOfUrl(const std::string& url) {
    std::string rest = url;
    size_t scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        rest = rest.substr(scheme_end + 3);
    }
    rest = rest.substr(0, rest.find('/'));
    
    if (!rest.empty() && rest.front() == '[') {
        size_t close = rest.find(']');
        return rest.substr(1, close == std::string::npos ? std::string::npos : close - 1);
    }
    
    size_t colon = rest.rfind(':');
    // More than one colon without brackets is a bare IPv6 address
    if (colon != std::string::npos && rest.find(':') == colon) {
        rest = rest.substr(0, colon);
    }
    return rest;
}

bool isLoopbackUrl(const std::string& url) {
    std::string host = hostOfUrl(url);
    for (auto& c : host) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    
    if (host == "localhost" || host == "::1" || host == "0.0.0.0") {
        return true;
    }
    
    // 127.0.0.0/8, numeric addresses only
    in_addr addr{};
    if (inet_pton(AF_INET, host.c_str(), &addr) != 1) {
        return false;
    }
    return (ntohl(addr.s_addr) >> 24) == 127;
}

} // namespace shlama
