/**
 * Config.hpp - Model and server resolution, persisted model choice
 *
 * Model:  SHLAMA_MODEL > saved config file > built-in default
 * Server: OLLAMA_HOST > built-in default
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace shlama {

struct Configuration {
    std::string model;
    std::string server_url;
};

class ConfigStore {
public:
    // config_file: empty = no saved preference can be read or written
    explicit ConfigStore(std::filesystem::path config_file = defaultConfigPath());
    
    Configuration load() const;
    
    std::string resolveModel() const;
    std::string resolveServerUrl() const;
    
    // First line of the config file, trimmed; nullopt when absent or blank
    std::optional<std::string> savedModel() const;
    
    // Writes "<model>\n", creating the directory when missing
    bool persistModel(const std::string& model, std::string& error_message) const;
    
    const std::filesystem::path& path() const { return config_file_; }
    
    // $XDG_CONFIG_HOME/shlama/model or ~/.config/shlama/model, empty if neither is set
    static std::filesystem::path defaultConfigPath();
    static std::string getDefaultModel();
    static std::string getDefaultServerUrl();
    
private:
    std::filesystem::path config_file_;
};

// Adds scheme and port when missing, drops any path, maps 0.0.0.0 to 127.0.0.1
std::string normalizeServerUrl(const std::string& url);

// Host part of a URL without brackets, e.g. "localhost" or "::1"
std::string hostOfUrl(const std::string& url);

bool isLoopbackUrl(const std::string& url);

std::string trim(const std::string& text);

} // namespace shlama
