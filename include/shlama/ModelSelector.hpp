/**
 * ModelSelector.hpp - Interactive model choice (--model)
 */

#pragma once

#include "shlama/Config.hpp"
#include "shlama/Errors.hpp"
#include "shlama/OllamaClient.hpp"

#include <array>
#include <iosfwd>
#include <string>
#include <vector>

namespace shlama {

class Console;
class ServerMonitor;

struct CuratedModel {
    const char* id;
    const char* description;
};

const std::array<CuratedModel, 4>& curatedModels();

struct MenuChoice {
    enum class Kind { Curated, Custom, Cancel };
    Kind kind = Kind::Cancel;
    std::string model;   // Set for Curated only
};

// "1"-"4" curated, "5" custom, anything else cancels
MenuChoice parseMenuChoice(const std::string& input);

// A name without a tag matches "<name>:latest"
bool isModelInstalled(const std::vector<std::string>& installed, const std::string& model);

// Model listing and download through the inference runtime
class ModelRuntime {
public:
    virtual ~ModelRuntime() = default;
    virtual ModelListResponse listModels() = 0;
    virtual int pullModel(const std::string& model) = 0;
};

class OllamaRuntime : public ModelRuntime {
public:
    explicit OllamaRuntime(OllamaClient& client);
    
    ModelListResponse listModels() override;
    
    // Blocking "ollama pull <model>"; its progress output goes to the terminal
    int pullModel(const std::string& model) override;
    
    // Same executable the server launch tries first
    static std::vector<std::string> pullCommand(const std::string& model);
    
private:
    OllamaClient& client_;
};

struct SelectionOutcome {
    ErrorKind error = ErrorKind::None;
    bool changed = false;
    bool pulled = false;
    std::string model;
};

class ModelSelector {
public:
    ModelSelector(const Configuration& config, const ConfigStore& store, ServerMonitor& server,
                  ModelRuntime& runtime, std::istream& input, Console& console);
    
    SelectionOutcome run();
    
private:
    const Configuration& config_;
    const ConfigStore& store_;
    ServerMonitor& server_;
    ModelRuntime& runtime_;
    std::istream& input_;
    Console& console_;
    
    void printMenu();
    std::string readLine();
    bool offerDownload(const std::string& model);
};

} // namespace shlama
