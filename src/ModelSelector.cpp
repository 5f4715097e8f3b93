/**
 * ModelSelector.cpp - Interactive model choice (--model)
 */

#include "shlama/ModelSelector.hpp"
#include "shlama/Console.hpp"
#include "shlama/OllamaClient.hpp"
#include "shlama/Process.hpp"
#include "shlama/ServerLauncher.hpp"

#include <cstdlib>
#include <istream>
#include <ostream>

namespace shlama {

namespace {

bool modelOverriddenByEnv() {
    const char* value = std::getenv("SHLAMA_MODEL");
    return value && !trim(value).empty();
}

} // anonymous namespace

static const std::array<CuratedModel, 4> CURATED_MODELS = {{
    {"qwen2.5-coder:7b", "Best at shell commands (default)"},
    {"llama3.2:3b", "Small and fast"},
    {"mistral:7b", "General purpose"},
    {"codellama:7b", "Code oriented"},
}};

const std::array<CuratedModel, 4>& curatedModels() {
    return CURATED_MODELS;
}

MenuChoice parseMenuChoice(const std::string& input) {
    MenuChoice choice;
    std::string value = trim(input);
    
    if (value.size() == 1 && value[0] >= '1' && value[0] <= '4') {
        choice.kind = MenuChoice::Kind::Curated;
        choice.model = CURATED_MODELS[value[0] - '1'].id;
    } else if (value == "5") {
        choice.kind = MenuChoice::Kind::Custom;
    }
    
    return choice;
}

bool isModelInstalled(const std::vector<std::string>& installed, const std::string& model) {
    std::string wanted = model.find(':') == std::string::npos ? model + ":latest" : model;
    for (const auto& name : installed) {
        if (name == model || name == wanted) return true;
    }
    return false;
}

OllamaRuntime::OllamaRuntime(OllamaClient& client) : client_(client) {}

ModelListResponse OllamaRuntime::listModels() {
    return client_.listModels();
}

std::vector<std::string> OllamaRuntime::pullCommand(const std::string& model) {
    return {OllamaServerControl::launchCandidates().front(), "pull", model};
}

int OllamaRuntime::pullModel(const std::string& model) {
    return runForeground(pullCommand(model));
}

ModelSelector::ModelSelector(const Configuration& config, const ConfigStore& store,
                             ServerMonitor& server, ModelRuntime& runtime,
                             std::istream& input, Console& console)
    : config_(config),
      store_(store),
      server_(server),
      runtime_(runtime),
      input_(input),
      console_(console) {}

void ModelSelector::printMenu() {
    auto& out = console_.out();
    out << console_.bold("Current model:") << " " << config_.model << "\n\n"
        << console_.bold("Select a model:") << "\n";
    
    int number = 1;
    for (const auto& model : CURATED_MODELS) {
        out << "  " << number++ << ") " << model.id << "  - " << model.description << "\n";
    }
    out << "  5) Custom model name\n"
        << "  0) Cancel\n\n";
}

std::string ModelSelector::readLine() {
    std::string line;
    if (!std::getline(input_, line)) {
        return "";
    }
    return trim(line);
}

bool ModelSelector::offerDownload(const std::string& model) {
    console_.prompt("Model '" + model + "' is not installed. Download it now? [y/N] ");
    std::string answer = readLine();
    if (answer != "y" && answer != "Y") {
        console_.info("Skipped download. Run 'ollama pull " + model + "' later.");
        return false;
    }
    
    int status = runtime_.pullModel(model);
    if (status != 0) {
        console_.error("Download failed (ollama exited with status " + std::to_string(status) + ").");
        return false;
    }
    
    console_.success("Model downloaded: " + model);
    return true;
}

SelectionOutcome ModelSelector::run() {
    SelectionOutcome outcome;
    outcome.model = config_.model;
    
    if (modelOverriddenByEnv()) {
        console_.warn("SHLAMA_MODEL is set and overrides the saved choice.");
    }
    
    printMenu();
    console_.prompt("Choice [0-5]: ");
    MenuChoice choice = parseMenuChoice(readLine());
    
    std::string model;
    switch (choice.kind) {
        case MenuChoice::Kind::Curated:
            model = choice.model;
            break;
        case MenuChoice::Kind::Custom:
            console_.prompt("Model name (e.g. phi3:mini): ");
            model = readLine();
            break;
        case MenuChoice::Kind::Cancel:
            break;
    }
    
    if (model.empty()) {
        console_.info("Cancelled. Model unchanged.");
        return outcome;
    }
    
    std::string error;
    if (!store_.persistModel(model, error)) {
        console_.error("Could not save model choice: " + error);
        outcome.error = ErrorKind::ConfigWrite;
        return outcome;
    }
    
    outcome.changed = true;
    outcome.model = model;
    console_.success("Model set: " + model);
    console_.debug("Saved to " + store_.path().string());
    
    if (!server_.ensureReady()) {
        console_.warn("Ollama is not reachable; cannot check whether the model is installed.");
        return outcome;
    }
    
    ModelListResponse installed = runtime_.listModels();
    if (!installed.success) {
        console_.warn("Could not list installed models: " + installed.error);
        return outcome;
    }
    
    if (!isModelInstalled(installed.models, model)) {
        outcome.pulled = offerDownload(model);
    }
    
    return outcome;
}

} // namespace shlama
