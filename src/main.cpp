/**
 * main.cpp - shlama CLI entry point
 *
 * Usage:
 *   shlama list all files including hidden    # Suggest a command, run it after y/N
 *   shlama --model                            # Pick the model to use
 *   shlama --dry-run "free disk space"        # Suggest and confirm, but never run
 */

#include "shlama/Cli.hpp"
#include "shlama/CommandBroker.hpp"
#include "shlama/Config.hpp"
#include "shlama/Console.hpp"
#include "shlama/Executor.hpp"
#include "shlama/ModelSelector.hpp"
#include "shlama/OllamaClient.hpp"
#include "shlama/ServerLauncher.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#ifndef SHLAMA_VERSION
#define SHLAMA_VERSION "0.0.0"
#endif

namespace {

void printUsage(shlama::Console& console, const shlama::ConfigStore& store) {
    shlama::Configuration config = store.load();
    std::string config_path = store.path().empty() ? "(unavailable)" : store.path().string();

    console.out() << console.bold("shlama") << " - natural language to shell commands, via Ollama\n\n"
                  << console.bold("Usage:") << "\n"
                  << "  shlama <request...>          Suggest a command and run it after confirmation\n"
                  << "  shlama --model, -m           Choose the model to use\n"
                  << "  shlama --dry-run, -n <req>   Suggest and confirm, but do not run\n"
                  << "  shlama --verbose <req>       Print debug details\n"
                  << "  shlama --version, -v         Show version\n"
                  << "  shlama --help, -h            Show this help\n\n"
                  << console.bold("Examples:") << "\n"
                  << "  shlama list all files including hidden\n"
                  << "  shlama \"find files larger than 100MB in my home\"\n\n"
                  << console.bold("Environment:") << "\n"
                  << "  SHLAMA_MODEL   Model to use, overrides the saved choice\n"
                  << "  OLLAMA_HOST    Ollama server (default " << shlama::ConfigStore::getDefaultServerUrl() << ")\n\n"
                  << console.bold("Current Config:") << "\n"
                  << "  Model:  " << config.model << "\n"
                  << "  Server: " << config.server_url << "\n"
                  << "  File:   " << config_path << "\n";
}

int runModelSelection(shlama::Console& console, const shlama::ConfigStore& store) {
    shlama::Configuration config = store.load();
    shlama::OllamaClient client(config.server_url, config.model);
    shlama::OllamaServerControl control(client);
    shlama::ServerLauncher launcher(config.server_url, control, console);
    shlama::OllamaRuntime runtime(client);

    shlama::ModelSelector selector(config, store, launcher, runtime, std::cin, console);
    auto outcome = selector.run();
    return outcome.error == shlama::ErrorKind::None ? 0 : 1;
}

int runRequest(shlama::Console& console, const shlama::ConfigStore& store,
               const shlama::CliOptions& options) {
    shlama::Configuration config = store.load();
    console.debug("Model " + config.model + " at " + config.server_url);

    shlama::OllamaClient client(config.server_url, config.model);
    shlama::OllamaServerControl control(client);
    shlama::ServerLauncher launcher(config.server_url, control, console);

    std::unique_ptr<shlama::Executor> executor;
    if (options.dry_run) {
        executor = std::make_unique<shlama::DryRunExecutor>(console);
    } else {
        executor = std::make_unique<shlama::ShellExecutor>();
    }

    shlama::CommandBroker broker(config, launcher, client, *executor, std::cin, console);
    auto outcome = broker.run(options.request);
    console.debug(std::string("Finished in state ") + shlama::brokerStateName(outcome.state) +
                  " (" + shlama::errorKindName(outcome.error) + ")");

    return outcome.state == shlama::BrokerState::Failed ? 1 : 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    shlama::CliOptions options = shlama::parseArgs(argc, argv);
    shlama::Console console = shlama::Console::standard(options.verbose);
    shlama::ConfigStore store;
    shlama::CliAction action = shlama::chooseAction(options);

    try {
        switch (action) {
            case shlama::CliAction::ShowHelp:
                printUsage(console, store);
                break;
            case shlama::CliAction::ShowVersion:
                console.out() << "shlama " << SHLAMA_VERSION << "\n";
                break;
            case shlama::CliAction::RejectUnknownFlag:
                console.error("Unknown flag '" + options.unknown_flag + "'");
                std::cerr << "Valid flags: --help, --version, --model, --dry-run, --verbose\n";
                break;
            case shlama::CliAction::SelectModel:
                return runModelSelection(console, store);
            case shlama::CliAction::RunRequest:
                return runRequest(console, store, options);
        }
        return shlama::exitCodeFor(action);
    } catch (const std::exception& e) {
        console.error(e.what());
        return 1;
    }
}
