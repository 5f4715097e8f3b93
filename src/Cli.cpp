/**
 * Cli.cpp - Command-line flags and which flow they select
 */

#include "shlama/Cli.hpp"

namespace shlama {

CliOptions parseArgs(int argc, const char* const argv[]) {
    CliOptions options;
    options.no_arguments = argc < 2;
    bool flags_done = false;
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (flags_done) {
            options.request.push_back(arg);
        } else if (arg == "--") {
            flags_done = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--version" || arg == "-v") {
            options.version = true;
        } else if (arg == "--model" || arg == "-m") {
            options.select_model = true;
        } else if (arg == "--dry-run" || arg == "-n") {
            options.dry_run = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg.rfind("--", 0) == 0) {
            if (options.unknown_flag.empty()) options.unknown_flag = arg;
        } else {
            options.request.push_back(arg);
        }
    }
    
    return options;
}

CliAction chooseAction(const CliOptions& options) {
    if (options.no_arguments || options.help) return CliAction::ShowHelp;
    if (options.version) return CliAction::ShowVersion;
    if (!options.unknown_flag.empty()) return CliAction::RejectUnknownFlag;
    if (options.select_model) return CliAction::SelectModel;
    return CliAction::RunRequest;
}

int exitCodeFor(CliAction action) {
    return action == CliAction::RejectUnknownFlag ? 1 : 0;
}

} // namespace shlama
