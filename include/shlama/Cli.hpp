/**
 * Cli.hpp - Command-line flags and which flow they select
 */

#pragma once

#include <string>
#include <vector>

namespace shlama {

struct CliOptions {
    bool no_arguments = false;
    bool help = false;
    bool version = false;
    bool select_model = false;
    bool dry_run = false;
    bool verbose = false;
    std::vector<std::string> request;
    std::string unknown_flag;   // First unrecognized "--" token, if any
};

enum class CliAction {
    ShowHelp,
    ShowVersion,
    RejectUnknownFlag,
    SelectModel,
    RunRequest
};

// Flags may appear anywhere; "--" ends flag parsing
CliOptions parseArgs(int argc, const char* const argv[]);

// help > version > unknown flag > --model > request, independent of argument order.
// No arguments at all shows help.
CliAction chooseAction(const CliOptions& options);

// 1 for RejectUnknownFlag, 0 for the informational actions
int exitCodeFor(CliAction action);

} // namespace shlama
