/**
 * Executor.hpp - Running a confirmed command
 */

#pragma once

#include <string>

namespace shlama {

class Console;

struct ExecutionResult {
    bool started = false;   // false: the shell itself could not be run
    int exit_status = -1;   // exit code, or 128+signal
    std::string error;
};

class Executor {
public:
    virtual ~Executor() = default;
    virtual ExecutionResult run(const std::string& command) = 0;
};

// Hands the command verbatim to /bin/sh; output goes straight to the terminal
class ShellExecutor : public Executor {
public:
    ExecutionResult run(const std::string& command) override;
};

// Prints what would run and reports success
class DryRunExecutor : public Executor {
public:
    explicit DryRunExecutor(Console& console);
    ExecutionResult run(const std::string& command) override;
    
private:
    Console& console_;
};

} // namespace shlama
