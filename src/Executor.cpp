/**
 * Executor.cpp - Running a confirmed command
 */

#include "shlama/Executor.hpp"
#include "shlama/Console.hpp"
#include "shlama/Process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace shlama {

ExecutionResult ShellExecutor::run(const std::string& command) {
    ExecutionResult result;
    
    // Our buffered output must land before the command's own
    std::cout.flush();
    std::cerr.flush();
    
    int status = std::system(command.c_str());
    if (status == -1) {
        result.error = std::string("could not start shell: ") + std::strerror(errno);
        return result;
    }
    
    result.started = true;
    result.exit_status = decodeWaitStatus(status);
    if (result.exit_status != 0) {
        result.error = "command exited with status " + std::to_string(result.exit_status);
    }
    return result;
}

DryRunExecutor::DryRunExecutor(Console& console) : console_(console) {}

ExecutionResult DryRunExecutor::run(const std::string& command) {
    console_.info("[dry-run] would run: " + command);
    
    ExecutionResult result;
    result.started = true;
    result.exit_status = 0;
    return result;
}

} // namespace shlama
