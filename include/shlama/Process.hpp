/**
 * Process.hpp - Starting external programs without a shell
 */

#pragma once

#include <string>
#include <vector>

namespace shlama {

/**
 * Starts argv[0] (looked up in PATH when it has no slash) fully detached:
 * new session, standard streams on /dev/null, not a child of this process.
 * Returns false with error_message set when the program could not be executed.
 */
bool spawnDetached(const std::vector<std::string>& argv, std::string& error_message);

// Runs argv in the foreground with inherited streams; exit status, 128+signal, or -1
int runForeground(const std::vector<std::string>& argv);

// Decodes a wait status as returned by waitpid() or std::system()
int decodeWaitStatus(int status);

} // namespace shlama
