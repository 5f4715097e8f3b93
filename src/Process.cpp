/**
 * Process.cpp - Starting external programs without a shell
 */

#include "shlama/Process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace shlama {

namespace {

std::vector<char*> toArgv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

void redirectToDevNull() {
    int fd = open("/dev/null", O_RDWR);
    if (fd < 0) return;
    dup2(fd, STDIN_FILENO);
    dup2(fd, STDOUT_FILENO);
    dup2(fd, STDERR_FILENO);
    if (fd > STDERR_FILENO) close(fd);
}

} // anonymous namespace

int decodeWaitStatus(int status) {
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

bool spawnDetached(const std::vector<std::string>& args, std::string& error_message) {
    if (args.empty()) {
        error_message = "No program given";
        return false;
    }
    
    // The grandchild reports a failed exec through this pipe; a clean EOF means it ran
    int report[2];
    if (pipe2(report, O_CLOEXEC) != 0) {
        error_message = std::string("pipe: ") + std::strerror(errno);
        return false;
    }
    
    auto argv = toArgv(args);
    
    pid_t pid = fork();
    if (pid < 0) {
        error_message = std::string("fork: ") + std::strerror(errno);
        close(report[0]);
        close(report[1]);
        return false;
    }
    
    if (pid == 0) {
        close(report[0]);
        setsid();
        pid_t grandchild = fork();
        if (grandchild < 0) {
            int err = errno;
            ssize_t ignored = write(report[1], &err, sizeof(err));
            (void)ignored;
            _exit(1);
        }
        if (grandchild > 0) {
            _exit(0);
        }
        
        redirectToDevNull();
        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = write(report[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }
    
    close(report[1]);
    int status = 0;
    waitpid(pid, &status, 0);
    
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(report[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(report[0]);
    
    if (n > 0) {
        error_message = args[0] + ": " + std::strerror(child_errno);
        return false;
    }
    
    return true;
}

int runForeground(const std::vector<std::string>& args) {
    if (args.empty()) return -1;
    
    auto argv = toArgv(args);
    
    pid_t pid = fork();
    if (pid < 0) {
        return -1;
    }
    
    if (pid == 0) {
        execvp(argv[0], argv.data());
        _exit(127);
    }
    
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return decodeWaitStatus(status);
}

} // namespace shlama
