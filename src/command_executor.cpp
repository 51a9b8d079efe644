//
// command_executor.cpp
// Obsidian Shell - External Command Execution
//
// The child reports a failed execvp() back through a close-on-exec pipe, so
// "could not start" is told apart from "ran and failed". Both output pipes
// are drained together with poll() so a child filling one of them cannot
// stall while the other is being read.
//
// While a child runs the shell ignores SIGINT and SIGQUIT, so Ctrl+C reaches
// the child through the terminal's process group and the session survives.
//

#include "command_executor.h"
#include "shell_strings.h"
#include <cerrno>
#include <cstring>
#include <csignal>
#include <initializer_list>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ObsidianShell {

namespace {

void closeDescriptor(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

bool setCloseOnExec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

// Read both pipes until each reaches end-of-file
void drainPipes(int outFd, int errFd, std::string& out, std::string& err) {
    struct pollfd fds[2];
    fds[0].fd = outFd;
    fds[0].events = POLLIN;
    fds[1].fd = errFd;
    fds[1].events = POLLIN;
    std::string* targets[2] = { &out, &err };

    char buffer[4096];
    int openCount = 2;

    while (openCount > 0) {
        fds[0].revents = 0;
        fds[1].revents = 0;

        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }

            ssize_t count = read(fds[i].fd, buffer, sizeof(buffer));
            if (count > 0) {
                targets[i]->append(buffer, static_cast<size_t>(count));
            } else if (count == 0 || errno != EINTR) {
                // Negative descriptors are ignored by poll()
                fds[i].fd = -1;
                openCount--;
            }
        }
    }
}

// Ignores the terminal's interrupt signals for its lifetime
class InterruptGuard {
public:
    InterruptGuard()
        : m_oldInt(signal(SIGINT, SIG_IGN))
        , m_oldQuit(signal(SIGQUIT, SIG_IGN))
    {
    }

    ~InterruptGuard() {
        if (m_oldInt != SIG_ERR) {
            signal(SIGINT, m_oldInt);
        }
        if (m_oldQuit != SIG_ERR) {
            signal(SIGQUIT, m_oldQuit);
        }
    }

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    void (*m_oldInt)(int);
    void (*m_oldQuit)(int);
};

bool waitForChild(pid_t pid, int& status) {
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

} // namespace

CommandLine splitCommandLine(const std::string& line) {
    CommandLine commandLine;
    std::vector<std::string> tokens = splitWhitespace(line);
    if (tokens.empty()) {
        return commandLine;
    }

    commandLine.program = tokens[0];
    commandLine.args.assign(tokens.begin() + 1, tokens.end());
    return commandLine;
}

ProcessExecutor::ProcessExecutor() {
}

ExecResult ProcessExecutor::spawnFailure(const std::string& program, int error) {
    ExecResult result;
    result.success = false;
    result.status = ExecStatus::SPAWN_FAILED;
    result.exitCode = -1;
    result.errorMessage = "Failed to execute command: " + program + ": " + std::strerror(error);
    return result;
}

ExecResult ProcessExecutor::execute(const std::string& program,
                                    const std::vector<std::string>& args) {
    if (program.empty()) {
        ExecResult result;
        result.errorMessage = "Failed to execute command: no program given";
        return result;
    }

    int outPipe[2] = { -1, -1 };
    int errPipe[2] = { -1, -1 };
    int statusPipe[2] = { -1, -1 };

    if (pipe(outPipe) < 0 || pipe(errPipe) < 0 || pipe(statusPipe) < 0 ||
        !setCloseOnExec(statusPipe[0]) || !setCloseOnExec(statusPipe[1])) {
        int error = errno;
        for (int* fds : { outPipe, errPipe, statusPipe }) {
            closeDescriptor(fds[0]);
            closeDescriptor(fds[1]);
        }
        return spawnFailure(program, error);
    }

    // Build argv before forking; the child must not allocate
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    InterruptGuard interruptGuard;

    pid_t pid = fork();
    if (pid < 0) {
        int error = errno;
        for (int* fds : { outPipe, errPipe, statusPipe }) {
            closeDescriptor(fds[0]);
            closeDescriptor(fds[1]);
        }
        return spawnFailure(program, error);
    }

    if (pid == 0) {
        // Child; ignored dispositions would survive execvp
        signal(SIGINT, SIG_DFL);
        signal(SIGQUIT, SIG_DFL);

        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);
        close(statusPipe[0]);

        execvp(argv[0], argv.data());

        int error = errno;
        ssize_t written = write(statusPipe[1], &error, sizeof(error));
        (void)written;
        _exit(127);
    }

    // Parent
    closeDescriptor(outPipe[1]);
    closeDescriptor(errPipe[1]);
    closeDescriptor(statusPipe[1]);

    int childError = 0;
    ssize_t statusBytes;
    do {
        statusBytes = read(statusPipe[0], &childError, sizeof(childError));
    } while (statusBytes < 0 && errno == EINTR);
    closeDescriptor(statusPipe[0]);

    if (statusBytes == static_cast<ssize_t>(sizeof(childError))) {
        // execvp failed; reap the child and report the OS error
        int status = 0;
        waitForChild(pid, status);
        closeDescriptor(outPipe[0]);
        closeDescriptor(errPipe[0]);
        return spawnFailure(program, childError);
    }

    ExecResult result;
    std::string capturedOut;
    drainPipes(outPipe[0], errPipe[0], capturedOut, result.errorOutput);
    closeDescriptor(outPipe[0]);
    closeDescriptor(errPipe[0]);

    int status = 0;
    if (!waitForChild(pid, status)) {
        result.status = ExecStatus::NONZERO_EXIT;
        result.errorMessage = std::string("Failed to wait for command: ") + std::strerror(errno);
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        if (result.exitCode == 0) {
            result.success = true;
            result.status = ExecStatus::SUCCESS;
            result.output = capturedOut;
            return result;
        }

        result.status = ExecStatus::NONZERO_EXIT;
        std::string stderrText = trimWhitespace(result.errorOutput);
        if (stderrText.empty()) {
            result.errorMessage = "Command failed with exit code " + std::to_string(result.exitCode);
        } else {
            result.errorMessage = "Command failed: " + stderrText;
        }
        return result;
    }

    result.status = ExecStatus::NONZERO_EXIT;
    result.exitCode = -1;
    if (WIFSIGNALED(status)) {
        result.errorMessage = "Command terminated by signal " + std::to_string(WTERMSIG(status));
    } else {
        result.errorMessage = "Command terminated abnormally";
    }
    return result;
}

} // namespace ObsidianShell
