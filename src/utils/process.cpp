#include "process.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace {

void closePipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] != -1) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

std::vector<std::string> buildEnvironment(const ProcessEnvironment &overrides) {
    std::vector<std::string> entries;
    for (char **env = environ; env != nullptr && *env != nullptr; ++env) {
        std::string entry(*env);
        const auto eq = entry.find('=');
        const std::string key = entry.substr(0, eq);
        if (overrides.count(key) == 0) {
            entries.push_back(std::move(entry));
        }
    }
    for (const auto &[key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

// Drains both pipes until the child closes them.
void drainPipes(int outFd, int errFd, std::string &out, std::string &err) {
    std::array<char, 4096> buffer{};
    pollfd fds[2] = {{outFd, POLLIN, 0}, {errFd, POLLIN, 0}};
    int open = 2;
    while (open > 0) {
        if (poll(fds, 2, -1) == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t count = read(fds[i].fd, buffer.data(), buffer.size());
            if (count > 0) {
                (i == 0 ? out : err).append(buffer.data(), static_cast<size_t>(count));
                continue;
            }
            if (count == -1 && errno == EINTR) {
                continue;
            }
            fds[i].fd = -1;
            --open;
        }
    }
}

}  // namespace

ProcessResult runProcess(const std::vector<std::string> &args,
                         const ProcessEnvironment &environment) {
    ProcessResult result;
    if (args.empty()) {
        result.error = "empty command";
        return result;
    }

    // Everything the child needs is built before fork.
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const auto envEntries = buildEnvironment(environment);
    std::vector<char *> envp;
    envp.reserve(envEntries.size() + 1);
    for (const auto &entry : envEntries) {
        envp.push_back(const_cast<char *>(entry.c_str()));
    }
    envp.push_back(nullptr);

    int outputPipe[2]{-1, -1};
    int errorPipe[2]{-1, -1};
    if (pipe2(outputPipe, O_CLOEXEC) == -1 || pipe2(errorPipe, O_CLOEXEC) == -1) {
        result.error = std::string("pipe: ") + std::strerror(errno);
        closePipe(outputPipe);
        closePipe(errorPipe);
        return result;
    }

    pid_t pid = fork();
    if (pid == -1) {
        result.error = std::string("fork: ") + std::strerror(errno);
        closePipe(outputPipe);
        closePipe(errorPipe);
        return result;
    }

    if (pid == 0) {
        // Child
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(outputPipe[1], STDOUT_FILENO);
        dup2(errorPipe[1], STDERR_FILENO);
        execve(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    // Parent
    close(outputPipe[1]);
    close(errorPipe[1]);
    result.started = true;
    drainPipes(outputPipe[0], errorPipe[0], result.output, result.errorOutput);
    close(outputPipe[0]);
    close(errorPipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = std::string("waitpid: ") + std::strerror(errno);
            return result;
        }
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        result.success = result.exitCode == 0;
        if (result.exitCode == 127 && result.output.empty() && result.errorOutput.empty()) {
            result.error = "failed to execute " + args[0];
        }
    } else if (WIFSIGNALED(status)) {
        result.error = args[0] + " terminated by signal " + std::to_string(WTERMSIG(status));
    }
    return result;
}
