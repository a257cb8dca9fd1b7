#include "util/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

ProcessResult runProcess(const std::vector<std::string>& argv, bool captureStdout) {
    if (argv.empty()) throw std::runtime_error("runProcess: empty argv");

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int fds[2] = {-1, -1};
    if (captureStdout && ::pipe(fds) != 0) {
        throw std::runtime_error(std::string("pipe() failed: ") + std::strerror(errno));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        if (captureStdout) {
            ::close(fds[0]);
            ::close(fds[1]);
        }
        throw std::runtime_error(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (!captureStdout) ::dup2(devnull, STDOUT_FILENO);
            ::close(devnull);
        }
        if (captureStdout) {
            ::dup2(fds[1], STDOUT_FILENO);
            ::close(fds[0]);
            ::close(fds[1]);
        }
        ::execvp(args[0], args.data());
        _exit(127);
    }

    ProcessResult result;
    if (captureStdout) {
        ::close(fds[1]);
        char buff[4096];
        while (true) {
            const ssize_t n = ::read(fds[0], buff, sizeof(buff));
            if (n > 0) {
                result.output.append(buff, (size_t)n);
            } else if (n < 0 && errno == EINTR) {
                continue;
            } else {
                break;
            }
        }
        ::close(fds[0]);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid() failed: ") + std::strerror(errno));
        }
    }
    result.exitStatus = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

bool commandExists(const std::string& program) {
    if (program.empty()) return false;
    if (program.find('/') != std::string::npos) return ::access(program.c_str(), X_OK) == 0;

    const ProcessResult r = runProcess({"sh", "-c", "command -v \"$0\"", program}, false);
    return r.exitStatus == 0;
}
