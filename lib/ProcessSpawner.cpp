/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  Execution of external programs as argument vectors
 */

#include "ProcessSpawner.hpp"
#include "Exceptions.hpp"
#include "Log.hpp"
#include "Util.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace RebaseKit {

namespace {

// File descriptor owned by the current scope
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd{fd} {}
    ~FileDescriptor() { reset(); }
    FileDescriptor(const FileDescriptor&) = delete;
    void operator=(const FileDescriptor&) = delete;
    void reset() {
        if (fd >= 0)
            close(fd);
        fd = -1;
    }
    int get() const { return fd; }
    int* data() { return &fd; }
private:
    int fd = -1;
};

void makePipe(FileDescriptor& readEnd, FileDescriptor& writeEnd, const std::string& purpose) {
    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) < 0) {
        throw ExecutionException{"Error opening pipe for " + purpose + ": " + std::string(strerror(errno)), -1, ""};
    }
    *readEnd.data() = pipefd[0];
    *writeEnd.data() = pipefd[1];
}

int waitForChild(pid_t pid) {
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid, &status, 0);
    } while (ret < 0 && errno == EINTR);
    if (ret < 0) {
        throw ExecutionException{"waitpid() failed: " + std::string(strerror(errno)), -1, ""};
    }
    if (WIFEXITED(status)) {
        rklog.debug("Application returned with exit status ", WEXITSTATUS(status), ".");
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        rklog.info("Application was terminated by signal ", WTERMSIG(status), ".");
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

std::string ForkExecSpawner::findProgram(const std::string& name) {
    if (name.empty())
        throw ExecutionException{"Empty program name.", 127, ""};
    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0)
            return name;
        throw ExecutionException{"Calling " + name + " failed: " + std::string(strerror(errno)), 127, ""};
    }
    for (auto& dir: Util::split(SEARCH_PATH, ':')) {
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    throw ExecutionException{"Calling " + name + " failed: program not found in " + SEARCH_PATH, 127, ""};
}

int ForkExecSpawner::spawn(const Command& command, const LineCallback& onLine) {
    if (command.empty())
        throw ExecutionException{"Empty command.", -1, ""};

    rklog.info("Executing `", toDisplayString(command), "`:");

    // Everything the child needs is prepared before forking; the child only
    // uses async-signal-safe functions as this may run in a worker thread.
    std::string program = findProgram(command[0]);
    std::vector<char*> argv;
    for (auto& arg: command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    std::string envPath = std::string("PATH=") + SEARCH_PATH;
    std::string envLocale = "LC_ALL=C";
    char* envp[] = {envPath.data(), envLocale.data(), nullptr};

    FileDescriptor devNull{open("/dev/null", O_RDONLY | O_CLOEXEC)};
    if (devNull.get() < 0)
        throw ExecutionException{"Opening /dev/null failed: " + std::string(strerror(errno)), -1, ""};
    FileDescriptor outRead, outWrite, errRead, errWrite;
    makePipe(outRead, outWrite, "command output");
    // Receives errno from the child if execve fails; closed by O_CLOEXEC otherwise
    makePipe(errRead, errWrite, "exec status");

    pid_t pid = fork();
    if (pid < 0) {
        throw ExecutionException{"fork() failed: " + std::string(strerror(errno)), -1, ""};
    } else if (pid == 0) {
        int error = 0;
        if (dup2(devNull.get(), STDIN_FILENO) < 0 || dup2(outWrite.get(), STDOUT_FILENO) < 0 ||
            dup2(outWrite.get(), STDERR_FILENO) < 0) {
            error = errno;
        } else {
            execve(program.c_str(), argv.data(), envp);
            error = errno;
        }
        ssize_t written = write(errWrite.get(), &error, sizeof(error));
        (void)written;
        _exit(127);
    }

    outWrite.reset();
    errWrite.reset();

    int execError = 0;
    ssize_t len;
    do {
        len = read(errRead.get(), &execError, sizeof(execError));
    } while (len < 0 && errno == EINTR);
    if (len == static_cast<ssize_t>(sizeof(execError))) {
        waitForChild(pid);
        throw ExecutionException{"Calling " + program + " failed: " + std::string(strerror(execError)), 127, ""};
    }

    std::string pending;
    try {
        char buffer[2048];
        while (true) {
            len = read(outRead.get(), buffer, sizeof(buffer));
            if (len < 0 && errno == EINTR)
                continue;
            if (len < 0)
                throw ExecutionException{"Reading command output failed: " + std::string(strerror(errno)), -1, pending};
            if (len == 0)
                break;
            pending.append(buffer, len);
            size_t newline;
            while ((newline = pending.find('\n')) != std::string::npos) {
                std::string line = pending.substr(0, newline);
                pending.erase(0, newline + 1);
                if (onLine)
                    onLine(line);
            }
        }
        if (!pending.empty() && onLine)
            onLine(pending);
    } catch (const std::exception &) {
        // Don't leave a zombie behind; the child sees EOF / EPIPE once our end is closed
        outRead.reset();
        waitForChild(pid);
        throw;
    }

    return waitForChild(pid);
}

} // namespace RebaseKit
