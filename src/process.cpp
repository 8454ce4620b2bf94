/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/process.hpp>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace groundstation {

ChildProcess::~ChildProcess() {
    if (running()) {
        warn("Killing {} (pid {})", name, pid);
        ::kill(pid, SIGKILL);
        wait();
    }
}

void ChildProcess::spawn(const std::vector<std::string> &argv, const ProcessStreams &streams) {
    if (running()) {
        throw ProcessException(name + " is already running");
    }
    if (argv.empty()) {
        throw ProcessException("No program given");
    }

    name = argv[0];
    status.reset();

    // Build the argument array before forking, the child may only make
    // async-signal-safe calls
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    // The child reports exec failure through this pipe. A successful exec
    // closes it, so the parent reads EOF.
    int errorPipe[2];
    if (::pipe2(errorPipe, O_CLOEXEC) < 0) {
        throw ProcessException("Failed to create pipe for " + name + ": " + std::strerror(errno));
    }

    pid_t parent = ::getpid();
    pid_t child = ::fork();
    if (child < 0) {
        int err = errno;
        ::close(errorPipe[0]);
        ::close(errorPipe[1]);
        throw ProcessException("Failed to fork " + name + ": " + std::strerror(err));
    }

    if (child == 0) {
        ::close(errorPipe[0]);

        ::prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (::getppid() != parent) {
            ::_exit(127);
        }

        if (streams.in >= 0) ::dup2(streams.in, STDIN_FILENO);
        if (streams.out >= 0) ::dup2(streams.out, STDOUT_FILENO);
        if (streams.err >= 0) ::dup2(streams.err, STDERR_FILENO);

        ::execvp(args[0], args.data());

        int err = errno;
        ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(errorPipe[1]);
    pid = child;

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    ::close(errorPipe[0]);

    if (n > 0) {
        wait();
        pid = -1;
        throw ProcessException("Failed to start " + name + ": " + std::strerror(childErrno));
    }

    debug("Started {} (pid {})", name, pid);
}

void ChildProcess::reaped(int waitStatus) {
    if (WIFEXITED(waitStatus)) {
        status = WEXITSTATUS(waitStatus);
    } else if (WIFSIGNALED(waitStatus)) {
        status = 128 + WTERMSIG(waitStatus);
    } else {
        status = -1;
    }
    debug("{} (pid {}) exited with status {}", name, pid, *status);
}

std::optional<int> ChildProcess::poll() {
    if (status || pid <= 0) {
        return status;
    }

    int waitStatus = 0;
    pid_t result = ::waitpid(pid, &waitStatus, WNOHANG);
    if (result == pid) {
        reaped(waitStatus);
    } else if (result < 0 && errno == ECHILD) {
        // Already reaped elsewhere, the real status is lost
        status = -1;
    }
    return status;
}

int ChildProcess::wait() {
    if (status || pid <= 0) {
        return status.value_or(-1);
    }

    int waitStatus = 0;
    pid_t result;
    do {
        result = ::waitpid(pid, &waitStatus, 0);
    } while (result < 0 && errno == EINTR);

    if (result == pid) {
        reaped(waitStatus);
    } else {
        status = -1;
    }
    return *status;
}

void ChildProcess::signal(int sig) {
    if (running()) {
        ::kill(pid, sig);
    }
}

}
