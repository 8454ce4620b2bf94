/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_PROCESS_HPP
#define __GROUNDSTATION_PROCESS_HPP

#include <csignal>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/types.h>

namespace groundstation {

/**
 * Thrown when a child process cannot be started.
 */
class ProcessException : public std::runtime_error {
public:
    explicit ProcessException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Standard streams for a child process. -1 inherits the parent's stream.
 */
struct ProcessStreams {
    int in = -1;
    int out = -1;
    int err = -1;
};

/**
 * An external program started with fork/exec.
 *
 * The process is owned by this object: destroying a running ChildProcess
 * kills it and waits for it so no zombie or orphan is left behind. The child
 * also receives SIGTERM if the parent dies.
 */
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * Start a program. argv[0] is looked up on the PATH.
     * The call returns once exec has succeeded or failed.
     * @throws ProcessException if the program cannot be started
     */
    void spawn(const std::vector<std::string> &argv, const ProcessStreams &streams = {});

    /**
     * Reap the process if it has exited, without blocking.
     * @return The exit status once the process has exited
     */
    std::optional<int> poll();

    /**
     * Block until the process exits.
     * @return The exit status
     */
    int wait();

    /**
     * Send a signal to the process if it is still running.
     */
    void signal(int sig = SIGTERM);

    bool running() const { return pid > 0 && !status; }
    pid_t getPid() const { return pid; }
    const std::string& getName() const { return name; }

    /**
     * Exit code, or 128 + signal number if the process was killed.
     */
    std::optional<int> exitStatus() const { return status; }

private:
    pid_t pid = -1;
    std::string name;
    std::optional<int> status;

    void reaped(int waitStatus);
};

}

#endif
