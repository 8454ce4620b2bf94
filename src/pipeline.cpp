/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation/pipeline.hpp>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::error;
using spdlog::warn;

namespace groundstation {

void CapturePipeline::start(const std::vector<std::string> &producerArgs,
                            const std::vector<std::string> &consumerArgs) {
    if (state == PipelineState::RUNNING || state == PipelineState::STOPPING) {
        throw ProcessException("Pipeline is already running");
    }

    // Close-on-exec so that neither child holds the other end open, otherwise
    // the consumer would never see end of input
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        throw ProcessException(std::string("Failed to create pipe: ") + std::strerror(errno));
    }

    try {
        producer.spawn(producerArgs, ProcessStreams{.out = fds[1]});
        consumer.spawn(consumerArgs, ProcessStreams{.in = fds[0]});
    } catch (const ProcessException &) {
        ::close(fds[0]);
        ::close(fds[1]);
        kill();
        throw;
    }

    ::close(fds[0]);
    ::close(fds[1]);

    state = PipelineState::RUNNING;
    debug("Pipeline started: {} (pid {}) | {} (pid {})",
          producer.getName(), producer.getPid(), consumer.getName(), consumer.getPid());
}

PipelineState CapturePipeline::poll() {
    if (state != PipelineState::RUNNING && state != PipelineState::STOPPING) {
        return state;
    }

    auto producerStatus = producer.poll();
    auto consumerStatus = consumer.poll();

    if (state == PipelineState::RUNNING) {
        if (producerStatus || consumerStatus) {
            const auto &exited = producerStatus ? producer : consumer;
            error("{} exited unexpectedly with status {}",
                  exited.getName(), *exited.exitStatus());
            kill();
            state = PipelineState::FAILED;
        }
        return state;
    }

    // Stopping: wait for the consumer to drain
    if (producerStatus && consumerStatus) {
        if (*consumerStatus == 0) {
            state = PipelineState::FINISHED;
        } else {
            error("{} exited with status {}", consumer.getName(), *consumerStatus);
            state = PipelineState::FAILED;
        }
    }
    return state;
}

void CapturePipeline::stop() {
    if (state != PipelineState::RUNNING) {
        return;
    }
    state = PipelineState::STOPPING;
    producer.signal(SIGTERM);
}

void CapturePipeline::kill() {
    for (auto *process : {&producer, &consumer}) {
        if (process->running()) {
            warn("Killing {} (pid {})", process->getName(), process->getPid());
            process->signal(SIGKILL);
            process->wait();
        }
    }
    if (state == PipelineState::RUNNING || state == PipelineState::STOPPING) {
        state = PipelineState::FAILED;
    }
}

}
