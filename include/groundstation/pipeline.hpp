/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDSTATION_PIPELINE_HPP
#define __GROUNDSTATION_PIPELINE_HPP

#include <groundstation/process.hpp>

#include <string>
#include <vector>

namespace groundstation {

enum class PipelineState {
    IDLE,
    RUNNING,
    STOPPING,
    FINISHED,
    FAILED
};

/**
 * Two processes where the first one's standard output is the second one's
 * standard input, e.g. a demodulator feeding an encoder.
 *
 * Both processes live and die together. If either exits while the pipeline
 * is running, the other is killed and the pipeline fails. stop() asks the
 * producer to exit; the consumer then sees end of input and finishes on its
 * own.
 */
class CapturePipeline {
public:
    CapturePipeline() = default;

    CapturePipeline(const CapturePipeline&) = delete;
    CapturePipeline& operator=(const CapturePipeline&) = delete;

    /**
     * Start both processes.
     * @throws ProcessException if either cannot be started; nothing is left running
     */
    void start(const std::vector<std::string> &producerArgs,
               const std::vector<std::string> &consumerArgs);

    /**
     * Reap exited processes and update the state.
     */
    PipelineState poll();

    /**
     * Send SIGTERM to the producer.
     */
    void stop();

    /**
     * SIGKILL both processes and wait for them.
     */
    void kill();

    PipelineState getState() const { return state; }

    bool done() const {
        return state == PipelineState::FINISHED || state == PipelineState::FAILED;
    }

    const ChildProcess& getProducer() const { return producer; }
    const ChildProcess& getConsumer() const { return consumer; }

private:
    PipelineState state = PipelineState::IDLE;
    ChildProcess producer;
    ChildProcess consumer;
};

}

#endif
