/**
 * @file progress_sampler.hpp
 * @brief One lightweight sampling thread per running task.
 * @author Dimitris Kafetzis
 *
 * Samplers never touch watchdog or task state; they hand samples to the
 * coordinating loop through a SampleChannel.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "watchdog/indicators.hpp"
#include "workspace/vcs.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief Multi-producer, single-consumer sample queue.
 */
class SampleChannel {
public:
    void push(IndicatorSample sample);
    [[nodiscard]] std::vector<IndicatorSample> drain();
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::deque<IndicatorSample> queue_;
};

class ProgressSampler {
public:
    ProgressSampler(SampleChannel& channel, IVcsBackend& vcs);
    ~ProgressSampler();

    ProgressSampler(const ProgressSampler&) = delete;
    ProgressSampler& operator=(const ProgressSampler&) = delete;

    /// Start (or replace) the sampler for a task attempt.
    void start(const TaskId& task_id, uint32_t attempt, const WatchdogPolicy& policy,
               ProbeContext context);

    /// Stop and join the task's sampler; no-op when none runs.
    void stop(const TaskId& task_id);
    void stop_all();

    [[nodiscard]] size_t active_count() const;

private:
    struct Worker {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::jthread thread;
    };

    SampleChannel& channel_;
    IVcsBackend& vcs_;
    mutable std::mutex mutex_;
    std::unordered_map<TaskId, std::unique_ptr<Worker>> workers_;
};

}  // namespace agent_orchestrator
