/**
 * @file progress_sampler.cpp
 * @brief SampleChannel and ProgressSampler implementation.
 * @author Dimitris Kafetzis
 */

#include "watchdog/progress_sampler.hpp"

#include <chrono>
#include <iterator>

namespace agent_orchestrator {

// ── SampleChannel ────────────────────────────

void SampleChannel::push(IndicatorSample sample) {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(sample));
}

std::vector<IndicatorSample> SampleChannel::drain() {
    std::lock_guard lock(mutex_);
    std::vector<IndicatorSample> out(std::make_move_iterator(queue_.begin()),
                                     std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
}

size_t SampleChannel::size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

// ── ProgressSampler ──────────────────────────

ProgressSampler::ProgressSampler(SampleChannel& channel, IVcsBackend& vcs)
    : channel_(channel), vcs_(vcs) {}

ProgressSampler::~ProgressSampler() {
    stop_all();
}

void ProgressSampler::start(const TaskId& task_id, uint32_t attempt, const WatchdogPolicy& policy,
                            ProbeContext context) {
    stop(task_id);

    auto worker = std::make_unique<Worker>();
    auto* raw = worker.get();
    auto interval = policy.check_interval;
    context.window_start = std::chrono::system_clock::now();

    raw->thread = std::jthread([this, raw, task_id, attempt, interval, policy,
                                context = std::move(context)](std::stop_token stop) mutable {
        ProgressProbe probe(policy, vcs_, std::move(context));
        while (!stop.stop_requested()) {
            {
                std::unique_lock lock(raw->mutex);
                raw->cv.wait_for(lock, stop, interval, [] { return false; });
            }
            if (stop.stop_requested()) return;
            channel_.push(probe.sample(task_id, attempt, std::chrono::system_clock::now()));
        }
    });

    std::lock_guard lock(mutex_);
    workers_.insert_or_assign(task_id, std::move(worker));
}

void ProgressSampler::stop(const TaskId& task_id) {
    std::unique_ptr<Worker> worker;
    {
        std::lock_guard lock(mutex_);
        auto it = workers_.find(task_id);
        if (it == workers_.end()) return;
        worker = std::move(it->second);
        workers_.erase(it);
    }
    worker->thread.request_stop();
    worker->thread.join();
}

void ProgressSampler::stop_all() {
    std::unordered_map<TaskId, std::unique_ptr<Worker>> workers;
    {
        std::lock_guard lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& [id, worker] : workers) {
        worker->thread.request_stop();
    }
    for (auto& [id, worker] : workers) {
        if (worker->thread.joinable()) worker->thread.join();
    }
}

size_t ProgressSampler::active_count() const {
    std::lock_guard lock(mutex_);
    return workers_.size();
}

}  // namespace agent_orchestrator
