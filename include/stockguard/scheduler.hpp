#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace stockguard {

/**
 * A job run on its own thread every `interval` until stopped.
 *
 * Runs are single-flight: run_once() skips instead of overlapping a run that
 * is still in progress, whether that run came from the timer or a manual
 * trigger. A failing run is logged and the schedule continues.
 */
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> job);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();

    /**
     * Wake the thread and join it. A run in progress finishes first.
     */
    void stop();

    /**
     * Run the job now on the calling thread.
     * @return false if skipped because another run is in flight
     */
    bool run_once();

    const std::string& name() const { return name_; }
    int64_t completed_runs() const { return completed_runs_.load(); }
    int64_t skipped_runs() const { return skipped_runs_.load(); }

private:
    void loop();

    const std::string name_;
    const std::chrono::milliseconds interval_;
    std::function<void()> job_;

    std::atomic<bool> in_flight_{false};
    std::atomic<int64_t> completed_runs_{0};
    std::atomic<int64_t> skipped_runs_{0};

    std::mutex mu_;
    std::condition_variable cv_stop_;
    bool stopping_ = false;
    std::thread thread_;
};

/**
 * Owns the background sweeps of a process.
 */
class Scheduler {
public:
    Scheduler() = default;
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    PeriodicTask& add(std::string name, std::chrono::milliseconds interval,
                      std::function<void()> job);

    void start();
    void stop();

private:
    std::vector<std::unique_ptr<PeriodicTask>> tasks_;
};

}  // namespace stockguard
