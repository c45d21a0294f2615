#include "stockguard/scheduler.hpp"
#include "stockguard/logging.hpp"

namespace stockguard {

namespace {

// Clears the single-flight flag however the run ends.
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightGuard() { flag_.store(false); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

}  // namespace

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> job)
    : name_(std::move(name)), interval_(interval), job_(std::move(job)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (thread_.joinable()) return;
    stopping_ = false;
    thread_ = std::thread([this] { loop(); });
    log_info("scheduler", "task_started",
             {{"task", name_}, {"interval_ms", static_cast<int64_t>(interval_.count())}});
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!thread_.joinable()) return;
        stopping_ = true;
    }
    cv_stop_.notify_all();
    thread_.join();
    log_info("scheduler", "task_stopped",
             {{"task", name_}, {"completed_runs", completed_runs_.load()},
              {"skipped_runs", skipped_runs_.load()}});
}

bool PeriodicTask::run_once() {
    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        skipped_runs_++;
        log_debug("scheduler", "run_skipped", {{"task", name_}});
        return false;
    }

    InFlightGuard guard(in_flight_);
    try {
        job_();
    } catch (const std::exception& e) {
        log_error("scheduler", "run_failed", {{"task", name_}, {"error", e.what()}});
    }
    completed_runs_++;
    return true;
}

void PeriodicTask::loop() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!stopping_) {
        if (cv_stop_.wait_for(lk, interval_, [this] { return stopping_; })) break;
        lk.unlock();
        run_once();
        lk.lock();
    }
}

Scheduler::~Scheduler() {
    stop();
}

PeriodicTask& Scheduler::add(std::string name, std::chrono::milliseconds interval,
                             std::function<void()> job) {
    tasks_.push_back(std::make_unique<PeriodicTask>(std::move(name), interval, std::move(job)));
    return *tasks_.back();
}

void Scheduler::start() {
    for (auto& task : tasks_) task->start();
}

void Scheduler::stop() {
    for (auto& task : tasks_) task->stop();
}

}  // namespace stockguard
