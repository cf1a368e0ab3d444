#include "solve_job.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <mutex>

namespace smart_timetable {

struct SolveJob::State {
    State(std::shared_ptr<const TimetableEngine> e, SolveRequest r) : engine(std::move(e)), request(std::move(r)) {}

    std::shared_ptr<const TimetableEngine> engine;
    SolveRequest request;
    std::atomic<bool> cancel_requested{false};

    std::mutex mutex;
    std::condition_variable done;
    std::optional<JobOutcome> outcome;
    bool worker_done{false};

    // Called once by the worker; an outcome already set by the watchdog wins.
    void finish(JobOutcome late) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            worker_done = true;
            if (outcome) {
                if (engine->options().verbose) {
                    std::cout << "  ⚠ Discarding late " << to_string(late.kind) << " after "
                              << to_string(outcome->kind) << std::endl;
                }
                return;
            }
            outcome = std::move(late);
        }
        done.notify_all();
    }
};

namespace {

// Longer than any solve; keeps the deadline arithmetic inside steady_clock's range.
constexpr double kMaxWatchdogSeconds = 365.0 * 24 * 60 * 60;

}  // namespace

const char* to_string(JobOutcomeKind kind) {
    switch (kind) {
        case JobOutcomeKind::Result: return "result";
        case JobOutcomeKind::Cancelled: return "cancelled";
        case JobOutcomeKind::Timeout: return "timeout";
        case JobOutcomeKind::Failed: return "failed";
    }
    return "failed";
}

SolveJob::SolveJob(std::shared_ptr<const TimetableEngine> engine, SolveRequest request, double grace_seconds)
    : state_(std::make_shared<State>(std::move(engine), std::move(request))), grace_seconds_(grace_seconds) {
    if (!state_->engine) throw SolverError("SolveJob needs an engine");
}

SolveJob::~SolveJob() {
    if (!worker_.joinable()) return;
    bool worker_done;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        worker_done = state_->worker_done;
    }
    if (worker_done) {
        worker_.join();
    } else {
        worker_.detach();
    }
}

void SolveJob::start() {
    if (worker_.joinable()) return;
    watchdog_seconds_ = std::min(std::max(0.0, state_->request.time_limit) + std::max(0.0, grace_seconds_),
                                 kMaxWatchdogSeconds);
    deadline_ = std::chrono::steady_clock::now() +
                std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                    std::chrono::duration<double>(watchdog_seconds_));

    std::shared_ptr<State> state = state_;
    worker_ = std::thread([state]() {
        if (state->cancel_requested) {
            JobOutcome cancelled;
            cancelled.kind = JobOutcomeKind::Cancelled;
            state->finish(std::move(cancelled));
            return;
        }

        JobOutcome outcome;
        try {
            outcome.result = state->engine->generate(state->request);
            outcome.kind = JobOutcomeKind::Result;
        } catch (const InvalidRequestError& e) {
            outcome.kind = JobOutcomeKind::Failed;
            outcome.error = e.what();
            outcome.invalid_request = true;
        } catch (const std::exception& e) {
            outcome.kind = JobOutcomeKind::Failed;
            outcome.error = e.what();
        }
        state->finish(std::move(outcome));
    });
}

void SolveJob::cancel() {
    state_->cancel_requested = true;
}

JobOutcome SolveJob::wait() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (!worker_.joinable() && !state_->outcome) {
        JobOutcome never_started;
        never_started.kind = JobOutcomeKind::Failed;
        never_started.error = "job was never started";
        return never_started;
    }
    State& state = *state_;
    if (!state.done.wait_until(lock, deadline_, [&state]() { return state.outcome.has_value(); })) {
        JobOutcome timeout;
        timeout.kind = JobOutcomeKind::Timeout;
        timeout.error = "solver did not finish within " +
                        std::to_string(static_cast<long long>(watchdog_seconds_)) +
                        " seconds";
        state.outcome = std::move(timeout);
    }
    return *state.outcome;
}

bool SolveJob::finished() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->outcome.has_value();
}

}  // namespace smart_timetable
