#pragma once

#include "timetable_engine.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace smart_timetable {

enum class JobOutcomeKind { Result, Cancelled, Timeout, Failed };

const char* to_string(JobOutcomeKind kind);

struct JobOutcome {
    JobOutcomeKind kind{JobOutcomeKind::Failed};
    std::optional<EngineResult> result;  // set only for Result
    std::string error;                   // set for Failed and Timeout
    bool invalid_request{false};         // Failed because the request itself was rejected
};

/**
 * @brief One generate() call on a worker thread with an outer watchdog.
 *
 * Cancellation is cooperative and only honoured before the solve starts.
 * The watchdog expires time_limit + grace seconds after start(); the job then
 * reports Timeout and any late result is discarded. Exactly one terminal
 * outcome is ever produced.
 *
 * The worker shares ownership of the engine and of the job state, so a job
 * destroyed after a timeout detaches a still-running worker instead of
 * blocking on it.
 */
class SolveJob {
public:
    SolveJob(std::shared_ptr<const TimetableEngine> engine, SolveRequest request, double grace_seconds = 5.0);
    ~SolveJob();

    SolveJob(const SolveJob&) = delete;
    SolveJob& operator=(const SolveJob&) = delete;

    void start();
    void cancel();

    /// Blocks until the worker finishes or the watchdog expires.
    JobOutcome wait();

    bool finished() const;

private:
    struct State;

    std::shared_ptr<State> state_;
    double grace_seconds_;
    double watchdog_seconds_{0.0};
    std::chrono::steady_clock::time_point deadline_;
    std::thread worker_;
};

}  // namespace smart_timetable
