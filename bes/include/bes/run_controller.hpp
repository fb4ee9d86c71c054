#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include <bes/common_types.hpp>
#include <bes/schedule.hpp>
#include <bes/simulation.hpp>
#include <bes/tissue_state.hpp>

namespace bes {

enum class run_status {
    running,
    finalized,          // horizon reached
    diverged,           // stability check failed
    cancelled,          // cancel() requested
    budget_exhausted    // step or wall clock budget used up
};

std::string to_string(run_status);

struct run_parameters {
    time_type dt = 1e-5;                    // [s]

    // Horizon: t_final if positive, otherwise n_steps.
    time_type t_final = 0;                  // [s]
    step_type n_steps = 0;

    // Snapshot every k steps; 0 for none.
    step_type snapshot_every = 0;

    // Snapshot at the step end nearest each marker time.
    std::optional<schedule> markers;

    // Snapshot of the state before the first step.
    bool snapshot_initial = false;

    // Iteration and wall clock budgets; 0 for none.
    step_type max_steps = 0;
    double wall_clock_budget = 0;           // [s]
};

struct run_progress {
    step_type step = 0;
    time_type time = 0;
    time_type t_final = 0;
    run_status status = run_status::running;
};

using step_callback = std::function<void(const run_progress&)>;
using snapshot_callback = std::function<void(const tissue_snapshot&)>;

struct run_result {
    run_status status = run_status::running;
    step_type steps = 0;                    // steps taken in this run
    time_type time = 0;                     // simulation time at the end
    std::size_t warnings = 0;
    std::string message;                    // divergence report
    tissue_snapshot last;                   // last stable state
};

// Drives a simulation over a horizon, emitting snapshots and progress.
//
// Note: callbacks are invoked on the thread that calls run().
class run_controller {
public:
    explicit run_controller(simulation& sim);

    void set_step_callback(step_callback f = step_callback{});
    void set_snapshot_callback(snapshot_callback f = snapshot_callback{});

    // Ask a run to stop after the current step. A request made before
    // run() is entered stops that run before its first step. Thread safe.
    void cancel();

    // Divergence is reported in the result; other errors propagate.
    run_result run(const run_parameters& p);

private:
    simulation& sim_;
    step_callback on_step_;
    snapshot_callback on_snapshot_;
    std::atomic<bool> cancel_{false};
};

// A step callback that prints out a text progress bar.
step_callback progress_bar();

} // namespace bes
