#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>
#include <utility>

#include <bes/besexcept.hpp>
#include <bes/run_controller.hpp>
#include <bes/schedule.hpp>
#include <bes/simulation.hpp>

#include "util/pprintf.hpp"

namespace bes {

using util::pprintf;

std::string to_string(run_status s) {
    switch (s) {
    case run_status::running:          return "running";
    case run_status::finalized:        return "finalized";
    case run_status::diverged:         return "diverged";
    case run_status::cancelled:        return "cancelled";
    case run_status::budget_exhausted: return "budget exhausted";
    }
    return "unknown";
}

run_controller::run_controller(simulation& sim):
    sim_(sim)
{}

void run_controller::set_step_callback(step_callback f) {
    on_step_ = std::move(f);
}

void run_controller::set_snapshot_callback(snapshot_callback f) {
    on_snapshot_ = std::move(f);
}

void run_controller::cancel() {
    cancel_.store(true);
}

run_result run_controller::run(const run_parameters& p) {
    using clock = std::chrono::steady_clock;

    if (!(p.dt>0)) {
        throw bad_parameters(pprintf("time step {} s must be positive", p.dt));
    }
    if (!(p.t_final>0) && !p.n_steps) {
        throw bad_parameters("run requires a positive t_final or n_steps");
    }
    if (p.wall_clock_budget<0) {
        throw bad_parameters("wall clock budget must be non-negative");
    }

    const time_type dt = p.dt;
    const time_type t_start = sim_.time();
    const time_type t_final = p.t_final>0? p.t_final: t_start + p.n_steps*dt;

    std::optional<schedule> markers = p.markers;
    if (markers) markers->reset();

    // Markers within half a step of t.
    auto at_marker = [&](time_type t) {
        if (!markers) return false;
        auto ev = markers->events(t - 0.5*dt, t + 0.5*dt);
        return ev.first!=ev.second;
    };

    auto emit_snapshot = [&]() {
        if (on_snapshot_) on_snapshot_(sim_.snapshot());
    };

    auto done = [&](step_type steps) {
        if (p.t_final>0) return sim_.time()>=t_final - 0.5*dt;
        return steps>=p.n_steps;
    };

    run_result result;

    if (at_marker(t_start) || p.snapshot_initial) {
        emit_snapshot();
    }

    const auto wall_start = clock::now();
    step_type steps = 0;

    while (!done(steps)) {
        if (cancel_.load()) {
            result.status = run_status::cancelled;
            break;
        }
        if (p.max_steps && steps>=p.max_steps) {
            result.status = run_status::budget_exhausted;
            break;
        }
        if (p.wall_clock_budget>0) {
            std::chrono::duration<double> elapsed = clock::now() - wall_start;
            if (elapsed.count()>=p.wall_clock_budget) {
                result.status = run_status::budget_exhausted;
                break;
            }
        }

        try {
            sim_.step(dt);
        }
        catch (divergence_error& e) {
            result.status = run_status::diverged;
            result.message = e.what();
            break;
        }
        ++steps;

        const auto t = sim_.time();
        bool snap = p.snapshot_every && sim_.num_steps()%p.snapshot_every==0;
        snap = at_marker(t) || snap;
        if (snap) emit_snapshot();

        if (on_step_) on_step_({sim_.num_steps(), t, t_final, run_status::running});

        if (cancel_.load()) {
            result.status = run_status::cancelled;
            break;
        }
    }

    if (result.status==run_status::running) {
        result.status = run_status::finalized;
        sim_.finalize();
    }

    // A cancel request applies to one run only.
    cancel_.store(false);

    result.steps = steps;
    result.time = sim_.time();
    result.warnings = sim_.stability_warnings();
    result.last = sim_.snapshot();

    if (on_step_) on_step_({sim_.num_steps(), result.time, t_final, result.status});

    return result;
}

step_callback progress_bar() {
    return [stride = 1, width = 50, current_stride = 0](const run_progress& p) mutable {
        if (p.status!=run_status::running) {
            printf("\n%s at t = %g s after %llu steps\n",
                   to_string(p.status).c_str(), p.time, (unsigned long long)p.step);
            fflush(stdout);
            current_stride = 0;
            return;
        }

        // Redraw only when the bar advances by a stride.
        int nstrides = p.t_final>0? int(width*p.time/p.t_final)/stride: 0;
        if (nstrides<=current_stride) return;
        current_stride = nstrides;

        int nbars = std::min(nstrides*stride, width);
        printf("\r%3d%% |%s%s| %12gs", 100*nbars/width,
               std::string(nbars, '=').c_str(),
               std::string(width-nbars, ' ').c_str(),
               p.time);
        fflush(stdout);
    };
}

} // namespace bes
