#include <algorithm>
#include <cmath>
#include <vector>

#include <bes/besexcept.hpp>
#include <bes/common_types.hpp>
#include <bes/schedule.hpp>

namespace bes {

struct empty_schedule {
    void reset() {}
    time_event_span events(time_type t0, time_type t1) {
        static time_type no_time;
        return {&no_time, &no_time};
    }
};

schedule::schedule(): schedule(empty_schedule{}) {}

// Schedule at k·dt for integral k≥0 within the interval [t0, t1).
struct regular_schedule_impl {
    explicit regular_schedule_impl(time_type t0, time_type dt, time_type t1):
        t0_(t0), t1_(t1), dt_(dt), oodt_(1./dt)
    {
        if (!std::isfinite(t0_) || t0_<0) throw bad_parameters("regular schedule: start must be >= 0 and finite");
        if (!std::isfinite(dt_) || dt_<=0) throw bad_parameters("regular schedule: dt must be > 0 and finite");
        if (std::isnan(t1_) || t1_<t0_) throw bad_parameters("regular schedule: stop must be >= start");
    };

    void reset() {}

    time_event_span events(time_type t0, time_type t1) {
        times_.clear();

        t0 = std::max(t0, t0_);
        t1 = std::min(t1, t1_);

        if (t1>t0) {
            times_.reserve(1+std::size_t((t1-t0)*oodt_));

            long long n = t0*oodt_;
            time_type t = n*dt_;

            while (t<t0) {
                t = (++n)*dt_;
            }

            while (t<t1) {
                times_.push_back(t);
                t = (++n)*dt_;
            }
        }

        return as_time_event_span(times_);
    }

    time_type t0_, t1_, dt_;
    time_type oodt_;

    std::vector<time_type> times_;
};

schedule regular_schedule(time_type t0, time_type dt, time_type t1) {
    return schedule(regular_schedule_impl(t0, dt, t1));
}

schedule regular_schedule(time_type dt) {
    return regular_schedule(0, dt);
}

// Schedule at times given explicitly via a provided sorted sequence.
struct explicit_schedule_impl {
    explicit_schedule_impl(const explicit_schedule_impl&) = default;
    explicit_schedule_impl(explicit_schedule_impl&&) = default;

    explicit explicit_schedule_impl(std::vector<time_type> seq):
        start_index_(0), times_(std::move(seq))
    {
        time_type last = -1;
        for (auto t: times_) {
            if (!std::isfinite(t) || t<0) throw bad_parameters("explicit schedule: times must be >= 0 and finite");
            if (t<last) throw bad_parameters("explicit schedule: times must be sorted");
            last = t;
        }
    }

    void reset() { start_index_ = 0; }

    time_event_span events(time_type t0, time_type t1) {
        time_event_span view = as_time_event_span(times_);

        const time_type* lb = std::lower_bound(view.first+start_index_, view.second, t0);
        const time_type* ub = std::lower_bound(lb, view.second, t1);

        start_index_ = ub-view.first;
        return {lb, ub};
    }

    std::ptrdiff_t start_index_;
    std::vector<time_type> times_;
};

schedule explicit_schedule(const std::vector<time_type>& seq) {
    return schedule(explicit_schedule_impl(seq));
}

} // namespace bes
