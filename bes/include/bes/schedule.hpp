#pragma once

#include <cstddef>
#include <limits>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include <bes/common_types.hpp>

// Time schedules for snapshot markers.
namespace bes {

using time_event_span = std::pair<const time_type*, const time_type*>;

inline time_event_span as_time_event_span(const std::vector<time_type>& v) {
    return {v.data(), v.data() + v.size()};
}

// Type erased wrapper
// A schedule describes a sequence of time values. Schedules are queried
// monotonically in time: if two method calls `events(t0, t1)` and
// `events(t2, t3)` are made without an intervening call to `reset()`,
// then 0 ≤ _t0_ ≤ _t1_ ≤ _t2_ ≤ _t3_.
struct schedule {
    schedule();

    template <typename Impl, typename = std::enable_if_t<!std::is_same_v<std::decay_t<Impl>, schedule>>>
    explicit schedule(const Impl& impl):
        impl_(new wrap<Impl>(impl)) {}

    template <typename Impl, typename = std::enable_if_t<!std::is_same_v<std::decay_t<Impl>, schedule>>>
    explicit schedule(Impl&& impl):
        impl_(new wrap<Impl>(std::move(impl))) {}

    schedule(schedule&& other) = default;
    schedule& operator=(schedule&& other) = default;

    schedule(const schedule& other):
        impl_(other.impl_->clone()) {}

    schedule& operator=(const schedule& other) {
        impl_ = other.impl_->clone();
        return *this;
    }

    // Times in [t0, t1), valid until the next call.
    time_event_span events(time_type t0, time_type t1) { return impl_->events(t0, t1); }

    void reset() { impl_->reset(); }

private:
    struct interface {
        virtual time_event_span events(time_type t0, time_type t1) = 0;
        virtual void reset() = 0;
        virtual std::unique_ptr<interface> clone() = 0;
        virtual ~interface() {}
    };

    using iface_ptr = std::unique_ptr<interface>;

    iface_ptr impl_;

    template <typename Impl>
    struct wrap: interface {
        explicit wrap(const Impl& impl): wrapped(impl) {}
        explicit wrap(Impl&& impl): wrapped(std::move(impl)) {}
        time_event_span events(time_type t0, time_type t1) override { return wrapped.events(t0, t1); }
        void reset() override { wrapped.reset(); }
        iface_ptr clone() override { return std::make_unique<wrap<Impl>>(wrapped); }

        Impl wrapped;
    };
};

// Constructors; times in seconds. Invalid arguments throw bad_parameters.

// Regular schedule with start `t0`, interval `dt`, and optional end `t1`.
schedule regular_schedule(time_type t0, time_type dt,
                          time_type t1 = std::numeric_limits<time_type>::max());

// Regular schedule with interval `dt`.
schedule regular_schedule(time_type dt);

// Schedule at the given sorted, non-negative times.
schedule explicit_schedule(const std::vector<time_type>& seq);

} // namespace bes
