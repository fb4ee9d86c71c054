#include <algorithm>
#include <iterator>
#include <random>
#include <vector>

#include <bes/besexcept.hpp>
#include <bes/common_types.hpp>
#include <bes/schedule.hpp>

#include "common.hpp"

using namespace bes;

static std::vector<time_type> as_vector(time_event_span ts) {
    return std::vector<time_type>(ts.first, ts.second);
}

// Take events from n contiguous intervals comprising [t0, t1), reset, and
// then compare with events taken from a different set of contiguous
// intervals comprising [t0, t1).

void run_reset_check(schedule S, time_type t0, time_type t1, unsigned n, int seed=0) {
    if (!n) return;

    std::minstd_rand R(seed);
    std::uniform_real_distribution<time_type> U(t0, t1);

    auto divisions = [&]() {
        std::vector<time_type> div = {t0, t1};
        std::generate_n(std::back_inserter(div), n-1, [&] { return U(R); });
        std::sort(div.begin(), div.end());
        return div;
    };

    auto collect = [&S](const std::vector<time_type>& div) {
        std::vector<time_type> out;
        for (std::size_t i=0; i+1<div.size(); ++i) {
            auto ts = as_vector(S.events(div[i], div[i+1]));
            EXPECT_TRUE(std::is_sorted(ts.begin(), ts.end()));
            if (!ts.empty()) {
                EXPECT_LE(div[i], ts.front());
                EXPECT_GT(div[i+1], ts.back());
            }
            out.insert(out.end(), ts.begin(), ts.end());
        }
        return out;
    };

    auto first = collect(divisions());
    S.reset();
    auto second = collect(divisions());

    EXPECT_EQ(first, second);
}

TEST(schedule, regular) {
    // Use exact fp representations for strict equality testing.
    std::vector<time_type> expected = {0, 0.25, 0.5, 0.75, 1.0};

    schedule S = regular_schedule(0.25);
    EXPECT_EQ(expected, as_vector(S.events(0, 1.25)));

    S.reset();
    EXPECT_EQ(expected, as_vector(S.events(0, 1.25)));

    S.reset();
    expected = {0.25, 0.5, 0.75, 1.0};
    EXPECT_EQ(expected, as_vector(S.events(0.1, 1.01)));

    // Bounded schedule.
    S = regular_schedule(0.5, 0.25, 1.0);
    expected = {0.5, 0.75};
    EXPECT_EQ(expected, as_vector(S.events(0, 2)));

    // Queries may start before zero.
    S = regular_schedule(0.25);
    expected = {0};
    EXPECT_EQ(expected, as_vector(S.events(-0.125, 0.125)));
}

TEST(schedule, regular_reset) {
    SCOPED_TRACE("regular_reset");
    run_reset_check(regular_schedule(0.3), 3, 12, 7);
}

TEST(schedule, regular_rounding) {
    // Test for consistent behaviour in the face of rounding at large time values.
    time_type t1 = 1802667.f;
    time_type dt = 0.024999f;

    time_type t0 = t1-10*dt;
    time_type t2 = t1+10*dt;

    schedule S = regular_schedule(t0, dt);
    auto int_l = as_vector(S.events(t0, t1));
    auto int_r = as_vector(S.events(t1, t2));

    S.reset();
    auto int_a = as_vector(S.events(t0, t2));

    EXPECT_GE(int_l.front(), t0);
    EXPECT_LT(int_l.back(), t1);

    EXPECT_GE(int_r.front(), t1);
    EXPECT_LT(int_r.back(), t2);

    std::vector<time_type> int_merged = int_l;
    int_merged.insert(int_merged.end(), int_r.begin(), int_r.end());

    EXPECT_EQ(int_merged, int_a);
    EXPECT_TRUE(std::is_sorted(int_a.begin(), int_a.end()));
}

TEST(schedule, explicit_schedule) {
    std::vector<time_type> times = {0.1, 0.3, 1.0, 1.25, 1.7, 2.2};
    std::vector<time_type> expected = {0.1, 0.3, 1.0};

    schedule S = explicit_schedule(times);
    EXPECT_EQ(expected, as_vector(S.events(0, 1.25)));

    S.reset();
    EXPECT_EQ(expected, as_vector(S.events(0, 1.25)));

    S.reset();
    expected = {0.3, 1.0, 1.25, 1.7};
    EXPECT_EQ(expected, as_vector(S.events(0.3, 1.71)));
}

TEST(schedule, explicit_reset) {
    SCOPED_TRACE("explicit_reset");

    std::vector<time_type> times = {0.1, 0.3, 1.0, 1.25, 1.7, 2.2, 5.5, 7.0, 11.0};
    run_reset_check(explicit_schedule(times), 0, 12, 7);
}

TEST(schedule, empty) {
    schedule S;
    EXPECT_TRUE(as_vector(S.events(0, 100)).empty());

    // Copies are independent.
    schedule R = explicit_schedule({1., 2., 3.});
    schedule Q = R;
    EXPECT_EQ(2u, as_vector(R.events(0, 2.5)).size());
    EXPECT_EQ(3u, as_vector(Q.events(0, 5)).size());
}

TEST(schedule, bad_parameters) {
    EXPECT_THROW(regular_schedule(0), bad_parameters);
    EXPECT_THROW(regular_schedule(-1, 0.1), bad_parameters);
    EXPECT_THROW(regular_schedule(1, 0.1, 0.5), bad_parameters);
    EXPECT_THROW(explicit_schedule({1., 0.5}), bad_parameters);
    EXPECT_THROW(explicit_schedule({-1.}), bad_parameters);
}
