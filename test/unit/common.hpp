#pragma once

/*
 * Convenience functions, structs used across
 * more than one unit test.
 */

#include <algorithm>
#include <cmath>
#include <string>
#include <type_traits>
#include <utility>

#include <gtest/gtest.h>

// Pair printer.

namespace std {
    template <typename A, typename B>
    std::ostream& operator<<(std::ostream& out, const std::pair<A, B>& p) {
        return out << '(' << p.first << ',' << p.second << ')';
    }
}

namespace testing {

// Google Test assertion-returning predicates:

// Assert two values are 'almost equal', with exact test for non-floating point types.
// (Uses internal class `FloatingPoint` from gtest.)

template <typename FPType>
::testing::AssertionResult almost_eq_(FPType a, FPType b, std::true_type) {
    using FP = testing::internal::FloatingPoint<FPType>;

    if ((std::isnan(a) && std::isnan(b)) || FP{a}.AlmostEquals(FP{b})) {
        return ::testing::AssertionSuccess();
    }

    return ::testing::AssertionFailure() << "floating point numbers " << a << " and " << b << " differ";
}

template <typename X>
::testing::AssertionResult almost_eq_(const X& a, const X& b, std::false_type) {
    if (a==b) {
        return ::testing::AssertionSuccess();
    }

    return ::testing::AssertionFailure() << "values " << a << " and " << b << " differ";
}

template <typename X>
::testing::AssertionResult almost_eq(const X& a, const X& b) {
    return almost_eq_(a, b, typename std::is_floating_point<X>::type{});
}

// Assert two sequences of floating point values are almost equal, with explicit
// specification of floating point type.

template <typename FPType, typename Seq1, typename Seq2>
::testing::AssertionResult seq_almost_eq(Seq1&& seq1, Seq2&& seq2) {
    using std::begin;
    using std::end;

    auto i1 = begin(seq1);
    auto i2 = begin(seq2);

    auto e1 = end(seq1);
    auto e2 = end(seq2);

    for (std::size_t j = 0; i1!=e1 && i2!=e2; ++i1, ++i2, ++j) {

        auto v1 = *i1;
        auto v2 = *i2;

        // Cast to FPType to avoid warnings about lowering conversion
        // if FPType has lower precision than Seq{12}::value_type.

        auto status = almost_eq((FPType)(v1), (FPType)(v2));
        if (!status) return status << " at index " << j;
    }

    if (i1!=e1 || i2!=e2) {
        return ::testing::AssertionFailure() << "sequences differ in length";
    }
    return ::testing::AssertionSuccess();
}

// Assert |a-b| <= tol*max(|a|, |b|, floor).
inline ::testing::AssertionResult near_relative(double a, double b, double tol, double floor = 0) {
    double scale = std::max({std::abs(a), std::abs(b), floor});
    if (std::abs(a-b)<=tol*scale) {
        return ::testing::AssertionSuccess();
    }
    return ::testing::AssertionFailure() << "values " << a << " and " << b
        << " differ by more than relative tolerance " << tol;
}

} // namespace testing
