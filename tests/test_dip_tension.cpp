#include <gtest/gtest.h>
#include "wiresag/dip_tension.hpp"
#include <cmath>

using namespace wiresag;

// ---- Reference values ----

TEST(DipTension, DipReferenceCase) {
    EXPECT_DOUBLE_EQ(compute_dip(1.0, 50.0, 1000.0), 0.3125);
}

TEST(DipTension, TensionReferenceCase) {
    EXPECT_DOUBLE_EQ(compute_tension(1.0, 50.0, 0.5), 625.0);
}

TEST(DipTension, DipScalesWithSpanSquared) {
    double d1 = compute_dip(3.34, 50.0, 9800.0);
    double d2 = compute_dip(3.34, 100.0, 9800.0);
    EXPECT_NEAR(d2 / d1, 4.0, 1e-12);
}

TEST(DipTension, RoundTrip) {
    const double weights[] = {0.5, 1.0, 3.34, 6.03};
    const double spans[] = {10.0, 50.0, 120.0};
    const double dips[] = {0.05, 0.3125, 1.8};
    for (double w : weights) {
        for (double s : spans) {
            for (double d : dips) {
                double t = compute_tension(w, s, d);
                EXPECT_NEAR(compute_dip(w, s, t), d, d * 1e-12)
                    << "w=" << w << " S=" << s << " D=" << d;
            }
        }
    }
}

// ---- Argument validation ----

TEST(DipTension, DipRejectsNonPositive) {
    EXPECT_THROW(compute_dip(-1.0, 50.0, 1000.0), std::invalid_argument);
    EXPECT_THROW(compute_dip(0.0, 50.0, 1000.0), std::invalid_argument);
    EXPECT_THROW(compute_dip(1.0, 0.0, 1000.0), std::invalid_argument);
    EXPECT_THROW(compute_dip(1.0, -50.0, 1000.0), std::invalid_argument);
    EXPECT_THROW(compute_dip(1.0, 50.0, 0.0), std::invalid_argument);
    EXPECT_THROW(compute_dip(1.0, 50.0, -1000.0), std::invalid_argument);
}

TEST(DipTension, TensionRejectsNonPositive) {
    EXPECT_THROW(compute_tension(-1.0, 50.0, 0.5), std::invalid_argument);
    EXPECT_THROW(compute_tension(0.0, 50.0, 0.5), std::invalid_argument);
    EXPECT_THROW(compute_tension(1.0, 0.0, 0.5), std::invalid_argument);
    EXPECT_THROW(compute_tension(1.0, -50.0, 0.5), std::invalid_argument);
    EXPECT_THROW(compute_tension(1.0, 50.0, 0.0), std::invalid_argument);
    EXPECT_THROW(compute_tension(1.0, 50.0, -0.5), std::invalid_argument);
}

TEST(DipTension, RejectsNaN) {
    EXPECT_THROW(compute_dip(std::nan(""), 50.0, 1000.0), std::invalid_argument);
    EXPECT_THROW(compute_tension(1.0, 50.0, std::nan("")), std::invalid_argument);
}

// ---- compute_dip_or_tension ----

TEST(DipTension, EitherFromTension) {
    auto r = compute_dip_or_tension(1.0, 50.0, std::nullopt, 1000.0);
    EXPECT_DOUBLE_EQ(r.dip, 0.3125);
    EXPECT_DOUBLE_EQ(r.tension, 1000.0);
}

TEST(DipTension, EitherFromDip) {
    auto r = compute_dip_or_tension(1.0, 50.0, 0.5, std::nullopt);
    EXPECT_DOUBLE_EQ(r.dip, 0.5);
    EXPECT_DOUBLE_EQ(r.tension, 625.0);
}

TEST(DipTension, EitherRejectsNeither) {
    EXPECT_THROW(compute_dip_or_tension(1.0, 50.0, std::nullopt, std::nullopt),
                 std::invalid_argument);
}

TEST(DipTension, EitherRejectsBoth) {
    EXPECT_THROW(compute_dip_or_tension(1.0, 50.0, 0.5, 1000.0), std::invalid_argument);
}

TEST(DipTension, EitherRejectsNonPositiveSupplied) {
    EXPECT_THROW(compute_dip_or_tension(1.0, 50.0, 0.0, std::nullopt), std::invalid_argument);
    EXPECT_THROW(compute_dip_or_tension(1.0, 50.0, std::nullopt, -10.0), std::invalid_argument);
    EXPECT_THROW(compute_dip_or_tension(0.0, 50.0, std::nullopt, 1000.0), std::invalid_argument);
    EXPECT_THROW(compute_dip_or_tension(1.0, 0.0, 0.5, std::nullopt), std::invalid_argument);
}
