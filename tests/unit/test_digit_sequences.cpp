/**
 * @file test_digit_sequences.cpp
 * @brief Unit tests for van der Corput, Halton and Sobol coordinates
 */

#include <gtest/gtest.h>
#include <sequence/digit_sequences.hpp>
#include <core/errors.hpp>
#include <cmath>
#include <set>

using namespace chromaseq::sequence;
using Chromaseq::ChromaseqError;
using Chromaseq::ErrorKind;

TEST(DigitSequenceTest, VanDerCorputBase2) {
    EXPECT_DOUBLE_EQ(van_der_corput(0, 2), 0.0);
    EXPECT_DOUBLE_EQ(van_der_corput(1, 2), 0.5);
    EXPECT_DOUBLE_EQ(van_der_corput(2, 2), 0.25);
    EXPECT_DOUBLE_EQ(van_der_corput(3, 2), 0.75);
    EXPECT_DOUBLE_EQ(van_der_corput(5, 2), 0.625);
}

TEST(DigitSequenceTest, VanDerCorputOtherBases) {
    EXPECT_NEAR(van_der_corput(1, 3), 1.0 / 3.0, 1e-15);
    EXPECT_NEAR(van_der_corput(4, 3), 4.0 / 9.0, 1e-15);
    // 7 = 12 in base 5
    EXPECT_NEAR(van_der_corput(7, 5), 2.0 / 5.0 + 1.0 / 25.0, 1e-15);
    EXPECT_DOUBLE_EQ(halton(5, 2), van_der_corput(5, 2));
}

TEST(DigitSequenceTest, VanDerCorputFirstBlockIsPermutation) {
    // n = 0..b^k-1 hits every multiple of b^-k exactly once
    std::set<long> seen;
    for (uint64_t n = 0; n < 81; ++n) {
        double x = van_der_corput(n, 3);
        ASSERT_GE(x, 0.0);
        ASSERT_LT(x, 1.0);
        seen.insert(std::lround(x * 81.0));
    }
    EXPECT_EQ(seen.size(), 81u);
}

TEST(DigitSequenceTest, BaseBelowTwoRejected) {
    for (uint32_t base : {0u, 1u}) {
        try {
            van_der_corput(7, base);
            FAIL() << "Expected InvalidParameter for base " << base;
        } catch (const ChromaseqError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidParameter);
        }
    }
}

TEST(DigitSequenceTest, GrayCode) {
    EXPECT_EQ(gray_code(0), 0u);
    EXPECT_EQ(gray_code(1), 1u);
    EXPECT_EQ(gray_code(2), 3u);
    EXPECT_EQ(gray_code(3), 2u);
    EXPECT_EQ(gray_code(4), 6u);

    // Consecutive codes differ in exactly one bit
    for (uint64_t n = 0; n < 1024; ++n) {
        uint64_t diff = gray_code(n) ^ gray_code(n + 1);
        EXPECT_EQ(diff & (diff - 1), 0u);
        EXPECT_NE(diff, 0u);
    }
}

TEST(DigitSequenceTest, SobolDirectionNumbers) {
    for (uint32_t dim = 1; dim <= SobolDirections::MAX_DIMENSION; ++dim) {
        const auto& v = SobolDirections::table(dim);
        EXPECT_EQ(v[0], 1u << 29) << "dim=" << dim;
        for (uint32_t x : v) {
            EXPECT_LT(x, 1u << SobolDirections::BITS);
        }
    }
    // Dimensions past the table reuse the last polynomial
    EXPECT_EQ(&SobolDirections::table(9), &SobolDirections::table(SobolDirections::MAX_DIMENSION));
    EXPECT_EQ(&SobolDirections::table(0), &SobolDirections::table(1));
}

TEST(DigitSequenceTest, SobolPoints) {
    for (uint32_t dim = 1; dim <= 3; ++dim) {
        EXPECT_DOUBLE_EQ(sobol_point(0, dim), 0.0);
        EXPECT_DOUBLE_EQ(sobol_point(1, dim), 0.5);
    }
    EXPECT_DOUBLE_EQ(sobol_point(2, 1), 0.25);
    EXPECT_DOUBLE_EQ(sobol_point(2, 2), 0.75);

    for (uint64_t n = 0; n < 4096; ++n) {
        double x = sobol_point(n, 3);
        EXPECT_GE(x, 0.0);
        EXPECT_LT(x, 1.0);
    }
}
