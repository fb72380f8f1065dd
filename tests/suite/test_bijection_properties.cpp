/**
 * @file test_bijection_properties.cpp
 * @brief Property tests: index → hex → index round trips, seed separation,
 *        uniformity and collision bounds
 */

#include <gtest/gtest.h>
#include <inversion/color_inverter.hpp>
#include <sequence/sequence_generator.hpp>
#include <color/color_space.hpp>
#include <ostream>
#include <set>
#include <string>
#include <vector>

using namespace Chromaseq;
using namespace chromaseq::sequence;
using chromaseq::color::RGB;
using chromaseq::color::color_distance;

namespace {

struct RoundTripCase {
    const char* label;
    Method method;
    Seed seed;
};

void PrintTo(const RoundTripCase& c, std::ostream* os) { *os << c.label; }

class RoundTripTest : public ::testing::TestWithParam<RoundTripCase> {};

} // namespace

TEST_P(RoundTripTest, EveryHexRecovered) {
    const RoundTripCase& c = GetParam();

    int failures = 0;
    for (uint32_t n = 1; n <= 1000; ++n) {
        const std::string hex = SequenceGenerator::hex(c.method, n, c.seed);
        InversionResult result = ColorInverter::invert_hex(hex, c.method, c.seed);
        if (!result.found || *result.index != n) {
            if (++failures <= 5) ADD_FAILURE() << c.label << ": " << hex << " did not map back to " << n;
        }
    }
    EXPECT_EQ(failures, 0);
}

INSTANTIATE_TEST_SUITE_P(
    Methods, RoundTripTest,
    ::testing::Values(
        RoundTripCase{"plastic_seed0", Plastic{}, Seed(0)},
        RoundTripCase{"plastic_seed42", Plastic{}, Seed(42)},
        RoundTripCase{"plastic_scrambled42", Plastic{}, Seed(42, SeedMode::Scrambled)},
        RoundTripCase{"halton_seed0", Halton{}, Seed(0)},
        RoundTripCase{"halton_seed42", Halton{}, Seed(42)},
        RoundTripCase{"halton_scrambled42", Halton{}, Seed(42, SeedMode::Scrambled)}
    ),
    [](const ::testing::TestParamInfo<RoundTripCase>& info) { return std::string(info.param.label); });

TEST(BijectionPropertiesTest, HueOnlyMethodsLoseIndicesToQuantization) {
    // A 1D hue sequence comes back within 0.01 after its near-return period
    // (233 for φ, 169 for √2); from there on the hex maps to the earlier index.
    const struct {
        Method method;
        uint32_t period;
    } cases[] = {{Golden{}, 233}, {Kronecker{}, 169}};

    for (const auto& c : cases) {
        for (uint32_t n = 1; n <= c.period; ++n) {
            InversionResult result = ColorInverter::invert_hex(SequenceGenerator::hex(c.method, n), c.method, Seed());
            ASSERT_TRUE(result.found) << method_name(c.method) << " n=" << n;
            EXPECT_EQ(*result.index, n) << method_name(c.method);
        }
        InversionResult wrapped = ColorInverter::invert_hex(
            SequenceGenerator::hex(c.method, c.period + 1), c.method, Seed());
        ASSERT_TRUE(wrapped.found);
        EXPECT_EQ(*wrapped.index, 1u) << method_name(c.method);
    }
}

TEST(BijectionPropertiesTest, ContinuousColorsRecoveredUnderNearest) {
    InversionOptions options{10000, 0.01, MatchPolicy::Nearest};
    for (const Method& method : {Method(Golden{}), Method(Kronecker{})}) {
        const auto generator = SequenceGenerator::bind(method, Seed(42));
        int failures = 0;
        for (uint32_t n = 1; n <= 1000; ++n) {
            InversionResult result = ColorInverter::invert(generator(n), method, Seed(42), options);
            if (!result.found || *result.index != n) ++failures;
        }
        EXPECT_EQ(failures, 0) << method_name(method);
    }
}

TEST(BijectionPropertiesTest, ReferenceScenario) {
    EXPECT_EQ(SequenceGenerator::hex(Plastic{}, 1, Seed(42)), "#851BE4");
    EXPECT_EQ(SequenceGenerator::hex(Plastic{}, 69, Seed(42)), "#D4832B");

    for (MatchPolicy policy : {MatchPolicy::Nearest, MatchPolicy::FirstWithinTolerance}) {
        InversionOptions options{10000, 0.01, policy};
        EXPECT_EQ(ColorInverter::invert_hex("#851BE4", Plastic{}, Seed(42), options).index, 1u);
        EXPECT_EQ(ColorInverter::invert_hex("#D4832B", Plastic{}, Seed(42), options).index, 69u);
    }

    EXPECT_EQ(chromaseq::color::rgb_to_hex(chromaseq::color::hex_to_rgb("#851BE4")), "#851BE4");
}

TEST(BijectionPropertiesTest, AdditiveIntegerSeedsDoNotSeparate) {
    // frac(s + x) with integer s only moves x by rounding error
    const Method methods[] = {Golden{}, Plastic{}, Halton{}, Kronecker{}};
    for (const auto& method : methods) {
        for (uint32_t n = 1; n <= 200; ++n) {
            const std::string base = SequenceGenerator::hex(method, n, Seed(0));
            EXPECT_EQ(SequenceGenerator::hex(method, n, Seed(42)), base) << method_name(method) << " n=" << n;
            EXPECT_EQ(SequenceGenerator::hex(method, n, Seed(1000000)), base) << method_name(method) << " n=" << n;
        }
    }
}

TEST(BijectionPropertiesTest, ScrambledSeedsSeparateEveryMethod) {
    const Method methods[] = {Golden{}, Plastic{}, Halton{}, RSequence{}, Kronecker{}, Sobol{}, Pisot{},
                              ContinuedFraction{}};
    const Seed a(0, SeedMode::Scrambled);
    const Seed b(1, SeedMode::Scrambled);
    for (const auto& method : methods) {
        for (uint32_t n = 1; n <= 20; ++n) {
            EXPECT_NE(SequenceGenerator::hex(method, n, a), SequenceGenerator::hex(method, n, b))
                << method_name(method) << " n=" << n;
        }
    }
}

TEST(BijectionPropertiesTest, Uniformity) {
    std::vector<RGB> colors;
    for (uint32_t n = 1; n <= 100; ++n) colors.push_back(SequenceGenerator::plastic_color(n));

    double total = 0.0;
    int pairs = 0;
    for (std::size_t i = 0; i < colors.size(); ++i) {
        for (std::size_t j = i + 1; j < colors.size(); ++j) {
            total += color_distance(colors[i], colors[j]);
            ++pairs;
        }
    }
    EXPECT_GT(total / pairs, 0.3);
}

TEST(BijectionPropertiesTest, FewHexCollisions) {
    std::set<std::string> seen;
    for (const auto& hex : SequenceGenerator::generate_hex(Plastic{}, Seed(42), 1000)) seen.insert(hex);
    EXPECT_GT(seen.size(), 990u);
}

TEST(BijectionPropertiesTest, ParallelInversionMatchesSerial) {
    InversionOptions options;
    options.policy = MatchPolicy::Nearest;
    for (uint32_t n : {3u, 777u, 1000u}) {
        RGB target = SequenceGenerator::kronecker_color(n, Seed(42));
        auto serial = ColorInverter::invert(target, Kronecker{}, Seed(42), options);
        auto parallel = ColorInverter::invert_parallel(target, Kronecker{}, Seed(42), options);
        EXPECT_EQ(parallel.index, serial.index);
        EXPECT_DOUBLE_EQ(parallel.distance, serial.distance);
        EXPECT_EQ(serial.index, n);
    }
}
