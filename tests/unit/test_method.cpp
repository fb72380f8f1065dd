#include <gtest/gtest.h>
#include <sequence/method.hpp>
#include <sequence/seed.hpp>
#include <core/errors.hpp>
#include <limits>

using namespace chromaseq::sequence;
using Chromaseq::ChromaseqError;
using Chromaseq::ErrorKind;

namespace {

ErrorKind validation_error(const Method& method) {
    try {
        validate(method);
    } catch (const ChromaseqError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "Expected " << method_name(method) << " to be rejected";
    return ErrorKind::MalformedColor;
}

} // namespace

TEST(MethodTest, TagsRoundTrip) {
    for (const auto& tag : method_tags()) {
        EXPECT_EQ(method_name(parse_method(tag)), tag);
    }
    EXPECT_EQ(method_tags().size(), std::variant_size_v<Method>);
    EXPECT_EQ(method_name(parse_method("cf")), "continued_fraction");
}

TEST(MethodTest, UnknownTagRejected) {
    for (const char* tag : {"", "fibonacci", "Golden", "halton "}) {
        try {
            parse_method(tag);
            FAIL() << "Expected UnknownMethod for '" << tag << "'";
        } catch (const ChromaseqError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::UnknownMethod);
        }
    }
}

TEST(MethodTest, DefaultParameters) {
    auto golden = std::get<Golden>(parse_method("golden"));
    EXPECT_DOUBLE_EQ(golden.saturation, 0.7);
    EXPECT_DOUBLE_EQ(golden.lightness, 0.5);

    auto halton = std::get<Halton>(parse_method("halton"));
    EXPECT_EQ(halton.bases, (std::array<uint32_t, 3>{2, 3, 5}));
    EXPECT_EQ(halton.mode, ColorMode::Rgb);

    auto kronecker = std::get<Kronecker>(parse_method("kronecker"));
    EXPECT_NEAR(kronecker.alpha, 1.4142135623730951, 1e-15);
    EXPECT_DOUBLE_EQ(kronecker.lightness, 0.55);

    EXPECT_EQ(std::get<Sobol>(parse_method("sobol")).mode, ColorMode::Hsl);
    EXPECT_EQ(std::get<RSequence>(parse_method("r_sequence")).dim, 3u);
}

TEST(MethodTest, StartIndex) {
    EXPECT_EQ(start_index(Sobol{}), 0u);
    for (const auto& tag : method_tags()) {
        if (tag == "sobol") continue;
        EXPECT_EQ(start_index(parse_method(tag)), 1u) << tag;
    }
}

TEST(MethodTest, DefaultsAreValid) {
    for (const auto& tag : method_tags()) {
        EXPECT_NO_THROW(validate(parse_method(tag))) << tag;
    }
}

TEST(MethodTest, OutOfDomainParametersRejected) {
    EXPECT_EQ(validation_error(Halton{{2, 1, 5}, ColorMode::Rgb}), ErrorKind::InvalidParameter);
    EXPECT_EQ(validation_error(RSequence{0, 0.5}), ErrorKind::InvalidParameter);
    EXPECT_EQ(validation_error(RSequence{chromaseq::math::MAX_R_SEQUENCE_DIM + 1, 0.5}), ErrorKind::InvalidParameter);
    EXPECT_EQ(validation_error(Kronecker{std::numeric_limits<double>::infinity(), 0.7, 0.55}),
              ErrorKind::InvalidParameter);
    EXPECT_EQ(validation_error(Pisot{std::numeric_limits<double>::quiet_NaN(), 0.7, 0.55}),
              ErrorKind::InvalidParameter);
    EXPECT_EQ(validation_error(Golden{1.2, 0.5}), ErrorKind::InvalidParameter);
    EXPECT_EQ(validation_error(Plastic{-0.1}), ErrorKind::InvalidParameter);
}

TEST(MethodTest, ColorModeTags) {
    EXPECT_EQ(parse_color_mode("rgb"), ColorMode::Rgb);
    EXPECT_EQ(parse_color_mode("hsl"), ColorMode::Hsl);
    EXPECT_EQ(to_string(ColorMode::Hsl), "hsl");
    try {
        parse_color_mode("lab");
        FAIL() << "Expected UnknownMethod";
    } catch (const ChromaseqError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownMethod);
    }
}

TEST(SeedTest, AdditiveOffsetIsTheSeed) {
    EXPECT_DOUBLE_EQ(Seed().offset(), 0.0);
    EXPECT_DOUBLE_EQ(Seed(42).offset(), 42.0);
    EXPECT_DOUBLE_EQ(Seed(-7).offset(), -7.0);
}

TEST(SeedTest, ScrambledOffsetInUnitInterval) {
    for (int64_t v : {int64_t{0}, int64_t{1}, int64_t{42}, int64_t{43}, int64_t{-1},
                      std::numeric_limits<int64_t>::max()}) {
        double u = Seed(v, SeedMode::Scrambled).offset();
        EXPECT_GE(u, 0.0);
        EXPECT_LT(u, 1.0);
    }
    EXPECT_NE(Seed(42, SeedMode::Scrambled).offset(), Seed(43, SeedMode::Scrambled).offset());
    EXPECT_DOUBLE_EQ(Seed(42, SeedMode::Scrambled).offset(), Seed(42, SeedMode::Scrambled).offset());
}

TEST(SeedTest, ModeTags) {
    EXPECT_EQ(parse_seed_mode("additive"), SeedMode::Additive);
    EXPECT_EQ(parse_seed_mode("scrambled"), SeedMode::Scrambled);
    EXPECT_EQ(to_string(SeedMode::Scrambled), "scrambled");
    try {
        parse_seed_mode("random");
        FAIL() << "Expected InvalidParameter";
    } catch (const ChromaseqError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidParameter);
    }
}
