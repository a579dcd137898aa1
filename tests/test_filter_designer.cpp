#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include "filter_designer.hpp"
#include "transcode_error.hpp"

using namespace Wav2Ulaw;

namespace {

const double kHalfPower = 1.0 / std::sqrt(2.0);

FilterSpec make_spec(FilterFamily family, FilterResponse response, double cutoff, int order) {
    FilterSpec spec;
    spec.family = family;
    spec.response = response;
    spec.cutoff_hz = cutoff;
    spec.order = order;
    return spec;
}

} // namespace

TEST(FilterDesignerTest, ButterworthLowPassHalfPowerAtCutoff) {
    FilterDesigner designer;
    for (int order : {2, 4, 6}) {
        FilterDesign design = designer.design(
            make_spec(FilterFamily::Butterworth, FilterResponse::LowPass, 1000.0, order), 44100.0);

        EXPECT_EQ(design.sections().size(), static_cast<size_t>(order / 2));
        EXPECT_NEAR(design.magnitude_at(1000.0), kHalfPower, 1e-6) << "order " << order;
        EXPECT_NEAR(design.magnitude_at(1.0), 1.0, 1e-4);
        EXPECT_LT(design.magnitude_at(10000.0), 0.01);
    }
}

TEST(FilterDesignerTest, ButterworthHighPassMirrorsLowPass) {
    FilterDesigner designer;
    FilterDesign design = designer.design(
        make_spec(FilterFamily::Butterworth, FilterResponse::HighPass, 1000.0, 4), 44100.0);

    EXPECT_NEAR(design.magnitude_at(1000.0), kHalfPower, 1e-6);
    EXPECT_NEAR(design.magnitude_at(20000.0), 1.0, 1e-3);
    EXPECT_LT(design.magnitude_at(50.0), 1e-3);
}

TEST(FilterDesignerTest, ChebyshevSitsOnRippleFloorAtCutoff) {
    FilterDesigner designer;
    FilterSpec spec = make_spec(FilterFamily::Chebyshev1, FilterResponse::LowPass, 1000.0, 4);
    spec.ripple_db = 1.0;
    FilterDesign design = designer.design(spec, 44100.0);

    const double floor = std::pow(10.0, -1.0 / 20.0);
    EXPECT_NEAR(design.magnitude_at(1000.0), floor, 1e-4);
    // Even order starts at the bottom of the ripple band
    EXPECT_NEAR(design.magnitude_at(0.5), floor, 1e-4);

    double passband_max = 0.0;
    for (double f = 1.0; f < 1000.0; f += 1.0) {
        passband_max = std::max(passband_max, design.magnitude_at(f));
    }
    EXPECT_NEAR(passband_max, 1.0, 1e-3);
    EXPECT_LE(passband_max, 1.0 + 1e-6);

    EXPECT_LT(design.magnitude_at(5000.0), 0.01);
}

TEST(FilterDesignerTest, ChebyshevHighPassRippleFloorAtCutoff) {
    FilterDesigner designer;
    FilterSpec spec = make_spec(FilterFamily::Chebyshev1, FilterResponse::HighPass, 2000.0, 6);
    spec.ripple_db = 0.5;
    FilterDesign design = designer.design(spec, 48000.0);

    EXPECT_NEAR(design.magnitude_at(2000.0), std::pow(10.0, -0.5 / 20.0), 1e-4);
    EXPECT_LT(design.magnitude_at(200.0), 1e-3);
}

TEST(FilterDesignerTest, BesselPrototypeMatchesReference) {
    // Second-order Bessel normalized for -3 dB at unit frequency
    std::vector<std::complex<double>> poles = FilterDesigner::prototype_poles(FilterFamily::Bessel, 2);
    ASSERT_EQ(poles.size(), 1u);
    EXPECT_NEAR(poles[0].real(), -1.1016, 1e-3);
    EXPECT_NEAR(std::abs(poles[0].imag()), 0.6360, 1e-3);
}

TEST(FilterDesignerTest, BesselHalfPowerAtCutoff) {
    FilterDesigner designer;
    for (int order : {2, 4, 6}) {
        FilterDesign design = designer.design(
            make_spec(FilterFamily::Bessel, FilterResponse::LowPass, 3000.0, order), 44100.0);
        EXPECT_NEAR(design.magnitude_at(3000.0), kHalfPower, 1e-4) << "order " << order;
        EXPECT_NEAR(design.magnitude_at(1.0), 1.0, 1e-4);
    }
}

TEST(FilterDesignerTest, PoleDesignsAreStable) {
    FilterDesigner designer;
    for (FilterFamily family : {FilterFamily::Butterworth, FilterFamily::Bessel, FilterFamily::Chebyshev1}) {
        for (FilterResponse response : {FilterResponse::LowPass, FilterResponse::HighPass}) {
            FilterSpec spec = make_spec(family, response, 15000.0, 6);
            if (family == FilterFamily::Chebyshev1) {
                spec.ripple_db = 3.0;
            }
            FilterDesign design = designer.design(spec, 44100.0);
            for (const auto& section : design.sections()) {
                EXPECT_LT(std::abs(section.a2), 1.0);
                EXPECT_LT(std::abs(section.a1), 1.0 + section.a2);
            }
        }
    }
}

TEST(FilterDesignerTest, SimpleFamilyIsCascadedRcStages) {
    FilterDesigner designer;
    const double rc = 1.0 / (2.0 * 3.14159265358979323846 * 1000.0);
    const double dt = 1.0 / 8000.0;

    FilterDesign low = designer.design(make_spec(FilterFamily::Simple, FilterResponse::LowPass, 1000.0, 4), 8000.0);
    ASSERT_EQ(low.sections().size(), 2u);
    const double alpha = dt / (rc + dt);
    EXPECT_NEAR(low.sections()[0].b0, alpha, 1e-12);
    EXPECT_NEAR(low.sections()[0].a1, -(1.0 - alpha), 1e-12);
    EXPECT_DOUBLE_EQ(low.sections()[0].b2, 0.0);
    EXPECT_NEAR(low.magnitude_at(0.0), 1.0, 1e-12);

    FilterDesign high = designer.design(make_spec(FilterFamily::Simple, FilterResponse::HighPass, 1000.0, 2), 8000.0);
    ASSERT_EQ(high.sections().size(), 1u);
    const double beta = rc / (rc + dt);
    EXPECT_NEAR(high.sections()[0].b0, beta, 1e-12);
    EXPECT_NEAR(high.sections()[0].b1, -beta, 1e-12);
    EXPECT_NEAR(high.sections()[0].a1, -beta, 1e-12);
    EXPECT_NEAR(high.magnitude_at(0.0), 0.0, 1e-12);
}

TEST(FilterDesignerTest, ProcessMatchesImpulseResponseOfCoefficients) {
    FilterDesigner designer;
    FilterDesign design = designer.design(
        make_spec(FilterFamily::Butterworth, FilterResponse::LowPass, 2000.0, 2), 16000.0);
    const BiquadCoefficients& c = design.sections()[0];

    std::vector<float> impulse(4, 0.0f);
    impulse[0] = 1.0f;
    FilterState state = design.create_state();
    design.process(impulse, state);

    double y0 = c.b0;
    double y1 = c.b1 - c.a1 * y0;
    double y2 = c.b2 - c.a1 * y1 - c.a2 * y0;
    EXPECT_NEAR(impulse[0], y0, 1e-6);
    EXPECT_NEAR(impulse[1], y1, 1e-6);
    EXPECT_NEAR(impulse[2], y2, 1e-6);
}

TEST(FilterDesignerTest, RejectsUnrealizableSpecs) {
    FilterDesigner designer;

    EXPECT_THROW(designer.design(make_spec(FilterFamily::Butterworth, FilterResponse::LowPass, 0.0, 4), 8000.0),
                 ConfigError);
    EXPECT_THROW(designer.design(make_spec(FilterFamily::Butterworth, FilterResponse::LowPass, 4000.0, 4), 8000.0),
                 ConfigError);
    EXPECT_THROW(designer.design(make_spec(FilterFamily::Butterworth, FilterResponse::LowPass, 1000.0, 3), 8000.0),
                 ConfigError);
    EXPECT_THROW(designer.design(make_spec(FilterFamily::Butterworth, FilterResponse::LowPass, 1000.0, 0), 8000.0),
                 ConfigError);
    EXPECT_THROW(designer.design(make_spec(FilterFamily::Butterworth, FilterResponse::LowPass, 1000.0,
                                           FilterDesigner::kMaxOrder + 2), 8000.0),
                 ConfigError);
}

TEST(FilterDesignerTest, SimpleStagesAcceptCutoffAboveNyquist) {
    FilterDesigner designer;

    // 3400 Hz RC low-pass on 6 kHz audio: stable, unity gain at DC
    FilterDesign design = designer.design(
        make_spec(FilterFamily::Simple, FilterResponse::LowPass, 3400.0, 2), 6000.0);
    ASSERT_EQ(design.sections().size(), 1u);
    EXPECT_GT(design.sections()[0].b0, 0.0);
    EXPECT_LT(design.sections()[0].b0, 1.0);
    EXPECT_NEAR(design.magnitude_at(0.0), 1.0, 1e-9);
    EXPECT_LT(design.magnitude_at(2999.0), 1.0);

    EXPECT_NO_THROW(designer.design(
        make_spec(FilterFamily::Simple, FilterResponse::HighPass, 5000.0, 2), 6000.0));
    EXPECT_THROW(designer.design(
        make_spec(FilterFamily::Bessel, FilterResponse::LowPass, 3400.0, 2), 6000.0), ConfigError);
}

TEST(FilterDesignerTest, ChebyshevRequiresPositiveRipple) {
    FilterDesigner designer;
    FilterSpec spec = make_spec(FilterFamily::Chebyshev1, FilterResponse::LowPass, 1000.0, 4);

    EXPECT_THROW(designer.design(spec, 8000.0), ConfigError);

    spec.ripple_db = 0.0;
    EXPECT_THROW(designer.design(spec, 8000.0), ConfigError);

    spec.ripple_db = -1.0;
    EXPECT_THROW(designer.design(spec, 8000.0), ConfigError);

    spec.ripple_db = 0.5;
    EXPECT_NO_THROW(designer.design(spec, 8000.0));
}

TEST(FilterDesignerTest, RippleOnOtherFamiliesDependsOnStrictness) {
    FilterSpec spec = make_spec(FilterFamily::Butterworth, FilterResponse::LowPass, 1000.0, 4);
    spec.ripple_db = 0.5;

    FilterDesigner strict_designer(true);
    EXPECT_THROW(strict_designer.design(spec, 8000.0), ConfigError);

    FilterDesigner lenient_designer(false);
    FilterDesign design = lenient_designer.design(spec, 8000.0);
    EXPECT_FALSE(design.spec().ripple_db.has_value());
    EXPECT_NEAR(design.magnitude_at(1000.0), kHalfPower, 1e-6);
}

TEST(FilterDesignerTest, ParsesFamilyCodesAndNames) {
    FilterFamily family = FilterFamily::Simple;

    EXPECT_TRUE(FilterDesigner::parse_family("3", family));
    EXPECT_EQ(family, FilterFamily::Chebyshev1);
    EXPECT_TRUE(FilterDesigner::parse_family("Bessel", family));
    EXPECT_EQ(family, FilterFamily::Bessel);
    EXPECT_TRUE(FilterDesigner::parse_family("0", family));
    EXPECT_EQ(family, FilterFamily::Simple);

    EXPECT_FALSE(FilterDesigner::parse_family("9", family));
    EXPECT_FALSE(FilterDesigner::parse_family("elliptic", family));
    EXPECT_FALSE(FilterDesigner::family_from_code(-1, family));

    EXPECT_EQ(FilterDesigner::family_name(FilterFamily::Butterworth), "butterworth");
}
