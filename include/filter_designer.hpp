#pragma once

#include <complex>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace Wav2Ulaw {

/**
 * Filter families available for band limiting and anti-aliasing.
 * The numeric values are the command-line codes.
 */
enum class FilterFamily {
    Simple = 0,       // RC one-pole, cascaded order/2 times
    Butterworth = 1,  // maximally flat magnitude
    Bessel = 2,       // maximally flat group delay
    Chebyshev1 = 3    // passband ripple, steepest roll-off
};

enum class FilterResponse {
    LowPass,
    HighPass
};

/**
 * Requested filter. Only Chebyshev1 consumes ripple_db.
 */
struct FilterSpec {
    FilterFamily family = FilterFamily::Butterworth;
    FilterResponse response = FilterResponse::LowPass;
    double cutoff_hz = 0.0;
    int order = 2;
    std::optional<double> ripple_db;
};

/**
 * One second-order section, a0 normalized to 1:
 * y[n] = b0*x[n] + b1*x[n-1] + b2*x[n-2] - a1*y[n-1] - a2*y[n-2]
 */
struct BiquadCoefficients {
    double b0 = 1.0;
    double b1 = 0.0;
    double b2 = 0.0;
    double a1 = 0.0;
    double a2 = 0.0;
};

// Transposed direct form II delay line of one section
struct BiquadState {
    double z1 = 0.0;
    double z2 = 0.0;
};

/**
 * Mutable history of one realized filter. Owned by the caller and passed
 * into every process() call; handing the same state to consecutive
 * chunks continues the filter without discontinuity.
 */
struct FilterState {
    std::vector<BiquadState> sections;

    void reset();
};

/**
 * A designed filter: cascaded biquads at a fixed sample rate.
 */
class FilterDesign {
public:
    FilterDesign(const FilterSpec& spec, double sample_rate, std::vector<BiquadCoefficients> sections);

    const FilterSpec& spec() const { return spec_; }
    double sample_rate() const { return sample_rate_; }
    const std::vector<BiquadCoefficients>& sections() const { return sections_; }

    // Zeroed state sized for this design (cold start)
    FilterState create_state() const;

    /**
     * Filter samples in place, one causal pass.
     * @param state must come from create_state() of this design
     */
    void process(float* samples, size_t count, FilterState& state) const;

    void process(std::vector<float>& samples, FilterState& state) const;

    std::complex<double> response_at(double frequency_hz) const;
    double magnitude_at(double frequency_hz) const;

private:
    FilterSpec spec_;
    double sample_rate_;
    std::vector<BiquadCoefficients> sections_;
};

/**
 * Computes second-order-section coefficients for every FilterFamily.
 *
 * Butterworth, Bessel and Chebyshev I start from an analog low-pass
 * prototype with unit cutoff, apply s -> 1/s for high-pass, and map each
 * conjugate pole pair through a pre-warped bilinear transform so the
 * digital response at the cutoff matches the analog one exactly.
 */
class FilterDesigner {
public:
    static constexpr int kMaxOrder = 24;

    /**
     * @param strict reject a ripple value supplied for a family that does
     *               not use it instead of ignoring it
     */
    explicit FilterDesigner(bool strict = true);

    bool strict() const { return strict_; }

    /**
     * Throws ConfigError when the spec cannot be realized at sample_rate.
     */
    void validate(const FilterSpec& spec, double sample_rate) const;

    FilterDesign design(const FilterSpec& spec, double sample_rate) const;

    /**
     * Analog low-pass prototype poles with unit cutoff, one per conjugate
     * pair (upper half plane).
     */
    static std::vector<std::complex<double>> prototype_poles(FilterFamily family, int order, double ripple_db = 0.0);

    static std::string family_name(FilterFamily family);

    // Accepts the numeric code ("0".."3") or a family name
    static bool parse_family(const std::string& text, FilterFamily& family);
    static bool family_from_code(int code, FilterFamily& family);

private:
    bool strict_;

    std::vector<BiquadCoefficients> design_simple(const FilterSpec& spec, double sample_rate) const;
    std::vector<BiquadCoefficients> design_from_poles(const FilterSpec& spec, double sample_rate,
                                                      const std::vector<std::complex<double>>& poles,
                                                      double gain) const;

    static std::vector<std::complex<double>> butterworth_poles(int order);
    static std::vector<std::complex<double>> chebyshev_poles(int order, double ripple_db);
    static std::vector<std::complex<double>> bessel_poles(int order);
};

} // namespace Wav2Ulaw
