#include "filter_designer.hpp"
#include "transcode_error.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace Wav2Ulaw {

namespace {

using Complex = std::complex<double>;

const double kPi = 3.14159265358979323846;

Complex evaluate_polynomial(const std::vector<double>& coeffs, const Complex& z) {
    // Horner, coefficients in ascending powers
    Complex result(0.0, 0.0);
    for (size_t i = coeffs.size(); i-- > 0;) {
        result = result * z + coeffs[i];
    }
    return result;
}

// Durand-Kerner iteration for a monic polynomial (ascending coefficients)
std::vector<Complex> polynomial_roots(const std::vector<double>& coeffs) {
    const int degree = static_cast<int>(coeffs.size()) - 1;
    const double radius = std::pow(std::abs(coeffs[0]), 1.0 / degree);

    std::vector<Complex> roots(degree);
    const Complex seed(0.4, 0.9);
    Complex power(1.0, 0.0);
    for (int i = 0; i < degree; ++i) {
        roots[i] = radius * power;
        power *= seed;
    }

    for (int iteration = 0; iteration < 2000; ++iteration) {
        double max_delta = 0.0;
        for (int i = 0; i < degree; ++i) {
            Complex denominator(1.0, 0.0);
            for (int j = 0; j < degree; ++j) {
                if (j != i) {
                    denominator *= roots[i] - roots[j];
                }
            }
            Complex delta = evaluate_polynomial(coeffs, roots[i]) / denominator;
            roots[i] -= delta;
            max_delta = std::max(max_delta, std::abs(delta));
        }
        if (max_delta < 1e-14 * radius) {
            break;
        }
    }

    return roots;
}

// |H(jw)| of an all-pole prototype with unity DC gain, conjugates implied
double prototype_magnitude(const std::vector<Complex>& poles, double omega) {
    const Complex jw(0.0, omega);
    double magnitude = 1.0;
    for (const auto& p : poles) {
        magnitude *= std::norm(p) / (std::abs(jw - p) * std::abs(jw - std::conj(p)));
    }
    return magnitude;
}

double factorial(int n) {
    double result = 1.0;
    for (int i = 2; i <= n; ++i) {
        result *= i;
    }
    return result;
}

} // namespace

void FilterState::reset() {
    for (auto& section : sections) {
        section.z1 = 0.0;
        section.z2 = 0.0;
    }
}

// FilterDesign Implementation
FilterDesign::FilterDesign(const FilterSpec& spec, double sample_rate, std::vector<BiquadCoefficients> sections)
    : spec_(spec), sample_rate_(sample_rate), sections_(std::move(sections)) {}

FilterState FilterDesign::create_state() const {
    FilterState state;
    state.sections.resize(sections_.size());
    return state;
}

void FilterDesign::process(float* samples, size_t count, FilterState& state) const {
    if (state.sections.size() != sections_.size()) {
        throw std::invalid_argument("FilterState does not match filter design");
    }

    for (size_t n = 0; n < count; ++n) {
        double value = samples[n];
        for (size_t s = 0; s < sections_.size(); ++s) {
            const BiquadCoefficients& c = sections_[s];
            BiquadState& z = state.sections[s];

            double output = c.b0 * value + z.z1;
            z.z1 = c.b1 * value - c.a1 * output + z.z2;
            z.z2 = c.b2 * value - c.a2 * output;
            value = output;
        }
        samples[n] = static_cast<float>(value);
    }
}

void FilterDesign::process(std::vector<float>& samples, FilterState& state) const {
    process(samples.data(), samples.size(), state);
}

std::complex<double> FilterDesign::response_at(double frequency_hz) const {
    const double omega = 2.0 * kPi * frequency_hz / sample_rate_;
    const Complex z1 = std::polar(1.0, -omega);
    const Complex z2 = z1 * z1;

    Complex response(1.0, 0.0);
    for (const auto& c : sections_) {
        response *= (c.b0 + c.b1 * z1 + c.b2 * z2) / (1.0 + c.a1 * z1 + c.a2 * z2);
    }
    return response;
}

double FilterDesign::magnitude_at(double frequency_hz) const {
    return std::abs(response_at(frequency_hz));
}

// FilterDesigner Implementation
FilterDesigner::FilterDesigner(bool strict) : strict_(strict) {}

void FilterDesigner::validate(const FilterSpec& spec, double sample_rate) const {
    std::ostringstream error;

    if (!(sample_rate > 0.0)) {
        error << "sample rate must be positive, got " << sample_rate;
        throw ConfigError(error.str());
    }

    // RC stages are defined for any cutoff; the bilinear designs need one below Nyquist
    const double nyquist = sample_rate / 2.0;
    const bool above_nyquist = spec.family != FilterFamily::Simple && spec.cutoff_hz >= nyquist;
    if (!(spec.cutoff_hz > 0.0) || above_nyquist) {
        error << family_name(spec.family) << " cutoff " << spec.cutoff_hz
              << " Hz must lie between 0 and the Nyquist frequency (" << nyquist << " Hz)";
        throw ConfigError(error.str());
    }

    if (spec.order < 2 || spec.order % 2 != 0 || spec.order > kMaxOrder) {
        error << "filter order must be an even number between 2 and " << kMaxOrder
              << ", got " << spec.order;
        throw ConfigError(error.str());
    }

    if (spec.family == FilterFamily::Chebyshev1) {
        if (!spec.ripple_db) {
            throw ConfigError("Chebyshev filter requires a ripple value (--chebyshev-ripple)");
        }
        if (!std::isfinite(*spec.ripple_db) || *spec.ripple_db <= 0.0) {
            error << "Chebyshev ripple must be a positive number of dB, got " << *spec.ripple_db;
            throw ConfigError(error.str());
        }
    } else if (spec.ripple_db && strict_) {
        error << "ripple is only meaningful for Chebyshev filters, not "
              << family_name(spec.family);
        throw ConfigError(error.str());
    }
}

FilterDesign FilterDesigner::design(const FilterSpec& spec, double sample_rate) const {
    validate(spec, sample_rate);

    FilterSpec effective = spec;
    if (effective.family != FilterFamily::Chebyshev1 && effective.ripple_db) {
        Logger::warn("FilterDesigner", "ignoring ripple for " + family_name(effective.family) + " filter");
        effective.ripple_db.reset();
    }

    std::vector<BiquadCoefficients> sections;
    switch (effective.family) {
        case FilterFamily::Simple:
            sections = design_simple(effective, sample_rate);
            break;
        case FilterFamily::Butterworth:
            sections = design_from_poles(effective, sample_rate, butterworth_poles(effective.order), 1.0);
            break;
        case FilterFamily::Bessel:
            sections = design_from_poles(effective, sample_rate, bessel_poles(effective.order), 1.0);
            break;
        case FilterFamily::Chebyshev1: {
            double ripple = *effective.ripple_db;
            double epsilon = std::sqrt(std::pow(10.0, ripple / 10.0) - 1.0);
            // Even orders sit at the bottom of the ripple band at DC
            double gain = 1.0 / std::sqrt(1.0 + epsilon * epsilon);
            sections = design_from_poles(effective, sample_rate, chebyshev_poles(effective.order, ripple), gain);
            break;
        }
    }

    return FilterDesign(effective, sample_rate, std::move(sections));
}

std::vector<BiquadCoefficients> FilterDesigner::design_simple(const FilterSpec& spec, double sample_rate) const {
    const double rc = 1.0 / (2.0 * kPi * spec.cutoff_hz);
    const double dt = 1.0 / sample_rate;

    BiquadCoefficients stage;
    if (spec.response == FilterResponse::LowPass) {
        // y[n] = y[n-1] + alpha * (x[n] - y[n-1])
        double alpha = dt / (rc + dt);
        stage.b0 = alpha;
        stage.a1 = -(1.0 - alpha);
    } else {
        // y[n] = alpha * (y[n-1] + x[n] - x[n-1])
        double alpha = rc / (rc + dt);
        stage.b0 = alpha;
        stage.b1 = -alpha;
        stage.a1 = -alpha;
    }

    return std::vector<BiquadCoefficients>(spec.order / 2, stage);
}

std::vector<BiquadCoefficients> FilterDesigner::design_from_poles(const FilterSpec& spec, double sample_rate,
                                                                  const std::vector<std::complex<double>>& poles,
                                                                  double gain) const {
    // Pre-warp so the analog unit cutoff lands exactly on cutoff_hz
    const double k = std::tan(kPi * spec.cutoff_hz / sample_rate);
    const double k2 = k * k;

    std::vector<BiquadCoefficients> sections;
    sections.reserve(poles.size());

    for (const auto& pole : poles) {
        // Analog section: a0 / (s^2 + a1 s + a0)
        const double a1 = -2.0 * pole.real();
        const double a0 = std::norm(pole);

        BiquadCoefficients c;
        if (spec.response == FilterResponse::LowPass) {
            const double d0 = 1.0 + a1 * k + a0 * k2;
            c.b0 = a0 * k2 / d0;
            c.b1 = 2.0 * a0 * k2 / d0;
            c.b2 = a0 * k2 / d0;
            c.a1 = (2.0 * a0 * k2 - 2.0) / d0;
            c.a2 = (1.0 - a1 * k + a0 * k2) / d0;
        } else {
            // s -> 1/s gives a0 s^2 / (a0 s^2 + a1 s + 1)
            const double d0 = a0 + a1 * k + k2;
            c.b0 = a0 / d0;
            c.b1 = -2.0 * a0 / d0;
            c.b2 = a0 / d0;
            c.a1 = (2.0 * k2 - 2.0 * a0) / d0;
            c.a2 = (a0 - a1 * k + k2) / d0;
        }
        sections.push_back(c);
    }

    if (!sections.empty() && gain != 1.0) {
        sections.front().b0 *= gain;
        sections.front().b1 *= gain;
        sections.front().b2 *= gain;
    }

    return sections;
}

std::vector<std::complex<double>> FilterDesigner::prototype_poles(FilterFamily family, int order, double ripple_db) {
    switch (family) {
        case FilterFamily::Butterworth:
            return butterworth_poles(order);
        case FilterFamily::Bessel:
            return bessel_poles(order);
        case FilterFamily::Chebyshev1:
            return chebyshev_poles(order, ripple_db);
        case FilterFamily::Simple:
        default:
            return {};
    }
}

std::vector<std::complex<double>> FilterDesigner::butterworth_poles(int order) {
    std::vector<Complex> poles;
    for (int k = 0; k < order / 2; ++k) {
        double theta = kPi * (2.0 * k + 1.0) / (2.0 * order);
        poles.emplace_back(-std::sin(theta), std::cos(theta));
    }
    return poles;
}

std::vector<std::complex<double>> FilterDesigner::chebyshev_poles(int order, double ripple_db) {
    const double epsilon = std::sqrt(std::pow(10.0, ripple_db / 10.0) - 1.0);
    const double mu = std::asinh(1.0 / epsilon) / order;

    std::vector<Complex> poles;
    for (int k = 0; k < order / 2; ++k) {
        double theta = kPi * (2.0 * k + 1.0) / (2.0 * order);
        poles.emplace_back(-std::sinh(mu) * std::sin(theta), std::cosh(mu) * std::cos(theta));
    }
    return poles;
}

std::vector<std::complex<double>> FilterDesigner::bessel_poles(int order) {
    // Reverse Bessel polynomial: a_k = (2n-k)! / (2^(n-k) k! (n-k)!)
    std::vector<double> coeffs(order + 1);
    for (int k = 0; k <= order; ++k) {
        coeffs[k] = factorial(2 * order - k) /
                    (std::pow(2.0, order - k) * factorial(k) * factorial(order - k));
    }

    std::vector<Complex> roots = polynomial_roots(coeffs);

    // Keep one pole per conjugate pair
    std::sort(roots.begin(), roots.end(), [](const Complex& a, const Complex& b) {
        return a.imag() > b.imag();
    });
    std::vector<Complex> poles(roots.begin(), roots.begin() + order / 2);
    for (auto& pole : poles) {
        pole = Complex(pole.real(), std::abs(pole.imag()));
    }

    // Rescale from unit group delay to -3 dB at unit frequency
    const double half_power = 1.0 / std::sqrt(2.0);
    double low = 0.0;
    double high = 1.0;
    while (prototype_magnitude(poles, high) > half_power) {
        high *= 2.0;
    }
    for (int i = 0; i < 200; ++i) {
        double mid = 0.5 * (low + high);
        if (prototype_magnitude(poles, mid) > half_power) {
            low = mid;
        } else {
            high = mid;
        }
    }
    const double omega_3db = 0.5 * (low + high);

    for (auto& pole : poles) {
        pole /= omega_3db;
    }
    return poles;
}

std::string FilterDesigner::family_name(FilterFamily family) {
    switch (family) {
        case FilterFamily::Simple: return "simple";
        case FilterFamily::Butterworth: return "butterworth";
        case FilterFamily::Bessel: return "bessel";
        case FilterFamily::Chebyshev1: return "chebyshev";
        default: return "unknown";
    }
}

bool FilterDesigner::family_from_code(int code, FilterFamily& family) {
    switch (code) {
        case 0: family = FilterFamily::Simple; return true;
        case 1: family = FilterFamily::Butterworth; return true;
        case 2: family = FilterFamily::Bessel; return true;
        case 3: family = FilterFamily::Chebyshev1; return true;
        default: return false;
    }
}

bool FilterDesigner::parse_family(const std::string& text, FilterFamily& family) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered.size() == 1 && std::isdigit(static_cast<unsigned char>(lowered[0]))) {
        return family_from_code(lowered[0] - '0', family);
    }

    if (lowered == "simple") {
        family = FilterFamily::Simple;
    } else if (lowered == "butterworth") {
        family = FilterFamily::Butterworth;
    } else if (lowered == "bessel") {
        family = FilterFamily::Bessel;
    } else if (lowered == "chebyshev" || lowered == "chebyshev1") {
        family = FilterFamily::Chebyshev1;
    } else {
        return false;
    }
    return true;
}

} // namespace Wav2Ulaw
