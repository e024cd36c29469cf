#include "keycap-core/cad/CurveBuilder.hpp"
#include "keycap-core/cad/Parameters.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace keycap::core::cad {

// ===========================================================================
// MonotoneCubic
// ===========================================================================

MonotoneCubic::MonotoneCubic(std::vector<double> xs, std::vector<double> ys)
    : xs_(std::move(xs)), ys_(std::move(ys)) {
    const size_t n = xs_.size();
    slopes_.assign(n, 0.0);

    if (n < 2) {
        return;
    }

    // Secant slopes
    std::vector<double> delta(n - 1);
    for (size_t k = 0; k + 1 < n; ++k) {
        delta[k] = (ys_[k + 1] - ys_[k]) / (xs_[k + 1] - xs_[k]);
    }

    slopes_[0] = delta[0];
    slopes_[n - 1] = delta[n - 2];
    for (size_t k = 1; k + 1 < n; ++k) {
        if (delta[k - 1] * delta[k] <= 0.0) {
            slopes_[k] = 0.0;  // local extremum stays flat
        } else {
            slopes_[k] = (delta[k - 1] + delta[k]) / 2.0;
        }
    }

    // Fritsch-Carlson limiter
    for (size_t k = 0; k + 1 < n; ++k) {
        if (delta[k] == 0.0) {
            slopes_[k] = 0.0;
            slopes_[k + 1] = 0.0;
            continue;
        }

        double alpha = slopes_[k] / delta[k];
        double beta = slopes_[k + 1] / delta[k];
        double magnitude = alpha * alpha + beta * beta;

        if (magnitude > 9.0) {
            double tau = 3.0 / std::sqrt(magnitude);
            slopes_[k] = tau * alpha * delta[k];
            slopes_[k + 1] = tau * beta * delta[k];
        }
    }
}

size_t MonotoneCubic::segmentFor(double x) const {
    auto it = std::upper_bound(xs_.begin(), xs_.end(), x);
    size_t index = static_cast<size_t>(std::distance(xs_.begin(), it));
    if (index == 0) return 0;
    return std::min(index - 1, xs_.size() - 2);
}

double MonotoneCubic::evaluate(double x) const {
    if (xs_.empty()) return 0.0;
    if (xs_.size() == 1) return ys_[0];

    if (x <= xs_.front()) {
        return ys_.front() + slopes_.front() * (x - xs_.front());
    }
    if (x >= xs_.back()) {
        return ys_.back() + slopes_.back() * (x - xs_.back());
    }

    size_t k = segmentFor(x);
    double h = xs_[k + 1] - xs_[k];
    double t = (x - xs_[k]) / h;
    double t2 = t * t;
    double t3 = t2 * t;

    double h00 = 2 * t3 - 3 * t2 + 1;
    double h10 = t3 - 2 * t2 + t;
    double h01 = -2 * t3 + 3 * t2;
    double h11 = t3 - t2;

    return h00 * ys_[k] + h10 * h * slopes_[k] +
           h01 * ys_[k + 1] + h11 * h * slopes_[k + 1];
}

double MonotoneCubic::derivative(double x) const {
    if (xs_.size() < 2) return 0.0;

    if (x <= xs_.front()) return slopes_.front();
    if (x >= xs_.back()) return slopes_.back();

    size_t k = segmentFor(x);
    double h = xs_[k + 1] - xs_[k];
    double t = (x - xs_[k]) / h;
    double t2 = t * t;

    double dh00 = 6 * t2 - 6 * t;
    double dh10 = 3 * t2 - 4 * t + 1;
    double dh01 = -6 * t2 + 6 * t;
    double dh11 = 3 * t2 - 2 * t;

    return (dh00 * ys_[k] + dh01 * ys_[k + 1]) / h +
           dh10 * slopes_[k] + dh11 * slopes_[k + 1];
}

// ===========================================================================
// CrossSectionCurve
// ===========================================================================

CrossSectionCurve::CrossSectionCurve(double footprintWidth,
                                     double footprintDepth,
                                     const ProfileDefinition& profile,
                                     int sectionCount)
    : footprintWidth_(footprintWidth),
      footprintDepth_(footprintDepth),
      height_(profile.topHeight()),
      sectionCount_(sectionCount) {
    std::vector<double> heights;
    std::vector<double> sides;
    std::vector<double> fronts;
    std::vector<double> backs;

    for (const auto& sample : profile.samples()) {
        heights.push_back(sample.height);
        sides.push_back(sample.sideInset);
        fronts.push_back(sample.frontInset);
        backs.push_back(sample.backInset);
    }

    side_ = MonotoneCubic(heights, std::move(sides));
    front_ = MonotoneCubic(heights, std::move(fronts));
    back_ = MonotoneCubic(std::move(heights), std::move(backs));
}

SectionRect CrossSectionCurve::sectionAt(double z) const {
    const double side = side_.evaluate(z);

    SectionRect section;
    section.z = z;
    section.xMin = -footprintWidth_ / 2.0 + side;
    section.xMax = footprintWidth_ / 2.0 - side;
    section.yMin = -footprintDepth_ / 2.0 + back_.evaluate(z);
    section.yMax = footprintDepth_ / 2.0 - front_.evaluate(z);
    return section;
}

InsetSlopes CrossSectionCurve::slopesAt(double z) const {
    InsetSlopes slopes;
    slopes.side = side_.derivative(z);
    slopes.front = front_.derivative(z);
    slopes.back = back_.derivative(z);
    return slopes;
}

std::vector<SectionRect> CrossSectionCurve::sampleSections(int count) const {
    std::vector<SectionRect> sections;
    if (count < 2) {
        return sections;
    }

    sections.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        // Exact end heights, no accumulated rounding at the top
        double z = (i == count - 1) ? height_ : height_ * i / (count - 1);
        sections.push_back(sectionAt(z));
    }
    return sections;
}

// ===========================================================================
// Builder
// ===========================================================================

Result<bool> validateProfile(const ProfileDefinition& profile,
                             double footprintWidth,
                             double footprintDepth) {
    const auto& samples = profile.samples();

    if (samples.size() < 2) {
        return Result<bool>::error(errors::kInvalidProfile,
            "Profile needs at least 2 samples, got " + std::to_string(samples.size()));
    }

    if (samples.front().height != 0.0) {
        return Result<bool>::error(errors::kInvalidProfile,
            "First profile sample must lie on the base plane (height 0)");
    }

    for (size_t i = 0; i < samples.size(); ++i) {
        const auto& sample = samples[i];
        std::stringstream where;
        where << "sample " << i << " (height " << sample.height << " mm)";

        if (!std::isfinite(sample.height) || !std::isfinite(sample.sideInset) ||
            !std::isfinite(sample.frontInset) || !std::isfinite(sample.backInset)) {
            return Result<bool>::error(errors::kInvalidProfile, "Non-finite value at " + where.str());
        }

        if (i > 0 && sample.height <= samples[i - 1].height) {
            return Result<bool>::error(errors::kInvalidProfile,
                "Profile heights must strictly increase at " + where.str());
        }

        if (sample.sideInset < 0 || sample.frontInset < 0 || sample.backInset < 0) {
            return Result<bool>::error(errors::kInvalidProfile, "Negative inset at " + where.str());
        }

        // Interpolation never overshoots, so checking samples is enough
        if (footprintWidth - 2.0 * sample.sideInset <= 0 ||
            footprintDepth - sample.frontInset - sample.backInset <= 0) {
            return Result<bool>::error(errors::kInvalidProfile,
                "Insets collapse the section at " + where.str());
        }
    }

    return Result<bool>::ok(true);
}

Result<CrossSectionCurve> buildCurve(const ProfileDefinition& profile,
                                     double widthUnits,
                                     const CurveOptions& options) {
    if (!std::isfinite(widthUnits) || widthUnits <= 0) {
        return Result<CrossSectionCurve>::error(errors::kConfiguration,
            "Key width must be positive");
    }

    if (options.sections < 2) {
        return Result<CrossSectionCurve>::error(errors::kConfiguration,
            "Curve needs at least 2 sections, got " + std::to_string(options.sections));
    }

    const double footprintWidth = widthUnits * kKeyPitch - kKeyGap;
    const double footprintDepth = kKeyPitch - kKeyGap;

    auto valid = validateProfile(profile, footprintWidth, footprintDepth);
    if (!valid) {
        return Result<CrossSectionCurve>::propagate(valid);
    }

    return Result<CrossSectionCurve>::ok(
        CrossSectionCurve(footprintWidth, footprintDepth, profile, options.sections));
}

} // namespace keycap::core::cad
