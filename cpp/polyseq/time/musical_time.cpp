#include "polyseq/time/musical_time.h"

#include "polyseq/core/math_utils.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace polyseq {

double secondsToTicks(double seconds, double bpm) noexcept {
    return seconds * (kTicksPerBeat * bpm) / 60.0;
}

double ticksToSeconds(double ticks, double bpm) noexcept {
    if (bpm <= 0.0) return 0.0;
    return ticks * 60.0 / (kTicksPerBeat * bpm);
}

double parseQuantizationGrid(const std::string& value) {
    if (value.empty()) return kTicksPerBeat;

    std::string body = value;
    const bool triplet = body.back() == 'T' || body.back() == 't';
    if (triplet) body.pop_back();
    if (body.rfind("1/", 0) == 0) body.erase(0, 2);
    if (body.empty()) return kTicksPerBeat;

    errno = 0;
    char* end = nullptr;
    const long denominator = std::strtol(body.c_str(), &end, 10);
    if (errno != 0 || end == body.c_str() || *end != '\0' || denominator <= 0) {
        return kTicksPerBeat;
    }

    const double straight = kTicksPerMeasure / static_cast<double>(denominator);
    return triplet ? std::round(straight * 2.0 / 3.0) : straight;
}

double quantizeToGrid(double ticks, double gridTicks) noexcept {
    if (gridTicks <= 0.0) return ticks;
    return std::round(ticks / gridTicks) * gridTicks;
}

double measureRotation(double nowSeconds, double bpm, double subdivision, bool useSubdivision) noexcept {
    const double measures = ticksToMeasures(secondsToTicks(nowSeconds, bpm));
    double normalized = 0.0;
    if (!useSubdivision || subdivision <= 0.0) {
        normalized = measures - std::floor(measures);
    } else {
        normalized = std::fmod(measures, subdivision) / subdivision;
    }
    return normalized * kTwoPi;
}

bool RotationClock::advance(double dtSeconds, double bpm) noexcept {
    const double dt = std::clamp(std::isfinite(dtSeconds) ? dtSeconds : 0.0, 0.0, kMaxFrameDeltaSeconds);
    lastStepSeconds_ = dt;
    previousAngleDegrees_ = angleDegrees_;
    angleDegrees_ += dt * 360.0 * (bpm / 240.0);
    wrapped_ = false;
    if (angleDegrees_ >= 360.0) {
        angleDegrees_ = std::fmod(angleDegrees_, 360.0);
        wrapped_ = true;
        ++revolutions_;
    }
    return wrapped_;
}

void RotationClock::reset(double angleDegrees) noexcept {
    angleDegrees_ = angleDegrees;
    previousAngleDegrees_ = angleDegrees;
    wrapped_ = false;
    revolutions_ = 0;
    lastStepSeconds_ = 0.0;
}

double RotationClock::angleRadians() const noexcept {
    return degToRad(angleDegrees_);
}

double RotationClock::previousAngleRadians() const noexcept {
    return degToRad(previousAngleDegrees_);
}

double RotationClock::previousUnwrappedRadians() const noexcept {
    return degToRad(wrapped_ ? previousAngleDegrees_ - 360.0 : previousAngleDegrees_);
}

} // namespace polyseq
