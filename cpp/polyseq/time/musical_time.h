#ifndef POLYSEQ_TIME_MUSICAL_TIME_H
#define POLYSEQ_TIME_MUSICAL_TIME_H

#include "polyseq/core/types.h"

#include <string>

namespace polyseq {

// Tick conversions. 480 ticks per beat, 4/4 measures.
double secondsToTicks(double seconds, double bpm) noexcept;
double ticksToSeconds(double ticks, double bpm) noexcept;
inline double ticksToBeats(double ticks) noexcept { return ticks / kTicksPerBeat; }
inline double beatsToTicks(double beats) noexcept { return beats * kTicksPerBeat; }
inline double ticksToMeasures(double ticks) noexcept { return ticks / kTicksPerMeasure; }
inline double measuresToTicks(double measures) noexcept { return measures * kTicksPerMeasure; }

// "1/4" -> 480, "1/16" -> 120, "1/8T" -> 160. Malformed input falls back to a quarter note.
double parseQuantizationGrid(const std::string& value);

// Nearest multiple of gridTicks; non-positive grids return the input.
double quantizeToGrid(double ticks, double gridTicks) noexcept;

// Angle (radians) locked to the measure: the fraction of the current measure, or of a
// `subdivision`-measure cycle when useSubdivision is set, times 2*pi.
double measureRotation(double nowSeconds, double bpm, double subdivision, bool useSubdivision) noexcept;

// Free-running rotation: one revolution per measure (bpm / 240 revolutions per second).
class RotationClock {
public:
    // Returns true when the angle wrapped past 360 degrees during this step.
    bool advance(double dtSeconds, double bpm) noexcept;

    void reset(double angleDegrees = 0.0) noexcept;

    double angleDegrees() const noexcept { return angleDegrees_; }
    double previousAngleDegrees() const noexcept { return previousAngleDegrees_; }
    double angleRadians() const noexcept;
    double previousAngleRadians() const noexcept;

    // Unwrapped previous angle, so previous -> current is always a forward step.
    double previousUnwrappedRadians() const noexcept;

    std::uint64_t revolutions() const noexcept { return revolutions_; }

    // Clamped duration of the last advance() step.
    double lastStepSeconds() const noexcept { return lastStepSeconds_; }

private:
    double angleDegrees_{0.0};
    double previousAngleDegrees_{0.0};
    bool wrapped_{false};
    std::uint64_t revolutions_{0};
    double lastStepSeconds_{0.0};
};

} // namespace polyseq

#endif // POLYSEQ_TIME_MUSICAL_TIME_H
