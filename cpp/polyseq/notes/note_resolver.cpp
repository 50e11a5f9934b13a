#include "polyseq/notes/note_resolver.h"

#include "polyseq/core/math_utils.h"
#include "polyseq/notes/frequency_utils.h"

#include <algorithm>
#include <cmath>

namespace polyseq {

namespace {

double moduloValue(std::uint64_t index, std::uint64_t modulo, double lo, double hi) noexcept {
    if (index == 0) return hi;
    return index % modulo == 0 ? hi : lo;
}

double interpolatedValue(std::uint64_t index, std::uint64_t modulo, double lo, double hi) noexcept {
    if (index == 0) return hi;
    const double position = static_cast<double>(index % modulo) / static_cast<double>(modulo);
    const double oscillation = (std::sin(position * kTwoPi) + 1.0) / 2.0;
    return lo + oscillation * (hi - lo);
}

} // namespace

double ParametricNoteResolver::seededRandom(std::uint64_t seed) noexcept {
    constexpr std::uint64_t a = 1664525ull;
    constexpr std::uint64_t c = 1013904223ull;
    constexpr std::uint64_t m = 1ull << 32;
    const std::uint64_t next = (a * ((seed + 1) % m) + c) % m;
    return static_cast<double>(next) / static_cast<double>(m);
}

double ParametricNoteResolver::parameterValue(std::uint64_t pointIndex, const ParameterRange& range) noexcept {
    const double lo = std::min(range.min, range.max);
    const double hi = std::max(range.min, range.max);
    const bool invert = range.min > range.max;
    const std::uint64_t modulo = static_cast<std::uint64_t>(std::max<std::int32_t>(1, range.modulo));

    std::uint64_t index = pointIndex;
    if (range.phase > 0.0) {
        index += static_cast<std::uint64_t>(std::floor(range.phase * static_cast<double>(modulo)));
    }

    double value = 0.0;
    switch (range.mode) {
        case ParameterMode::Modulo:
            value = moduloValue(index, modulo, lo, hi);
            break;
        case ParameterMode::Random: {
            const double r = seededRandom(index);
            return invert ? hi - r * (hi - lo) : lo + r * (hi - lo);
        }
        case ParameterMode::Interpolation:
            value = interpolatedValue(index, modulo, lo, hi);
            break;
        default:
            return lo + (hi - lo) / 2.0;
    }
    // Index 0 always takes the maximum, even when inverted.
    if (index == 0) return value;
    return invert ? lo + hi - value : value;
}

std::uint64_t ParametricNoteResolver::pointIndexFor(const TriggerData& data, const ShapeSpec& spec) noexcept {
    const auto segments = static_cast<std::uint64_t>(std::max<std::int32_t>(0, spec.segmentCount));
    if (data.isIntersection) {
        const auto copies = static_cast<std::uint64_t>(std::max<std::int32_t>(0, spec.copies));
        return copies * segments + data.intersectionIndex;
    }
    return static_cast<std::uint64_t>(data.copyIndex) * segments + data.vertexIndex;
}

ResolvedNote ParametricNoteResolver::resolve(const TriggerData& data, const ShapeSpec& spec) const {
    ResolvedNote note;
    note.frequency = std::hypot(data.localPosition.x, data.localPosition.y);
    if (params_.useEqualTemperament) {
        note.frequency = quantizeToEqualTemperament(note.frequency, params_.referenceFrequency);
        note.noteName = noteNameForFrequency(note.frequency, params_.referenceFrequency);
    }
    note.pointIndex = pointIndexFor(data, spec);
    note.duration = parameterValue(note.pointIndex, params_.duration);
    note.velocity = parameterValue(note.pointIndex, params_.velocity);
    note.pan = std::sin(std::fmod(data.angle, kTwoPi));
    return note;
}

} // namespace polyseq
