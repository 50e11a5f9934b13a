#ifndef POLYSEQ_NOTES_NOTE_RESOLVER_H
#define POLYSEQ_NOTES_NOTE_RESOLVER_H

#include "polyseq/shape/shape_spec.h"
#include "polyseq/trigger/trigger_types.h"

#include <cstdint>

namespace polyseq {

// Maps a crossing to musical parameters. Implementations must not mutate
// engine state; exceptions are caught at the firing boundary.
class NoteResolver {
public:
    virtual ~NoteResolver() = default;
    virtual ResolvedNote resolve(const TriggerData& data, const ShapeSpec& spec) const = 0;
};

enum class ParameterMode : std::uint8_t {
    Modulo = 0,
    Random = 1,
    Interpolation = 2,
};

struct ParameterRange {
    double min;
    double max;
    std::int32_t modulo;
    ParameterMode mode;
    double phase; // [0, 1), shifts the pattern by floor(phase * modulo) points
};

struct NoteParameters {
    ParameterRange duration{0.1, 0.5, 3, ParameterMode::Modulo, 0.0};
    ParameterRange velocity{0.3, 0.9, 4, ParameterMode::Modulo, 0.0};
    bool useEqualTemperament{false};
    double referenceFrequency{440.0};
};

// Default resolver: frequency from the distance to the origin, duration and
// velocity from point-index patterns, pan from the rotation angle.
class ParametricNoteResolver : public NoteResolver {
public:
    ParametricNoteResolver() = default;
    explicit ParametricNoteResolver(const NoteParameters& params) : params_(params) {}

    ResolvedNote resolve(const TriggerData& data, const ShapeSpec& spec) const override;

    const NoteParameters& parameters() const noexcept { return params_; }
    void setParameters(const NoteParameters& params) noexcept { params_ = params; }

    static std::uint64_t pointIndexFor(const TriggerData& data, const ShapeSpec& spec) noexcept;

    // Value of a parameter pattern at `pointIndex`. min > max inverts the pattern.
    static double parameterValue(std::uint64_t pointIndex, const ParameterRange& range) noexcept;

    // Deterministic LCG (a = 1664525, c = 1013904223, m = 2^32) of seed + 1, in [0, 1).
    static double seededRandom(std::uint64_t seed) noexcept;

private:
    NoteParameters params_{};
};

} // namespace polyseq

#endif // POLYSEQ_NOTES_NOTE_RESOLVER_H
