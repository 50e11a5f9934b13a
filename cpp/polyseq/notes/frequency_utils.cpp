#include "polyseq/notes/frequency_utils.h"

#include <array>
#include <cmath>
#include <cstdio>

namespace polyseq {

namespace {

bool isValidFrequency(double f) noexcept {
    return std::isfinite(f) && f > 0.0;
}

long semitonesFromReference(double frequency, double referenceFrequency) {
    return std::lround(12.0 * std::log2(frequency / referenceFrequency));
}

} // namespace

double quantizeToEqualTemperament(double frequency, double referenceFrequency) {
    if (!isValidFrequency(frequency) || !isValidFrequency(referenceFrequency)) return frequency;
    const long n = semitonesFromReference(frequency, referenceFrequency);
    return referenceFrequency * std::pow(2.0, static_cast<double>(n) / 12.0);
}

std::string noteNameForFrequency(double frequency, double referenceFrequency) {
    if (!isValidFrequency(frequency) || !isValidFrequency(referenceFrequency)) return "N/A";

    static const std::array<const char*, 12> kNoteNames = {
        "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

    // The reference is A4: 9 semitones above C, 4 octaves above C0.
    const long fromC0 = semitonesFromReference(frequency, referenceFrequency) + 9 + 4 * 12;
    const long octave = static_cast<long>(std::floor(static_cast<double>(fromC0) / 12.0));
    const long index = ((fromC0 % 12) + 12) % 12;
    return std::string(kNoteNames[static_cast<std::size_t>(index)]) + std::to_string(octave);
}

std::string formatFrequency(double frequency, bool includeNoteName, double referenceFrequency) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f Hz", frequency);
    std::string out(buf);
    if (includeNoteName) {
        out += " (" + noteNameForFrequency(frequency, referenceFrequency) + ")";
    }
    return out;
}

} // namespace polyseq
