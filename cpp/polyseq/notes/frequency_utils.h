#ifndef POLYSEQ_NOTES_FREQUENCY_UTILS_H
#define POLYSEQ_NOTES_FREQUENCY_UTILS_H

#include <string>

namespace polyseq {

static constexpr double kDefaultReferenceFrequency = 440.0; // A4

// Nearest 12-TET pitch. Non-positive or non-finite input is returned unchanged.
double quantizeToEqualTemperament(double frequency, double referenceFrequency = kDefaultReferenceFrequency);

// "A4", "C#5", ... or "N/A" for invalid frequencies.
std::string noteNameForFrequency(double frequency, double referenceFrequency = kDefaultReferenceFrequency);

// "440.00 Hz", optionally followed by " (A4)".
std::string formatFrequency(double frequency, bool includeNoteName = false,
                            double referenceFrequency = kDefaultReferenceFrequency);

} // namespace polyseq

#endif // POLYSEQ_NOTES_FREQUENCY_UTILS_H
