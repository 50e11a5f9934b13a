#ifndef POLYSEQ_SHAPE_EUCLIDEAN_RHYTHM_H
#define POLYSEQ_SHAPE_EUCLIDEAN_RHYTHM_H

#include <cstdint>
#include <vector>

namespace polyseq {

// Distributes `pulses` onsets over `steps` slots as evenly as possible.
// The result always holds exactly clamp(pulses, 0, steps) true entries.
std::vector<bool> euclideanRhythm(std::int32_t steps, std::int32_t pulses);

} // namespace polyseq

#endif // POLYSEQ_SHAPE_EUCLIDEAN_RHYTHM_H
