#ifndef POLYSEQ_TRIGGER_SEQUENCE_COUNTER_H
#define POLYSEQ_TRIGGER_SEQUENCE_COUNTER_H

#include <cstdint>

namespace polyseq {

// Monotonic index handed to every trigger for external correlation.
// Owned by the engine and passed explicitly; reset only on request.
class SequenceCounter {
public:
    std::uint64_t next() noexcept { return next_++; }
    std::uint64_t peek() const noexcept { return next_; }
    void reset() noexcept { next_ = 0; }

private:
    std::uint64_t next_{0};
};

} // namespace polyseq

#endif // POLYSEQ_TRIGGER_SEQUENCE_COUNTER_H
