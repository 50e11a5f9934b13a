#ifndef POLYSEQ_TRIGGER_PENDING_QUEUE_H
#define POLYSEQ_TRIGGER_PENDING_QUEUE_H

#include "polyseq/trigger/trigger_types.h"

#include <cstddef>
#include <vector>

namespace polyseq {

// Time-ordered queue of deferred triggers (ties keep insertion order).
class PendingQueue {
public:
    void push(PendingTrigger pending);

    // Moves every entry with executeTimeSeconds <= now + tolerance into `out`, in order.
    std::size_t collectDue(double nowSeconds, double toleranceSeconds, std::vector<PendingTrigger>& out);

    void clear() noexcept { entries_.clear(); }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    const std::vector<PendingTrigger>& entries() const noexcept { return entries_; }

private:
    std::vector<PendingTrigger> entries_;
};

bool pendingBefore(const PendingTrigger& a, const PendingTrigger& b) noexcept;

} // namespace polyseq

#endif // POLYSEQ_TRIGGER_PENDING_QUEUE_H
