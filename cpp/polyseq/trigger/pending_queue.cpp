#include "polyseq/trigger/pending_queue.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace polyseq {

bool pendingBefore(const PendingTrigger& a, const PendingTrigger& b) noexcept {
    if (a.executeTimeSeconds != b.executeTimeSeconds) return a.executeTimeSeconds < b.executeTimeSeconds;
    return a.sequence < b.sequence;
}

void PendingQueue::push(PendingTrigger pending) {
    const auto pos = std::upper_bound(entries_.begin(), entries_.end(), pending, pendingBefore);
    entries_.insert(pos, std::move(pending));
}

std::size_t PendingQueue::collectDue(double nowSeconds, double toleranceSeconds, std::vector<PendingTrigger>& out) {
    const double limit = nowSeconds + toleranceSeconds;
    const auto firstLate = std::find_if(entries_.begin(), entries_.end(), [limit](const PendingTrigger& p) {
        return p.executeTimeSeconds > limit;
    });
    const auto count = static_cast<std::size_t>(std::distance(entries_.begin(), firstLate));
    out.insert(out.end(), std::make_move_iterator(entries_.begin()), std::make_move_iterator(firstLate));
    entries_.erase(entries_.begin(), firstLate);
    return count;
}

} // namespace polyseq
