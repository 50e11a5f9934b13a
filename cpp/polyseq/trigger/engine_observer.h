#ifndef POLYSEQ_TRIGGER_ENGINE_OBSERVER_H
#define POLYSEQ_TRIGGER_ENGINE_OBSERVER_H

#include "polyseq/core/types.h"
#include "polyseq/trigger/trigger_types.h"

#include <cstdint>

namespace polyseq {

// Instrumentation hooks. All default to no-ops.
class EngineObserver {
public:
    virtual ~EngineObserver() = default;

    virtual void onTriggerFired(const FiredTrigger& /*trigger*/) {}
    virtual void onTriggerSuppressed(const TriggerKey& /*key*/, const Point2& /*position*/) {}
    virtual void onTriggerScheduled(const PendingTrigger& /*pending*/) {}
    virtual void onCallbackError(PolyseqError /*code*/, const char* /*what*/) {}
    virtual void onRebuildFailed(std::uint32_t /*layerId*/, const char* /*what*/) {}
};

} // namespace polyseq

#endif // POLYSEQ_TRIGGER_ENGINE_OBSERVER_H
