#ifndef POLYSEQ_TRIGGER_TRIGGER_SINK_H
#define POLYSEQ_TRIGGER_TRIGGER_SINK_H

#include "polyseq/trigger/trigger_types.h"

#include <functional>
#include <utility>

namespace polyseq {

// Audio dispatch. Called once per fired trigger; exceptions are caught by the caller.
class TriggerSink {
public:
    virtual ~TriggerSink() = default;
    virtual void dispatch(const FiredTrigger& trigger) = 0;
};

class CallbackTriggerSink final : public TriggerSink {
public:
    using Callback = std::function<void(const FiredTrigger&)>;

    explicit CallbackTriggerSink(Callback callback) : callback_(std::move(callback)) {}

    void dispatch(const FiredTrigger& trigger) override {
        if (callback_) callback_(trigger);
    }

private:
    Callback callback_;
};

} // namespace polyseq

#endif // POLYSEQ_TRIGGER_TRIGGER_SINK_H
