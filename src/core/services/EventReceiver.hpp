#pragma once

#include "core/operations/OperationTypes.hpp"
#include <QMutex>
#include <deque>

namespace srt {

class EventBus;

// Bounded receive end of the EventBus.
// One producer side (the bus, called from worker threads), one consumer
// (the render loop). Overflow drops the oldest buffered event; the next
// tryNext() reports the gap as a single Lagged event.
class EventReceiver {
public:
    explicit EventReceiver(int capacity);

    /// Non-blocking. Returns false when nothing is buffered.
    bool tryNext(OperationEvent* event);

    int capacity() const { return capacity_; }
    int pending() const;

    /// Total events dropped over the receiver's lifetime.
    quint64 droppedTotal() const;

private:
    friend class EventBus;
    void push(const OperationEvent& event);

    const int capacity_;
    mutable QMutex mutex_;
    std::deque<OperationEvent> queue_;
    quint64 missed_ = 0;        // dropped since the last Lagged was reported
    quint64 droppedTotal_ = 0;
};

} // namespace srt
