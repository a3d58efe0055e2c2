#pragma once

#include "core/operations/OperationTypes.hpp"
#include <memory>

namespace srt {

class EventReceiver;

/// Broadcast transport for operation events.
/// Every subscriber gets its own ordered copy of every event published
/// after it subscribed. Publishing never blocks on a subscriber.
class IEventBus {
public:
    virtual ~IEventBus() = default;

    /// Create a new receiver. capacity <= 0 uses the bus default.
    /// The subscription lives as long as the returned handle.
    /// Thread-safe.
    virtual std::shared_ptr<EventReceiver> subscribe(int capacity = 0) = 0;

    /// Fan an event out to every live receiver.
    /// Bounded time regardless of how fast receivers drain.
    /// Thread-safe (can be called from any thread).
    virtual void publish(const OperationEvent& event) = 0;

    virtual int subscriberCount() const = 0;
};

} // namespace srt
