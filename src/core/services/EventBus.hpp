#pragma once

#include "IEventBus.hpp"
#include <QMutex>
#include <QList>
#include <memory>

namespace srt {

/// Fan-out of operation events to bounded receivers. publish() may be
/// called from any thread; receivers that have been dropped are pruned.
class EventBus : public IEventBus {
public:
    static constexpr int DEFAULT_CAPACITY = 256;

    explicit EventBus(int defaultCapacity = DEFAULT_CAPACITY);

    std::shared_ptr<EventReceiver> subscribe(int capacity = 0) override;
    void publish(const OperationEvent& event) override;
    int subscriberCount() const override;

    int defaultCapacity() const { return defaultCapacity_; }

private:
    const int defaultCapacity_;
    mutable QMutex mutex_;
    QList<std::weak_ptr<EventReceiver>> receivers_;
};

} // namespace srt
