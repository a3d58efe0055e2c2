#include "EventBus.hpp"
#include "EventReceiver.hpp"
#include <boost/log/trivial.hpp>

namespace srt {

EventBus::EventBus(int defaultCapacity)
    : defaultCapacity_(defaultCapacity > 0 ? defaultCapacity : DEFAULT_CAPACITY)
{
}

std::shared_ptr<EventReceiver> EventBus::subscribe(int capacity)
{
    auto receiver = std::make_shared<EventReceiver>(capacity > 0 ? capacity : defaultCapacity_);
    QMutexLocker lock(&mutex_);
    receivers_.append(receiver);
    BOOST_LOG_TRIVIAL(debug) << "[EventBus] New subscriber, capacity "
                             << receiver->capacity() << ", total " << receivers_.size();
    return receiver;
}

void EventBus::publish(const OperationEvent& event)
{
    // Snapshot live receivers so pushes happen outside the bus lock.
    QList<std::shared_ptr<EventReceiver>> live;
    {
        QMutexLocker lock(&mutex_);
        for (auto it = receivers_.begin(); it != receivers_.end();) {
            if (auto r = it->lock()) {
                live.append(std::move(r));
                ++it;
            } else {
                it = receivers_.erase(it);
            }
        }
    }

    for (const auto& receiver : live)
        receiver->push(event);
}

int EventBus::subscriberCount() const
{
    QMutexLocker lock(&mutex_);
    int count = 0;
    for (const auto& r : receivers_) {
        if (!r.expired()) ++count;
    }
    return count;
}

} // namespace srt
