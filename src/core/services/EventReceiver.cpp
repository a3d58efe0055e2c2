#include "EventReceiver.hpp"

namespace srt {

EventReceiver::EventReceiver(int capacity)
    : capacity_(capacity > 0 ? capacity : 1)
{
}

void EventReceiver::push(const OperationEvent& event)
{
    QMutexLocker lock(&mutex_);
    if (static_cast<int>(queue_.size()) >= capacity_) {
        queue_.pop_front();
        ++missed_;
        ++droppedTotal_;
    }
    queue_.push_back(event);
}

bool EventReceiver::tryNext(OperationEvent* event)
{
    QMutexLocker lock(&mutex_);
    if (missed_ > 0) {
        if (event) *event = OperationEvent::lagged(missed_);
        missed_ = 0;
        return true;
    }
    if (queue_.empty()) return false;

    if (event) *event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

int EventReceiver::pending() const
{
    QMutexLocker lock(&mutex_);
    return static_cast<int>(queue_.size());
}

quint64 EventReceiver::droppedTotal() const
{
    QMutexLocker lock(&mutex_);
    return droppedTotal_;
}

} // namespace srt
