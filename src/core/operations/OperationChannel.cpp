#include "OperationChannel.hpp"
#include "OperationRegistry.hpp"
#include "core/services/IEventBus.hpp"

namespace srt {

OperationChannel::OperationChannel(const OperationId& id, OperationKind kind,
                                   OperationRegistry* registry, IEventBus* bus)
    : id_(id)
    , kind_(kind)
    , registry_(registry)
    , bus_(bus)
{
}

bool OperationChannel::progress(const QString& text)
{
    QMutexLocker lock(&mutex_);
    if (closed_ || token_.isCancelled())
        return false;

    registry_->updateMessage(id_, text);
    bus_->publish(OperationEvent::progress(id_, kind_, text));
    return true;
}

bool OperationChannel::complete(const QVariant& result)
{
    QMutexLocker lock(&mutex_);
    if (closed_ || !registry_->complete(id_, result))
        return false;

    closed_ = true;
    bus_->publish(OperationEvent::completed(id_, kind_, result));
    return true;
}

bool OperationChannel::fail(const QString& message)
{
    QMutexLocker lock(&mutex_);
    if (closed_ || !registry_->fail(id_, message))
        return false;

    closed_ = true;
    bus_->publish(OperationEvent::failed(id_, kind_, message));
    return true;
}

bool OperationChannel::cancel()
{
    token_.cancel();

    QMutexLocker lock(&mutex_);
    if (closed_ || !registry_->cancel(id_))
        return false;

    closed_ = true;
    bus_->publish(OperationEvent::cancelled(id_, kind_));
    return true;
}

bool OperationChannel::isClosed() const
{
    QMutexLocker lock(&mutex_);
    return closed_;
}

} // namespace srt
