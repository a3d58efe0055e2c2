#include "OperationRegistry.hpp"

namespace srt {

bool OperationRegistry::reserve(OperationKind kind, const OperationId& id)
{
    QMutexLocker lock(&mutex_);
    if (reserved_.contains(kind) || entries_.contains(id))
        return false;

    OperationStatus s;
    s.id = id;
    s.kind = kind;
    s.state = OperationState::Pending;
    entries_.insert(id, s);
    reserved_.insert(kind, id);
    return true;
}

bool OperationRegistry::discard(const OperationId& id)
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->state != OperationState::Pending)
        return false;

    reserved_.remove(it->kind);
    entries_.erase(it);
    return true;
}

bool OperationRegistry::markRunning(const OperationId& id, const QString& message)
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->state != OperationState::Pending)
        return false;

    it->state = OperationState::Running;
    it->startedAt = QDateTime::currentDateTimeUtc();
    if (!message.isEmpty())
        it->message = message;
    return true;
}

bool OperationRegistry::updateMessage(const OperationId& id, const QString& message)
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->state != OperationState::Running)
        return false;

    it->message = message;
    return true;
}

bool OperationRegistry::complete(const OperationId& id, const QVariant& result)
{
    return finish(id, OperationState::Completed, {}, result);
}

bool OperationRegistry::fail(const OperationId& id, const QString& message)
{
    return finish(id, OperationState::Failed, message, {});
}

bool OperationRegistry::cancel(const OperationId& id)
{
    return finish(id, OperationState::Cancelled, {}, {});
}

bool OperationRegistry::finish(const OperationId& id, OperationState state,
                               const QString& message, const QVariant& result)
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->isTerminal())
        return false;

    // Cancelling a Pending entry is allowed; completing or failing one is not,
    // the worker marks itself Running before its first step.
    if (it->state == OperationState::Pending && state != OperationState::Cancelled)
        return false;

    it->state = state;
    it->message = message;
    it->result = result;
    it->finishedAt = QDateTime::currentDateTimeUtc();
    return true;
}

bool OperationRegistry::release(const OperationId& id)
{
    QMutexLocker lock(&mutex_);
    for (auto it = reserved_.begin(); it != reserved_.end(); ++it) {
        if (it.value() == id) {
            reserved_.erase(it);
            return true;
        }
    }
    return false;
}

OperationStatus OperationRegistry::status(const OperationId& id) const
{
    QMutexLocker lock(&mutex_);
    return entries_.value(id);
}

QList<RunningOperation> OperationRegistry::inFlight() const
{
    QMutexLocker lock(&mutex_);
    QList<RunningOperation> result;
    result.reserve(reserved_.size());
    for (auto it = reserved_.cbegin(); it != reserved_.cend(); ++it) {
        const auto entry = entries_.constFind(it.value());
        if (entry != entries_.cend() && !entry->isTerminal())
            result.append({it.key(), it.value()});
    }
    return result;
}

bool OperationRegistry::isInFlight(OperationKind kind) const
{
    QMutexLocker lock(&mutex_);
    return reserved_.contains(kind);
}

bool OperationRegistry::remove(const OperationId& id)
{
    QMutexLocker lock(&mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || !it->isTerminal())
        return false;

    entries_.erase(it);
    return true;
}

int OperationRegistry::sweep(qint64 maxAgeMs, const QDateTime& now,
                             const QSet<OperationId>& keep)
{
    QMutexLocker lock(&mutex_);
    int removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->isTerminal() && it->finishedAt.msecsTo(now) > maxAgeMs && !keep.contains(it.key())) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

int OperationRegistry::size() const
{
    QMutexLocker lock(&mutex_);
    return entries_.size();
}

} // namespace srt
