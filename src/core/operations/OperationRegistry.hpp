#pragma once

#include "OperationTypes.hpp"
#include <QHash>
#include <QMutex>
#include <QSet>

namespace srt {

/// Operation id -> status map. The single source of truth for what is
/// running right now.
///
/// State machine: Pending -> Running -> {Completed, Failed, Cancelled}.
/// Every transition method returns whether it moved the entry; calls that
/// do not match the current state are no-ops, so re-terminating an entry is
/// harmless.
///
/// Single-flight is tracked apart from the state: reserve() claims the kind
/// and only release() (or discard()) frees it. A Cancelled entry keeps its
/// kind reserved until the worker behind it has actually returned.
///
/// Thread-safe. The lock is only held for O(1) hash work.
class OperationRegistry {
public:
    /// Insert a Pending entry unless `kind` already has one in flight.
    bool reserve(OperationKind kind, const OperationId& id);

    /// Drop a Pending entry whose worker never started.
    bool discard(const OperationId& id);

    /// Free the kind reserved by `id`. Called once its worker has returned.
    bool release(const OperationId& id);

    bool markRunning(const OperationId& id, const QString& message = {});
    bool updateMessage(const OperationId& id, const QString& message);

    bool complete(const OperationId& id, const QVariant& result);
    bool fail(const OperationId& id, const QString& message);
    bool cancel(const OperationId& id);

    /// Returns an invalid snapshot for unknown ids.
    OperationStatus status(const OperationId& id) const;

    /// Reserved entries that are still Pending or Running, one per kind at most.
    QList<RunningOperation> inFlight() const;

    /// Whether `kind` is reserved, terminal or not.
    bool isInFlight(OperationKind kind) const;

    /// Evict a terminal entry. In-flight entries are refused.
    bool remove(const OperationId& id);

    /// Evict terminal entries that finished more than maxAgeMs before now.
    /// Ids in `keep` survive regardless of age.
    int sweep(qint64 maxAgeMs, const QDateTime& now = QDateTime::currentDateTimeUtc(),
              const QSet<OperationId>& keep = {});

    int size() const;

private:
    bool finish(const OperationId& id, OperationState state,
                const QString& message, const QVariant& result);

    mutable QMutex mutex_;
    QHash<OperationId, OperationStatus> entries_;
    QHash<OperationKind, OperationId> reserved_;
};

} // namespace srt
