#pragma once

#include "OperationParams.hpp"
#include "OperationRegistry.hpp"
#include "OperationTypes.hpp"
#include <QHash>
#include <QMutex>
#include <QSet>
#include <QObject>
#include <memory>

namespace srt {

class EventReceiver;
class IEventBus;
class IWorkflowFactory;
class OperationChannel;
class OperationWorker;

/// Entry point for starting background work, and the query seam the render
/// loop polls every frame.
///
/// start() is fire-and-forget: it reserves the kind, snapshots the params,
/// spawns a worker thread and returns the id without waiting on it.
/// Every other call is a bounded, non-blocking read or flag flip.
///
/// Does NOT own the bus or the factory (caller manages lifetime); both must
/// outlive the dispatcher.
class Dispatcher : public QObject {
    Q_OBJECT
public:
    Dispatcher(IEventBus* bus, IWorkflowFactory* factory, QObject* parent = nullptr);
    ~Dispatcher() override;

    StartResult start(OperationKind kind, const OperationParams& params);

    std::shared_ptr<EventReceiver> subscribe(int capacity = 0);

    // --- Query / snapshot API ---

    OperationStatus status(const OperationId& id) const;
    QList<RunningOperation> listRunning() const;
    CancelResult cancel(const OperationId& id);
    bool remove(const OperationId& id);
    /// Terminal entries whose worker has not been reaped yet are kept.
    int sweep(qint64 maxAgeMs);

    /// Worker threads not yet reaped.
    int activeWorkers() const;

    /// Cancel everything and join every worker. Further starts fail.
    void shutdown(int graceMs = 5000);

signals:
    void operationStarted(const QString& id, srt::OperationKind kind);
    /// Emitted once the worker thread is joined. status(id) still holds the
    /// final state while handlers run.
    void operationFinished(const QString& id, srt::OperationKind kind);

private:
    void abandon(const OperationId& id);
    void reapWorker(const OperationId& id, OperationKind kind);

    IEventBus* bus_;
    IWorkflowFactory* factory_;
    OperationRegistry registry_;

    mutable QMutex mutex_;  // guards workers_, channels_, shuttingDown_
    QHash<OperationId, OperationWorker*> workers_;
    QHash<OperationId, std::shared_ptr<OperationChannel>> channels_;
    bool shuttingDown_ = false;
};

} // namespace srt
