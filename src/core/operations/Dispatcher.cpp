#include "Dispatcher.hpp"
#include "IOperationWorkflow.hpp"
#include "OperationChannel.hpp"
#include "OperationWorker.hpp"
#include "core/services/IEventBus.hpp"
#include <QUuid>
#include <boost/log/trivial.hpp>

namespace srt {

Dispatcher::Dispatcher(IEventBus* bus, IWorkflowFactory* factory, QObject* parent)
    : QObject(parent)
    , bus_(bus)
    , factory_(factory)
{
    qRegisterMetaType<srt::OperationKind>();
}

Dispatcher::~Dispatcher()
{
    shutdown();
}

StartResult Dispatcher::start(OperationKind kind, const OperationParams& params)
{
    StartResult result;
    result.kind = kind;
    const auto kindName = operationKindName(kind).toStdString();

    const OperationId id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    auto channel = std::make_shared<OperationChannel>(id, kind, &registry_, bus_);

    // Reserve and publish the channel in one step: a cancel() that can see
    // the Pending entry can also reach its token.
    {
        QMutexLocker lock(&mutex_);
        if (shuttingDown_) {
            result.error = StartError::SpawnFailed;
            return result;
        }
        if (!registry_.reserve(kind, id)) {
            BOOST_LOG_TRIVIAL(warning) << "[Dispatcher] " << kindName << " already running, start rejected";
            result.error = StartError::AlreadyRunning;
            return result;
        }
        channels_.insert(id, channel);
    }

    // The factory copies params: the worker only ever sees this snapshot.
    std::unique_ptr<IOperationWorkflow> workflow;
    if (factory_)
        workflow = factory_->create(kind, params);
    if (!workflow) {
        BOOST_LOG_TRIVIAL(error) << "[Dispatcher] No workflow for " << kindName;
        abandon(id);
        result.error = StartError::UnknownKind;
        return result;
    }

    auto* worker = new OperationWorker(channel, &registry_, std::move(workflow));
    connect(worker, &QThread::finished, this, [this, id, kind]() { reapWorker(id, kind); },
            Qt::QueuedConnection);

    {
        QMutexLocker lock(&mutex_);
        workers_.insert(id, worker);
    }

    worker->start();

    // A thread that never came up leaves no worker behind the Pending entry.
    if (!worker->isRunning() && !worker->isFinished()) {
        BOOST_LOG_TRIVIAL(error) << "[Dispatcher] Failed to spawn worker for " << kindName;
        {
            QMutexLocker lock(&mutex_);
            workers_.remove(id);
        }
        abandon(id);
        delete worker;
        result.error = StartError::SpawnFailed;
        return result;
    }

    registry_.markRunning(id);

    BOOST_LOG_TRIVIAL(info) << "[Dispatcher] Started " << kindName << " " << id.toStdString();
    emit operationStarted(id, kind);

    result.id = id;
    return result;
}

std::shared_ptr<EventReceiver> Dispatcher::subscribe(int capacity)
{
    return bus_->subscribe(capacity);
}

OperationStatus Dispatcher::status(const OperationId& id) const
{
    return registry_.status(id);
}

QList<RunningOperation> Dispatcher::listRunning() const
{
    return registry_.inFlight();
}

CancelResult Dispatcher::cancel(const OperationId& id)
{
    const OperationStatus s = registry_.status(id);
    if (!s.isValid())
        return CancelResult::NotFound;
    if (s.isTerminal())
        return CancelResult::AlreadyTerminal;

    std::shared_ptr<OperationChannel> channel;
    {
        QMutexLocker lock(&mutex_);
        channel = channels_.value(id);
    }

    // Lost the race against the worker's own terminal transition.
    if (!channel || !channel->cancel())
        return CancelResult::AlreadyTerminal;

    BOOST_LOG_TRIVIAL(info) << "[Dispatcher] Cancelled " << operationKindName(s.kind).toStdString()
                            << " " << id.toStdString();
    return CancelResult::Ok;
}

bool Dispatcher::remove(const OperationId& id)
{
    return registry_.remove(id);
}

int Dispatcher::sweep(qint64 maxAgeMs)
{
    // Entries of unreaped workers stay until operationFinished has been emitted.
    QSet<OperationId> live;
    {
        QMutexLocker lock(&mutex_);
        for (auto it = workers_.cbegin(); it != workers_.cend(); ++it)
            live.insert(it.key());
    }
    int removed = registry_.sweep(maxAgeMs, QDateTime::currentDateTimeUtc(), live);
    if (removed > 0)
        BOOST_LOG_TRIVIAL(debug) << "[Dispatcher] Swept " << removed << " finished operation(s)";
    return removed;
}

int Dispatcher::activeWorkers() const
{
    QMutexLocker lock(&mutex_);
    return workers_.size();
}

void Dispatcher::abandon(const OperationId& id)
{
    {
        QMutexLocker lock(&mutex_);
        channels_.remove(id);
    }
    // A cancel() may already have moved the entry out of Pending.
    if (!registry_.discard(id))
        registry_.release(id);
}

void Dispatcher::reapWorker(const OperationId& id, OperationKind kind)
{
    OperationWorker* worker = nullptr;
    {
        QMutexLocker lock(&mutex_);
        worker = workers_.take(id);
        channels_.remove(id);
    }
    if (!worker) return;  // already joined by shutdown()

    worker->wait();
    delete worker;

    emit operationFinished(id, kind);
}

void Dispatcher::shutdown(int graceMs)
{
    QHash<OperationId, OperationWorker*> workers;
    QHash<OperationId, std::shared_ptr<OperationChannel>> channels;
    {
        QMutexLocker lock(&mutex_);
        shuttingDown_ = true;
        workers.swap(workers_);
        channels.swap(channels_);
    }

    for (const auto& channel : channels)
        channel->cancel();

    for (auto it = workers.begin(); it != workers.end(); ++it) {
        OperationWorker* worker = it.value();
        if (!worker->wait(graceMs)) {
            // Cancellation is cooperative: an in-flight call has to return
            // on its own (collaborators carry their own timeouts).
            BOOST_LOG_TRIVIAL(warning) << "[Dispatcher] Worker " << it.key().toStdString()
                                       << " still inside a step after " << graceMs
                                       << " ms, waiting for it";
            worker->wait();
        }
        delete worker;
    }

    if (!workers.isEmpty())
        BOOST_LOG_TRIVIAL(info) << "[Dispatcher] Shut down " << workers.size() << " worker(s)";
}

} // namespace srt
