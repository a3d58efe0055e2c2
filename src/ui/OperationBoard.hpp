#pragma once

#include "core/operations/OperationTypes.hpp"
#include <QAbstractListModel>
#include <QTimer>
#include <memory>

namespace srt {

class Dispatcher;
class EventReceiver;

/// Render-loop view of background operations, one row per operation.
///
/// Every tick drains the subscription without blocking, reconciles each row
/// with Dispatcher::status() (which also covers events lost to a lag) and
/// sweeps terminal entries older than the history limit. Rows whose entry is
/// gone from the dispatcher are dropped.
class OperationBoard : public QAbstractListModel {
    Q_OBJECT
    Q_PROPERTY(int count READ rowCount NOTIFY countChanged)
    Q_PROPERTY(bool busy READ isBusy NOTIFY busyChanged)
public:
    enum Roles {
        OperationIdRole = Qt::UserRole + 1,
        KindRole,
        StateRole,
        MessageRole,
        LineRole
    };

    OperationBoard(Dispatcher* dispatcher, int tickMs, qint64 historyMaxAgeMs,
                   QObject* parent = nullptr);

    void start();
    void stop();

    /// One frame: drain, reconcile, sweep. Called by the timer.
    void tick();

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role) const override;
    QHash<int, QByteArray> roleNames() const override;

    /// "[kind] State: message" per row, in start order.
    QStringList lines() const;

    bool isBusy() const { return busy_; }
    quint64 laggedEvents() const { return laggedEvents_; }
    int frames() const { return frames_; }

    static QString summarizeResult(OperationKind kind, const QVariant& result);

signals:
    void countChanged();
    void busyChanged();
    void frameRendered();

private:
    struct Row {
        OperationId id;
        OperationKind kind = OperationKind::AiAnalysis;
        OperationState state = OperationState::Pending;
        QString message;
    };

    int indexOf(const OperationId& id) const;
    bool applyEvent(const OperationEvent& event);
    bool reconcile();
    static QString lineFor(const Row& row);

    Dispatcher* dispatcher_;
    std::shared_ptr<EventReceiver> receiver_;
    QTimer timer_;
    qint64 historyMaxAgeMs_;
    QList<Row> rows_;
    bool busy_ = false;
    quint64 laggedEvents_ = 0;
    int frames_ = 0;
};

} // namespace srt
