#include "OperationBoard.hpp"
#include "core/operations/Dispatcher.hpp"
#include "core/services/EventReceiver.hpp"
#include <QVariantMap>
#include <boost/log/trivial.hpp>

namespace srt {

OperationBoard::OperationBoard(Dispatcher* dispatcher, int tickMs, qint64 historyMaxAgeMs,
                               QObject* parent)
    : QAbstractListModel(parent)
    , dispatcher_(dispatcher)
    , receiver_(dispatcher->subscribe())
    , historyMaxAgeMs_(historyMaxAgeMs)
{
    timer_.setInterval(tickMs);
    connect(&timer_, &QTimer::timeout, this, &OperationBoard::tick);
}

void OperationBoard::start()
{
    timer_.start();
}

void OperationBoard::stop()
{
    timer_.stop();
}

int OperationBoard::indexOf(const OperationId& id) const
{
    for (int i = 0; i < rows_.size(); ++i) {
        if (rows_[i].id == id)
            return i;
    }
    return -1;
}

bool OperationBoard::applyEvent(const OperationEvent& event)
{
    if (event.type == OperationEvent::Type::Lagged) {
        laggedEvents_ += event.missed;
        BOOST_LOG_TRIVIAL(debug) << "[Board] Missed " << event.missed << " event(s)";
        return false;
    }

    bool added = false;
    int i = indexOf(event.operationId);
    if (i < 0) {
        Row row;
        row.id = event.operationId;
        row.kind = event.kind;
        rows_.append(row);
        i = rows_.size() - 1;
        added = true;
    }

    Row& row = rows_[i];
    // Terminal rows never move again.
    if (isTerminalState(row.state))
        return added;

    switch (event.type) {
    case OperationEvent::Type::Progress:
        row.state = OperationState::Running;
        row.message = event.text;
        break;
    case OperationEvent::Type::Completed:
        row.state = OperationState::Completed;
        row.message = summarizeResult(row.kind, event.result);
        break;
    case OperationEvent::Type::Failed:
        row.state = OperationState::Failed;
        row.message = event.text;
        break;
    case OperationEvent::Type::Cancelled:
        row.state = OperationState::Cancelled;
        row.message = QStringLiteral("cancelled");
        break;
    case OperationEvent::Type::Lagged:
        break;
    }
    return added;
}

bool OperationBoard::reconcile()
{
    bool changed = false;

    for (const RunningOperation& op : dispatcher_->listRunning()) {
        if (indexOf(op.second) < 0) {
            Row row;
            row.id = op.second;
            row.kind = op.first;
            rows_.append(row);
            changed = true;
        }
    }

    for (int i = rows_.size() - 1; i >= 0; --i) {
        Row& row = rows_[i];
        const OperationStatus s = dispatcher_->status(row.id);
        if (!s.isValid()) {
            rows_.removeAt(i);
            changed = true;
            continue;
        }
        if (isTerminalState(row.state) && row.state == s.state)
            continue;
        if (row.state != s.state) {
            row.state = s.state;
            changed = true;
        }
        if (s.state == OperationState::Completed)
            row.message = summarizeResult(row.kind, s.result);
        else if (s.state == OperationState::Cancelled)
            row.message = QStringLiteral("cancelled");
        else if (!s.message.isEmpty())
            row.message = s.message;
    }
    return changed;
}

void OperationBoard::tick()
{
    const int before = rows_.size();

    OperationEvent event;
    while (receiver_->tryNext(&event))
        applyEvent(event);

    dispatcher_->sweep(historyMaxAgeMs_);
    reconcile();

    beginResetModel();
    endResetModel();
    if (rows_.size() != before)
        emit countChanged();

    const bool busy = !dispatcher_->listRunning().isEmpty();
    if (busy != busy_) {
        busy_ = busy;
        emit busyChanged();
    }

    ++frames_;
    emit frameRendered();
}

int OperationBoard::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid()) return 0;
    return rows_.size();
}

QVariant OperationBoard::data(const QModelIndex& index, int role) const
{
    if (index.row() < 0 || index.row() >= rows_.size()) return {};
    const Row& r = rows_[index.row()];
    switch (role) {
    case OperationIdRole: return r.id;
    case KindRole:        return operationKindName(r.kind);
    case StateRole:       return operationStateName(r.state);
    case MessageRole:     return r.message;
    case Qt::DisplayRole:
    case LineRole:        return lineFor(r);
    default:              return {};
    }
}

QHash<int, QByteArray> OperationBoard::roleNames() const
{
    return {
        {OperationIdRole, "operationId"},
        {KindRole,        "kind"},
        {StateRole,       "state"},
        {MessageRole,     "message"},
        {LineRole,        "line"}
    };
}

QStringList OperationBoard::lines() const
{
    QStringList out;
    for (const auto& r : rows_)
        out.append(lineFor(r));
    return out;
}

QString OperationBoard::lineFor(const Row& row)
{
    QString line = QStringLiteral("[%1] %2").arg(operationKindName(row.kind),
                                                 operationStateName(row.state));
    if (!row.message.isEmpty())
        line += QStringLiteral(": ") + row.message;
    return line;
}

QString OperationBoard::summarizeResult(OperationKind kind, const QVariant& result)
{
    const QVariantMap m = result.toMap();
    switch (kind) {
    case OperationKind::AiAnalysis: {
        const QString type = m.value("commitType").toString();
        const QString scope = m.value("scope").toString();
        const QString title = m.value("title").toString();
        if (title.isEmpty()) break;
        return scope.isEmpty() ? QStringLiteral("%1: %2").arg(type, title)
                               : QStringLiteral("%1(%2): %3").arg(type, scope, title);
    }
    case OperationKind::ReleaseNotesGeneration:
        if (!m.contains("path"))
            break;
        if (!m.value("aiError").toString().isEmpty())
            return QStringLiteral("release notes document saved to %1 (AI: %2)")
                .arg(m.value("path").toString(), m.value("aiError").toString());
        return QStringLiteral("release notes saved to %1").arg(m.value("path").toString());
    case OperationKind::SemanticRelease: {
        const QString next = m.value("nextVersion").toString();
        const bool dry = m.value("dryRun").toBool();
        if (next.isEmpty())
            return dry ? QStringLiteral("dry run: no release pending")
                       : QStringLiteral("no release published");
        return dry ? QStringLiteral("dry run: next version %1").arg(next)
                   : QStringLiteral("released %1").arg(next);
    }
    }
    return QStringLiteral("done");
}

} // namespace srt
