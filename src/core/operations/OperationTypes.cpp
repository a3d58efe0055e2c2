#include "OperationTypes.hpp"

namespace srt {

QString operationKindName(OperationKind kind)
{
    switch (kind) {
    case OperationKind::AiAnalysis:             return QStringLiteral("ai_analysis");
    case OperationKind::ReleaseNotesGeneration: return QStringLiteral("release_notes");
    case OperationKind::SemanticRelease:        return QStringLiteral("semantic_release");
    }
    return QStringLiteral("unknown");
}

bool operationKindFromName(const QString& name, OperationKind* kind)
{
    for (OperationKind k : allOperationKinds()) {
        if (operationKindName(k) == name) {
            if (kind) *kind = k;
            return true;
        }
    }
    return false;
}

QList<OperationKind> allOperationKinds()
{
    return {OperationKind::AiAnalysis,
            OperationKind::ReleaseNotesGeneration,
            OperationKind::SemanticRelease};
}

QString operationStateName(OperationState state)
{
    switch (state) {
    case OperationState::Pending:   return QStringLiteral("pending");
    case OperationState::Running:   return QStringLiteral("running");
    case OperationState::Completed: return QStringLiteral("completed");
    case OperationState::Failed:    return QStringLiteral("failed");
    case OperationState::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

QString operationEventTypeName(OperationEvent::Type type)
{
    switch (type) {
    case OperationEvent::Type::Progress:  return QStringLiteral("progress");
    case OperationEvent::Type::Completed: return QStringLiteral("completed");
    case OperationEvent::Type::Failed:    return QStringLiteral("failed");
    case OperationEvent::Type::Cancelled: return QStringLiteral("cancelled");
    case OperationEvent::Type::Lagged:    return QStringLiteral("lagged");
    }
    return QStringLiteral("unknown");
}

static OperationEvent makeEvent(OperationEvent::Type type, const OperationId& id, OperationKind kind)
{
    OperationEvent e;
    e.type = type;
    e.operationId = id;
    e.kind = kind;
    e.timestamp = QDateTime::currentDateTimeUtc();
    return e;
}

OperationEvent OperationEvent::progress(const OperationId& id, OperationKind kind, const QString& text)
{
    auto e = makeEvent(Type::Progress, id, kind);
    e.text = text;
    return e;
}

OperationEvent OperationEvent::completed(const OperationId& id, OperationKind kind, const QVariant& result)
{
    auto e = makeEvent(Type::Completed, id, kind);
    e.result = result;
    return e;
}

OperationEvent OperationEvent::failed(const OperationId& id, OperationKind kind, const QString& message)
{
    auto e = makeEvent(Type::Failed, id, kind);
    e.text = message;
    return e;
}

OperationEvent OperationEvent::cancelled(const OperationId& id, OperationKind kind)
{
    return makeEvent(Type::Cancelled, id, kind);
}

OperationEvent OperationEvent::lagged(quint64 missed)
{
    OperationEvent e;
    e.type = Type::Lagged;
    e.missed = missed;
    e.timestamp = QDateTime::currentDateTimeUtc();
    return e;
}

} // namespace srt
