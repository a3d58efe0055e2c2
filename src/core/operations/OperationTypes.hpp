#pragma once

#include <QDateTime>
#include <QHashFunctions>
#include <QMetaType>
#include <QString>
#include <QVariant>
#include <QList>
#include <QPair>

namespace srt {

using OperationId = QString;

/// Closed set of background operation kinds. Also the single-flight key.
enum class OperationKind {
    AiAnalysis,
    ReleaseNotesGeneration,
    SemanticRelease
};

inline size_t qHash(OperationKind kind, size_t seed = 0) noexcept
{
    return ::qHash(static_cast<int>(kind), seed);
}

/// Stable text name ("ai_analysis", "release_notes", "semantic_release").
QString operationKindName(OperationKind kind);

/// Parse a text name back to a kind. Returns false for unknown names.
bool operationKindFromName(const QString& name, OperationKind* kind);

QList<OperationKind> allOperationKinds();

enum class OperationState {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

QString operationStateName(OperationState state);

inline bool isTerminalState(OperationState state)
{
    return state == OperationState::Completed
        || state == OperationState::Failed
        || state == OperationState::Cancelled;
}

/// Immutable snapshot of one registry entry.
/// message: latest progress text while Running, failure text when Failed.
/// result: payload when Completed.
struct OperationStatus {
    OperationId id;
    OperationKind kind = OperationKind::AiAnalysis;
    OperationState state = OperationState::Pending;
    QString message;
    QDateTime startedAt;
    QDateTime finishedAt;
    QVariant result;

    bool isValid() const { return !id.isEmpty(); }
    bool isTerminal() const { return isTerminalState(state); }
};

struct OperationEvent {
    enum class Type {
        Progress,
        Completed,
        Failed,
        Cancelled,
        Lagged      // emitted by a receiver that dropped events, no operation id
    };

    Type type = Type::Progress;
    OperationId operationId;
    OperationKind kind = OperationKind::AiAnalysis;
    QString text;           // progress text or failure message
    QVariant result;        // Completed payload
    QDateTime timestamp;
    quint64 missed = 0;     // Lagged only

    bool isTerminal() const
    {
        return type == Type::Completed || type == Type::Failed || type == Type::Cancelled;
    }

    static OperationEvent progress(const OperationId& id, OperationKind kind, const QString& text);
    static OperationEvent completed(const OperationId& id, OperationKind kind, const QVariant& result);
    static OperationEvent failed(const OperationId& id, OperationKind kind, const QString& message);
    static OperationEvent cancelled(const OperationId& id, OperationKind kind);
    static OperationEvent lagged(quint64 missed);
};

QString operationEventTypeName(OperationEvent::Type type);

using RunningOperation = QPair<OperationKind, OperationId>;

enum class StartError {
    None,
    AlreadyRunning,
    UnknownKind,
    SpawnFailed
};

struct StartResult {
    OperationId id;
    OperationKind kind = OperationKind::AiAnalysis;
    StartError error = StartError::None;

    bool ok() const { return error == StartError::None; }
};

enum class CancelResult {
    Ok,
    NotFound,
    AlreadyTerminal
};

} // namespace srt

Q_DECLARE_METATYPE(srt::OperationKind)
Q_DECLARE_METATYPE(srt::OperationEvent)
