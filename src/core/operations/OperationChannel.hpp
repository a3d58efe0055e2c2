#pragma once

#include "OperationTypes.hpp"
#include "CancellationToken.hpp"
#include <QMutex>

namespace srt {

class IEventBus;
class OperationRegistry;

// Per-operation publish gate.
//
// Every event of one operation goes through its channel. The channel mutex
// serializes the registry transition with the matching publish, so each
// receiver sees an operation's events in order and the terminal event last.
// The first terminal transition closes the channel; later progress or
// terminal calls are dropped. A Cancel issued from the UI thread and a
// Completed from the worker race here and exactly one of them wins.
class OperationChannel {
public:
    OperationChannel(const OperationId& id, OperationKind kind,
                     OperationRegistry* registry, IEventBus* bus);

    const OperationId& id() const { return id_; }
    OperationKind kind() const { return kind_; }
    CancellationToken token() const { return token_; }

    /// Publishes Progress and updates the registry message.
    /// Dropped once the channel is closed or the token is set.
    bool progress(const QString& text);

    bool complete(const QVariant& result);
    bool fail(const QString& message);

    /// Sets the token, moves the entry to Cancelled and publishes Cancelled.
    /// Returns false if the operation had already reached a terminal state.
    bool cancel();

    bool isClosed() const;

private:
    const OperationId id_;
    const OperationKind kind_;
    OperationRegistry* registry_;
    IEventBus* bus_;
    CancellationToken token_;

    mutable QMutex mutex_;
    bool closed_ = false;
};

} // namespace srt
