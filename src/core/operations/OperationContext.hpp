#pragma once

#include "OperationTypes.hpp"
#include <QString>
#include <utility>

namespace srt {

class AsyncBridge;
class OperationChannel;

/// What a workflow sees of the harness while it runs.
///
/// step() is the unit of work: it checks for cancellation, publishes the
/// step's status text and then runs the step. Steps report failure by
/// throwing OperationError; the harness turns that into one Failed event.
class OperationContext {
public:
    OperationContext(OperationChannel* channel, AsyncBridge* bridge);

    const OperationId& id() const;
    OperationKind kind() const;

    bool isCancelled() const;

    /// Throws OperationCancelled if the token is set.
    void checkpoint() const;

    void progress(const QString& text);

    template <typename Fn>
    auto step(const QString& status, Fn&& fn) -> decltype(fn())
    {
        checkpoint();
        progress(status);
        ++stepsStarted_;
        return std::forward<Fn>(fn)();
    }

    AsyncBridge& bridge() { return *bridge_; }

    int stepsStarted() const { return stepsStarted_; }

private:
    OperationChannel* channel_;
    AsyncBridge* bridge_;
    int stepsStarted_ = 0;
};

} // namespace srt
