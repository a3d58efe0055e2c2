#pragma once

#include <QEventLoop>
#include <QObject>
#include <QPointer>
#include <QTimer>
#include <functional>
#include <memory>

namespace srt {

/// Scoped nested execution context for calling async-only collaborators
/// from a worker thread that has no event loop of its own.
///
/// Lives on the worker's stack for the duration of one operation.
/// scope() is a QObject owned by the bridge on the worker thread; async
/// clients parent their per-request objects (network managers, replies)
/// to it. The destructor deletes the scope and flushes deferred deletions,
/// so nothing created for the operation outlives it, whichever way the
/// operation ends.
///
/// await() spins a local QEventLoop and never holds a lock while doing so.
class AsyncBridge {
public:
    AsyncBridge();
    ~AsyncBridge();

    AsyncBridge(const AsyncBridge&) = delete;
    AsyncBridge& operator=(const AsyncBridge&) = delete;

    QObject* scope() const { return scope_.get(); }

    /// Start an async call and wait for its completion callback.
    /// `call` receives the completion function and must arrange for it to
    /// be invoked exactly once on this thread. Returns false on timeout
    /// (timeoutMs < 0 waits indefinitely); `out` is left untouched then.
    template <typename T>
    bool await(const std::function<void(std::function<void(const T&)>)>& call,
               T* out, int timeoutMs = -1);

    int completedCalls() const { return completedCalls_; }

private:
    std::unique_ptr<QObject> scope_;
    int completedCalls_ = 0;
};

template <typename T>
bool AsyncBridge::await(const std::function<void(std::function<void(const T&)>)>& call,
                        T* out, int timeoutMs)
{
    struct State {
        bool done = false;
        T value{};
    };

    // The completion may fire after a timeout has already unwound this
    // frame, so it only touches shared state and a guarded loop pointer.
    auto state = std::make_shared<State>();
    QEventLoop loop;
    QPointer<QEventLoop> guard(&loop);

    call([state, guard](const T& value) {
        if (state->done) return;
        state->value = value;
        state->done = true;
        if (guard) guard->quit();
    });

    if (!state->done) {
        QTimer timer;
        if (timeoutMs >= 0) {
            timer.setSingleShot(true);
            QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
            timer.start(timeoutMs);
        }
        loop.exec();
    }

    if (!state->done)
        return false;

    ++completedCalls_;
    if (out) *out = state->value;
    return true;
}

} // namespace srt
