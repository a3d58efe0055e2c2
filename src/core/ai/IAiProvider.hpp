#pragma once

#include <QObject>
#include <QString>
#include <functional>

namespace srt {

struct AiReply {
    QString text;
    QString error;
    QString model;      // model that produced the reply, or the last one tried

    bool ok() const { return error.isEmpty(); }

    static AiReply failure(const QString& message)
    {
        AiReply r;
        r.error = message;
        return r;
    }
};

/// Text generation backend. Async only: the reply arrives through `done`
/// on the thread that owns `context`. Anything the provider allocates for
/// the request is parented to `context`, so deleting it aborts the request
/// without a callback.
class IAiProvider {
public:
    using Callback = std::function<void(const AiReply&)>;

    virtual ~IAiProvider() = default;

    virtual void generateText(const QString& prompt, QObject* context, Callback done) = 0;
};

} // namespace srt
