#include "AiRequest.hpp"
#include "core/ai/IAiProvider.hpp"
#include "core/operations/AsyncBridge.hpp"
#include "core/operations/OperationContext.hpp"
#include "core/operations/OperationError.hpp"
#include <boost/log/trivial.hpp>

namespace srt {

QString requestAiText(OperationContext& context, IAiProvider* provider,
                      const QString& prompt, int waitMs)
{
    if (!provider)
        throw OperationError::collaborator(QStringLiteral("AI provider not available"));

    AsyncBridge& bridge = context.bridge();
    AiReply reply;
    const bool answered = bridge.await<AiReply>(
        [provider, &bridge, &prompt](std::function<void(const AiReply&)> done) {
            provider->generateText(prompt, bridge.scope(), std::move(done));
        },
        &reply, waitMs);

    if (!answered)
        throw OperationError::collaborator(QStringLiteral("AI request timed out"));
    if (!reply.ok())
        throw OperationError::collaborator(reply.error);

    BOOST_LOG_TRIVIAL(debug) << "[AI] " << context.id().toStdString() << " got "
                             << reply.text.size() << " chars from " << reply.model.toStdString();
    return reply.text;
}

} // namespace srt
