#include "OperationContext.hpp"
#include "OperationChannel.hpp"
#include "OperationError.hpp"

namespace srt {

OperationContext::OperationContext(OperationChannel* channel, AsyncBridge* bridge)
    : channel_(channel)
    , bridge_(bridge)
{
}

const OperationId& OperationContext::id() const
{
    return channel_->id();
}

OperationKind OperationContext::kind() const
{
    return channel_->kind();
}

bool OperationContext::isCancelled() const
{
    return channel_->token().isCancelled();
}

void OperationContext::checkpoint() const
{
    if (isCancelled())
        throw OperationCancelled();
}

void OperationContext::progress(const QString& text)
{
    channel_->progress(text);
}

} // namespace srt
