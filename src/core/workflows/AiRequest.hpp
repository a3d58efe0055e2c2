#pragma once

#include <QString>

namespace srt {

class IAiProvider;
class OperationContext;

/// Runs one prompt through the provider on the operation's AsyncBridge and
/// returns the reply text. Throws OperationError (Collaborator) when the
/// provider fails or does not answer within `waitMs`.
QString requestAiText(OperationContext& context, IAiProvider* provider,
                      const QString& prompt, int waitMs);

} // namespace srt
