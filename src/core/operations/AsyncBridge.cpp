#include "AsyncBridge.hpp"
#include <QCoreApplication>
#include <QEvent>

namespace srt {

AsyncBridge::AsyncBridge()
    : scope_(std::make_unique<QObject>())
{
    scope_->setObjectName(QStringLiteral("AsyncBridgeScope"));
}

AsyncBridge::~AsyncBridge()
{
    // Children (pending replies, network managers) are destroyed with the
    // scope; anything queued via deleteLater() is flushed right after.
    scope_.reset();
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
}

} // namespace srt
