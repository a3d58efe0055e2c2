#pragma once

#include "IOperationWorkflow.hpp"
#include <QThread>
#include <memory>

namespace srt {

class OperationChannel;
class OperationRegistry;

/// Runs one workflow to a single terminal outcome on the calling thread.
///
/// Marks the entry Running, opens an AsyncBridge for the whole run and maps
/// every exit path onto the channel:
///   result returned      -> Completed(result)
///   OperationCancelled   -> Cancelled
///   OperationError       -> Failed(message)
///   anything else thrown -> Failed("internal error"), logged with context
/// Nothing escapes execute().
class OperationHarness {
public:
    static const QString INTERNAL_ERROR_MESSAGE;

    static OperationState execute(OperationChannel& channel,
                                  OperationRegistry& registry,
                                  IOperationWorkflow& workflow);
};

/// Thread substrate for one operation. Releases the kind reservation as
/// the last thing the thread does.
class OperationWorker : public QThread {
    Q_OBJECT
public:
    OperationWorker(std::shared_ptr<OperationChannel> channel,
                    OperationRegistry* registry,
                    std::unique_ptr<IOperationWorkflow> workflow,
                    QObject* parent = nullptr);
    ~OperationWorker() override;

    OperationState outcome() const { return outcome_; }

protected:
    void run() override;

private:
    std::shared_ptr<OperationChannel> channel_;
    OperationRegistry* registry_;
    std::unique_ptr<IOperationWorkflow> workflow_;
    OperationState outcome_ = OperationState::Pending;
};

} // namespace srt
