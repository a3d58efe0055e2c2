#include "OperationWorker.hpp"
#include "AsyncBridge.hpp"
#include "OperationChannel.hpp"
#include "OperationContext.hpp"
#include "OperationError.hpp"
#include "OperationRegistry.hpp"
#include <QElapsedTimer>
#include <boost/log/trivial.hpp>

namespace srt {

const QString OperationHarness::INTERNAL_ERROR_MESSAGE = QStringLiteral("internal error");

OperationState OperationHarness::execute(OperationChannel& channel,
                                         OperationRegistry& registry,
                                         IOperationWorkflow& workflow)
{
    const std::string tag = operationKindName(channel.kind()).toStdString()
                          + " " + channel.id().toStdString();

    registry.markRunning(channel.id());

    QElapsedTimer timer;
    timer.start();

    OperationState outcome = OperationState::Failed;
    {
        AsyncBridge bridge;
        OperationContext context(&channel, &bridge);

        try {
            // Checkpoint before anything runs: a cancel issued right after
            // start() must never let the first step begin.
            context.checkpoint();
            QVariant result = workflow.run(context);
            context.checkpoint();
            if (channel.complete(result))
                outcome = OperationState::Completed;
            else
                outcome = registry.status(channel.id()).state;
        } catch (const OperationCancelled&) {
            channel.cancel();
            outcome = OperationState::Cancelled;
        } catch (const OperationError& e) {
            BOOST_LOG_TRIVIAL(warning) << "[Worker] " << tag << " failed: " << e.what();
            channel.fail(e.message());
            outcome = registry.status(channel.id()).state;
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "[Worker] " << tag << " internal error after "
                                     << context.stepsStarted() << " step(s): " << e.what();
            channel.fail(INTERNAL_ERROR_MESSAGE);
            outcome = registry.status(channel.id()).state;
        } catch (...) {
            BOOST_LOG_TRIVIAL(error) << "[Worker] " << tag << " internal error after "
                                     << context.stepsStarted() << " step(s): unknown exception";
            channel.fail(INTERNAL_ERROR_MESSAGE);
            outcome = registry.status(channel.id()).state;
        }
    }

    BOOST_LOG_TRIVIAL(info) << "[Worker] " << tag << " finished as "
                            << operationStateName(outcome).toStdString()
                            << " in " << timer.elapsed() << " ms";
    return outcome;
}

OperationWorker::OperationWorker(std::shared_ptr<OperationChannel> channel,
                                 OperationRegistry* registry,
                                 std::unique_ptr<IOperationWorkflow> workflow,
                                 QObject* parent)
    : QThread(parent)
    , channel_(std::move(channel))
    , registry_(registry)
    , workflow_(std::move(workflow))
{
    setObjectName(QStringLiteral("op-") + operationKindName(channel_->kind()));
}

OperationWorker::~OperationWorker()
{
    wait();
}

void OperationWorker::run()
{
    outcome_ = OperationHarness::execute(*channel_, *registry_, *workflow_);
    // Collaborator objects may hold thread-affine resources; drop them here.
    workflow_.reset();
    // The kind stays reserved until nothing of this run is left executing,
    // even when the entry was cancelled long before.
    registry_->release(channel_->id());
}

} // namespace srt
