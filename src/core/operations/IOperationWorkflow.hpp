#pragma once

#include "OperationTypes.hpp"
#include <QVariant>
#include <memory>

namespace srt {

class OperationContext;
struct OperationParams;

/// Ordered step sequence for one operation kind.
/// Constructed on the dispatcher thread with its input snapshot, run once
/// on a worker thread.
class IOperationWorkflow {
public:
    virtual ~IOperationWorkflow() = default;

    /// Returns the Completed payload. Throws OperationError for reportable
    /// failures; OperationCancelled propagates out of checkpoints.
    virtual QVariant run(OperationContext& context) = 0;
};

/// Builds the workflow for a kind from an input snapshot.
/// Called on the dispatcher thread; must not block.
class IWorkflowFactory {
public:
    virtual ~IWorkflowFactory() = default;

    /// Returns nullptr when the kind is not supported.
    virtual std::unique_ptr<IOperationWorkflow> create(OperationKind kind,
                                                       const OperationParams& params) = 0;
};

} // namespace srt
