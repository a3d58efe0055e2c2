#pragma once

#include "core/operations/IOperationWorkflow.hpp"
#include "core/release/IReleaseTool.hpp"
#include <memory>

namespace srt {

/// Verifies semantic-release is installed, then runs it.
/// Result: map with output, dryRun, toolVersion and nextVersion (empty
/// when the tool announced no release).
class SemanticReleaseWorkflow : public IOperationWorkflow {
public:
    SemanticReleaseWorkflow(std::unique_ptr<IReleaseTool> tool, bool dryRun);

    QVariant run(OperationContext& context) override;

private:
    std::unique_ptr<IReleaseTool> tool_;
    bool dryRun_;
};

} // namespace srt
