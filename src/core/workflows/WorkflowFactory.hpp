#pragma once

#include "core/AppConfig.hpp"
#include "core/ai/IAiProvider.hpp"
#include "core/operations/IOperationWorkflow.hpp"
#include <memory>

namespace srt {

/// Production workflow factory: wires each workflow to the git CLI, the
/// configured AI provider, the file artifact store and semantic-release,
/// all built from the configuration snapshot in the params.
class WorkflowFactory : public IWorkflowFactory {
public:
    std::unique_ptr<IOperationWorkflow> create(OperationKind kind,
                                               const OperationParams& params) override;

    /// nullptr for an unsupported provider name.
    static std::unique_ptr<IAiProvider> createAiProvider(const AppConfig& config);

    /// How long a workflow waits for the provider: every model may use its
    /// full transfer timeout.
    static int aiWaitMs(const AppConfig& config);

    /// Relative paths in the configuration are relative to the repository.
    static QString resolvePath(const AppConfig& config, const QString& path);
};

} // namespace srt
