#pragma once

#include "core/ai/IAiProvider.hpp"
#include "core/operations/IOperationWorkflow.hpp"
#include "core/vcs/IVcsClient.hpp"
#include <QVariantMap>
#include <memory>

namespace srt {

/// Reads the working tree changes, asks the AI provider for a commit
/// analysis and returns it as a map with the keys title, commitType,
/// description, scope, securityAnalysis and breakingChanges.
class AiAnalysisWorkflow : public IOperationWorkflow {
public:
    AiAnalysisWorkflow(std::unique_ptr<IVcsClient> vcs,
                       std::unique_ptr<IAiProvider> ai,
                       const QString& presetDiff,
                       int aiWaitMs);

    QVariant run(OperationContext& context) override;

    static QString buildPrompt(const QString& changes);

    /// Pulls the JSON object out of a model reply: a ```json fence, then a
    /// plain ``` fence, then the outermost braces, else the trimmed reply.
    static QString extractJson(const QString& reply);

    /// Parses the reply into the analysis map. Missing fields or invalid
    /// JSON yield a generic "chore" analysis scoped "general".
    static QVariantMap analysisFromReply(const QString& reply);

private:
    std::unique_ptr<IVcsClient> vcs_;
    std::unique_ptr<IAiProvider> ai_;
    QString presetDiff_;
    int aiWaitMs_;
};

} // namespace srt
