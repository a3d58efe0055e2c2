#include "SemanticReleaseWorkflow.hpp"
#include "core/operations/OperationContext.hpp"
#include "core/operations/OperationError.hpp"
#include "core/release/SemanticReleaseCli.hpp"
#include <QVariantMap>

namespace srt {

SemanticReleaseWorkflow::SemanticReleaseWorkflow(std::unique_ptr<IReleaseTool> tool, bool dryRun)
    : tool_(std::move(tool))
    , dryRun_(dryRun)
{
}

QVariant SemanticReleaseWorkflow::run(OperationContext& context)
{
    if (!tool_)
        throw OperationError::collaborator(QStringLiteral("release tool not available"));

    const QString toolVersion = context.step(QStringLiteral("Verifying semantic-release installation..."), [&]() {
        QString version, error;
        if (!tool_->verify(&version, &error))
            throw OperationError::collaborator(error);
        return version;
    });

    const QString label = dryRun_ ? QStringLiteral("Running semantic-release (dry run)...")
                                  : QStringLiteral("Running semantic-release...");
    const QString output = context.step(label, [&]() {
        QString out, error;
        if (!tool_->run(dryRun_, &out, &error))
            throw OperationError::collaborator(error);
        return out;
    });

    QVariantMap result;
    result["output"] = output;
    result["dryRun"] = dryRun_;
    result["toolVersion"] = toolVersion;
    result["nextVersion"] = SemanticReleaseCli::nextVersionFromOutput(output);
    return result;
}

} // namespace srt
