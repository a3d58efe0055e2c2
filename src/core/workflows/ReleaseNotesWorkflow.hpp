#pragma once

#include "core/ai/IAiProvider.hpp"
#include "core/operations/IOperationWorkflow.hpp"
#include "core/release/IArtifactStore.hpp"
#include "core/vcs/IVcsClient.hpp"
#include <memory>

namespace srt {

/// Collects the commits since the last tag, builds and stores the structured
/// release notes document, then has the AI provider write the notes from it
/// and stores those next to it.
///
/// A failing or missing AI provider does not fail the run: the result then
/// carries the structured document only, with the reason in aiError.
/// Result map: documentPath, notesPath, aiError, path (notes if written,
/// else the document), content (same rule), version, commitCount.
class ReleaseNotesWorkflow : public IOperationWorkflow {
public:
    struct Settings {
        QString version;            // empty: today's date
        QString templatePath;
        QString responsible;        // empty: author of the newest commit
        CommitList presetCommits;
        int aiWaitMs = 120000;
    };

    ReleaseNotesWorkflow(std::unique_ptr<IVcsClient> vcs,
                         std::unique_ptr<IAiProvider> ai,
                         std::unique_ptr<IArtifactStore> store,
                         const Settings& settings);

    QVariant run(OperationContext& context) override;

private:
    QString save(const QString& name, const QString& content);

    std::unique_ptr<IVcsClient> vcs_;
    std::unique_ptr<IAiProvider> ai_;
    std::unique_ptr<IArtifactStore> store_;
    Settings settings_;
};

} // namespace srt
