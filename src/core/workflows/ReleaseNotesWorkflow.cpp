#include "ReleaseNotesWorkflow.hpp"
#include "AiRequest.hpp"
#include "ReleaseNotesDocument.hpp"
#include "core/operations/OperationContext.hpp"
#include "core/operations/OperationError.hpp"
#include <QVariantMap>
#include <boost/log/trivial.hpp>

namespace srt {

ReleaseNotesWorkflow::ReleaseNotesWorkflow(std::unique_ptr<IVcsClient> vcs,
                                           std::unique_ptr<IAiProvider> ai,
                                           std::unique_ptr<IArtifactStore> store,
                                           const Settings& settings)
    : vcs_(std::move(vcs))
    , ai_(std::move(ai))
    , store_(std::move(store))
    , settings_(settings)
{
}

QVariant ReleaseNotesWorkflow::run(OperationContext& context)
{
    const CommitList commits = context.step(QStringLiteral("Fetching commits since the last release..."), [&]() {
        CommitList list = settings_.presetCommits;
        if (list.isEmpty() && vcs_) {
            QString error;
            if (!vcs_->commitsSinceLastTag(&list, &error))
                throw OperationError::collaborator(error);
        }
        if (list.isEmpty())
            throw OperationError::user(QStringLiteral("No commits found since the last release"));
        return list;
    });

    const QDate today = QDate::currentDate();
    const QString version = settings_.version.isEmpty()
        ? today.toString(QStringLiteral("yyyy.MM.dd"))
        : settings_.version;

    const QString document = context.step(
        QStringLiteral("Building release notes document from %1 commit(s)...").arg(commits.size()), [&]() {
        ReleaseNotesDocument::Input input;
        input.version = version;
        input.date = today;
        input.responsible = settings_.responsible.isEmpty() ? commits.first().authorName
                                                            : settings_.responsible;
        input.commits = commits;
        input.templateText = ReleaseNotesDocument::loadTemplate(settings_.templatePath);
        if (input.templateText.isEmpty())
            BOOST_LOG_TRIVIAL(info) << "[ReleaseNotes] Template " << settings_.templatePath.toStdString()
                                    << " not found, using built-in layout";
        return ReleaseNotesDocument::build(input);
    });

    const QString documentPath = context.step(QStringLiteral("Saving structured document..."), [&]() {
        return save(ReleaseNotesDocument::fileName(version, QStringLiteral("STRUCTURED")), document);
    });

    // The structured document is already on disk: an AI failure from here on
    // leaves the run Completed with that document only.
    QString notes, notesPath, aiError;
    try {
        notes = context.step(QStringLiteral("Generating release notes with AI..."), [&]() {
            return requestAiText(context, ai_.get(), document, settings_.aiWaitMs);
        });
        notesPath = context.step(QStringLiteral("Saving AI release notes..."), [&]() {
            return save(ReleaseNotesDocument::fileName(version, QStringLiteral("AI")), notes);
        });
    } catch (const OperationError& e) {
        context.checkpoint();
        aiError = e.message();
        BOOST_LOG_TRIVIAL(warning) << "[ReleaseNotes] AI notes unavailable, keeping structured document: "
                                   << aiError.toStdString();
    }

    QVariantMap result;
    result["documentPath"] = documentPath;
    result["notesPath"] = notesPath;
    result["aiError"] = aiError;
    result["path"] = notesPath.isEmpty() ? documentPath : notesPath;
    result["content"] = notesPath.isEmpty() ? document : notes;
    result["version"] = version;
    result["commitCount"] = commits.size();
    return result;
}

QString ReleaseNotesWorkflow::save(const QString& name, const QString& content)
{
    if (!store_)
        throw OperationError::collaborator(QStringLiteral("no artifact store configured"));
    QString written, error;
    if (!store_->write(name, content, &written, &error))
        throw OperationError::collaborator(error);
    return written;
}

} // namespace srt
