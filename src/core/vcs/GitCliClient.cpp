#include "GitCliClient.hpp"
#include "ConventionalCommit.hpp"
#include <boost/log/trivial.hpp>

namespace srt {

GitCliClient::GitCliClient(const QString& gitBinary, const QString& repositoryPath,
                           ProcessRunner runner)
    : gitBinary_(gitBinary)
    , repositoryPath_(repositoryPath)
    , runner_(runner)
{
}

bool GitCliClient::git(const QStringList& args, QString* output, QString* error) const
{
    const ProcessResult r = runner_.run(gitBinary_, args, repositoryPath_);
    if (!r.ok()) {
        if (error)
            *error = r.errorSummary(QStringLiteral("git ") + args.value(0));
        return false;
    }
    if (output)
        *output = r.standardOutput;
    return true;
}

bool GitCliClient::changes(QString* text, QString* error)
{
    QString staged, unstaged, untracked;
    if (!git({"diff", "--cached"}, &staged, error)) return false;
    if (!git({"diff"}, &unstaged, error)) return false;
    if (!git({"ls-files", "--others", "--exclude-standard"}, &untracked, error)) return false;

    QString out;
    if (!staged.trimmed().isEmpty())
        out += QStringLiteral("=== STAGED CHANGES ===\n") + staged + '\n';
    if (!unstaged.trimmed().isEmpty())
        out += QStringLiteral("=== UNSTAGED CHANGES ===\n") + unstaged + '\n';
    if (!untracked.trimmed().isEmpty())
        out += QStringLiteral("=== UNTRACKED FILES ===\n") + untracked;

    *text = out;
    BOOST_LOG_TRIVIAL(debug) << "[Git] Collected " << out.size() << " chars of changes";
    return true;
}

bool GitCliClient::lastTag(QString* tag, QString* error)
{
    const ProcessResult r = runner_.run(gitBinary_, {"describe", "--tags", "--abbrev=0"},
                                        repositoryPath_);
    if (!r.started || r.timedOut) {
        if (error) *error = r.errorSummary(QStringLiteral("git describe"));
        return false;
    }
    // Non-zero exit: repository without tags.
    *tag = r.exitCode == 0 ? r.standardOutput.trimmed() : QString();
    return true;
}

bool GitCliClient::commitsSinceLastTag(CommitList* commits, QString* error)
{
    QString tag;
    if (!lastTag(&tag, error))
        return false;

    QStringList args{"log", QStringLiteral("--format=") + ConventionalCommit::logFormat()};
    if (!tag.isEmpty())
        args.append(tag + QStringLiteral("..HEAD"));

    QString output;
    if (!git(args, &output, error))
        return false;

    *commits = ConventionalCommit::parseLog(output);
    BOOST_LOG_TRIVIAL(debug) << "[Git] " << commits->size() << " commit(s) since "
                             << (tag.isEmpty() ? std::string("first commit") : tag.toStdString());
    return true;
}

} // namespace srt
