#include "SemanticReleaseCli.hpp"
#include <QRegularExpression>
#include <boost/log/trivial.hpp>

namespace srt {

SemanticReleaseCli::SemanticReleaseCli(const QString& npxBinary, const QString& workingDirectory,
                                       ProcessRunner runner)
    : npxBinary_(npxBinary)
    , workingDirectory_(workingDirectory)
    , runner_(runner)
{
}

bool SemanticReleaseCli::verify(QString* version, QString* error)
{
    const ProcessResult r = runner_.run(npxBinary_, {"semantic-release", "--version"},
                                        workingDirectory_);
    if (!r.ok()) {
        *error = QStringLiteral("semantic-release is not available (%1)")
                     .arg(r.errorSummary(npxBinary_));
        return false;
    }
    *version = r.standardOutput.trimmed();
    return true;
}

bool SemanticReleaseCli::run(bool dryRun, QString* output, QString* error)
{
    QStringList args{"semantic-release"};
    if (dryRun)
        args.append("--dry-run");

    BOOST_LOG_TRIVIAL(info) << "[SemanticRelease] Running" << (dryRun ? " (dry run)" : "");
    const ProcessResult r = runner_.run(npxBinary_, args, workingDirectory_);

    *output = r.standardOutput;
    if (!r.standardError.trimmed().isEmpty())
        *output += '\n' + r.standardError;

    if (!r.ok()) {
        *error = QStringLiteral("semantic-release failed: %1")
                     .arg(r.errorSummary(QStringLiteral("npx")));
        return false;
    }
    return true;
}

QString SemanticReleaseCli::nextVersionFromOutput(const QString& output)
{
    static const QRegularExpression re(
        QStringLiteral("The next release version is (\\d+\\.\\d+\\.\\d+[0-9A-Za-z.+-]*)"));
    const auto m = re.match(output);
    return m.hasMatch() ? m.captured(1) : QString();
}

} // namespace srt
