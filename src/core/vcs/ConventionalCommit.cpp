#include "ConventionalCommit.hpp"
#include <QRegularExpression>

namespace srt {
namespace ConventionalCommit {

static const QChar FIELD_SEP(0x1f);
static const QChar RECORD_SEP(0x1e);

QStringList knownTypes()
{
    return {"feat", "fix", "docs", "style", "refactor", "perf", "test",
            "chore", "ci", "build", "revert"};
}

bool parseSubject(const QString& subject, CommitInfo* commit)
{
    static const QRegularExpression re(
        QStringLiteral("^([a-z]+)(?:\\(([^)]+)\\))?(!)?:\\s*(.+)$"));

    const QString trimmed = subject.trimmed();
    const auto m = re.match(trimmed);
    if (!m.hasMatch() || !knownTypes().contains(m.captured(1))) {
        commit->type.clear();
        commit->scope.clear();
        commit->description = trimmed;
        return false;
    }

    commit->type = m.captured(1);
    commit->scope = m.captured(2).trimmed();
    commit->description = m.captured(4).trimmed();
    if (!m.captured(3).isEmpty())
        commit->breakingChanges.append(commit->description);
    return true;
}

QStringList breakingChangesFromBody(const QString& body)
{
    QStringList notes;
    const QStringList lines = body.split('\n');
    for (const QString& raw : lines) {
        const QString line = raw.trimmed();
        for (const char* marker : {"BREAKING CHANGE:", "BREAKING-CHANGE:"}) {
            const QLatin1String prefix(marker);
            if (line.startsWith(prefix)) {
                const QString note = line.mid(prefix.size()).trimmed();
                if (!note.isEmpty())
                    notes.append(note);
                break;
            }
        }
    }
    return notes;
}

QString logFormat()
{
    return QStringLiteral("%H%x1f%an%x1f%ae%x1f%aI%x1f%s%x1f%b%x1e");
}

CommitList parseLog(const QString& output)
{
    CommitList commits;
    const QStringList records = output.split(RECORD_SEP, Qt::SkipEmptyParts);
    for (const QString& record : records) {
        const QStringList fields = record.split(FIELD_SEP);
        if (fields.size() < 6)
            continue;

        CommitInfo c;
        c.hash = fields[0].trimmed();
        if (c.hash.isEmpty())
            continue;
        c.authorName = fields[1];
        c.authorEmail = fields[2];
        c.date = QDateTime::fromString(fields[3], Qt::ISODate);
        c.body = fields[5].trimmed();

        parseSubject(fields[4], &c);
        c.breakingChanges.append(breakingChangesFromBody(c.body));
        commits.append(c);
    }
    return commits;
}

QString typeTitle(const QString& type)
{
    if (type == "feat")     return QStringLiteral("New Features");
    if (type == "fix")      return QStringLiteral("Bug Fixes");
    if (type == "docs")     return QStringLiteral("Documentation");
    if (type == "style")    return QStringLiteral("Styles");
    if (type == "refactor") return QStringLiteral("Refactoring");
    if (type == "perf")     return QStringLiteral("Performance Improvements");
    if (type == "test")     return QStringLiteral("Tests");
    if (type == "chore")    return QStringLiteral("Maintenance");
    if (type == "ci")       return QStringLiteral("Continuous Integration");
    if (type == "build")    return QStringLiteral("Build");
    if (type == "revert")   return QStringLiteral("Reverts");
    return QStringLiteral("Other Changes");
}

} // namespace ConventionalCommit
} // namespace srt
