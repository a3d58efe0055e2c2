#include "ReleaseNotesDocument.hpp"
#include "core/vcs/ConventionalCommit.hpp"
#include <QFile>
#include <QHash>

namespace srt {

static QString typeKey(const CommitInfo& c)
{
    return c.type.isEmpty() ? QStringLiteral("other") : c.type;
}

static QString singleLine(const QString& text)
{
    QStringList lines;
    for (const QString& line : text.split('\n')) {
        const QString t = line.trimmed();
        if (!t.isEmpty())
            lines.append(t);
    }
    return lines.join(QStringLiteral(" | "));
}

static QString commitLine(const CommitInfo& c)
{
    return QStringLiteral("- **%1** [%2] - %3 <%4> (%5)\n")
        .arg(c.description, c.shortHash(), c.authorName, c.authorEmail,
             c.date.toString(Qt::ISODate));
}

QStringList ReleaseNotesDocument::typeOrder(const CommitList& commits)
{
    QStringList present;
    for (const auto& c : commits) {
        const QString key = typeKey(c);
        if (!present.contains(key))
            present.append(key);
    }

    QStringList order;
    for (const QString& t : ConventionalCommit::knownTypes()) {
        if (present.contains(t))
            order.append(t);
    }
    if (present.contains(QStringLiteral("other")))
        order.append(QStringLiteral("other"));
    return order;
}

QString ReleaseNotesDocument::build(const Input& input)
{
    QHash<QString, CommitList> byType;
    for (const auto& c : input.commits)
        byType[typeKey(c)].append(c);

    QString doc;
    doc += QStringLiteral("# Release Notes Data for Version %1\n\n").arg(input.version);

    doc += QStringLiteral("## General Information\n\n");
    doc += QStringLiteral("- **Version**: %1\n").arg(input.version);
    doc += QStringLiteral("- **Date**: %1\n").arg(input.date.toString(Qt::ISODate));
    doc += QStringLiteral("- **Total Commits**: %1\n").arg(input.commits.size());
    if (!input.responsible.isEmpty())
        doc += QStringLiteral("- **Responsible**: %1\n").arg(input.responsible);
    doc += '\n';

    doc += QStringLiteral("## Instructions\n\n");
    doc += QStringLiteral("Follow the template at the end of this document EXACTLY. Copy its structure "
                          "and fill in every section using only the data provided here.\n");
    doc += QStringLiteral("1. Use the title '# Release %1'.\n").arg(input.version);
    if (!input.responsible.isEmpty())
        doc += QStringLiteral("2. The person responsible for the deployment is %1.\n").arg(input.responsible);
    doc += QStringLiteral("3. List EVERY commit in the commit reference section.\n");
    doc += QStringLiteral("4. Keep empty template sections instead of removing them.\n");
    doc += QStringLiteral("Do not invent information.\n\n");

    doc += QStringLiteral("## Summary of Changes\n\n");
    for (const QString& type : typeOrder(input.commits)) {
        const CommitList& list = byType[type];
        doc += QStringLiteral("### %1 (%2)\n\n").arg(ConventionalCommit::typeTitle(type)).arg(list.size());
        for (const auto& c : list) {
            doc += commitLine(c);
            if (!c.body.isEmpty())
                doc += QStringLiteral("  - Details: %1\n").arg(singleLine(c.body));
        }
        doc += '\n';
    }

    bool anyBreaking = false;
    for (const auto& c : input.commits) {
        if (c.breakingChanges.isEmpty())
            continue;
        if (!anyBreaking) {
            doc += QStringLiteral("## Breaking Changes\n\n");
            anyBreaking = true;
        }
        doc += commitLine(c);
        for (const auto& note : c.breakingChanges)
            doc += QStringLiteral("  - Details: %1\n").arg(note);
    }
    if (anyBreaking)
        doc += '\n';

    doc += QStringLiteral("## Commit Details\n\n");
    for (const auto& c : input.commits) {
        if (c.type.isEmpty())
            doc += QStringLiteral("### %1 [%2]\n\n").arg(c.description, c.shortHash());
        else if (c.scope.isEmpty())
            doc += QStringLiteral("### %1: %2 [%3]\n\n").arg(c.type, c.description, c.shortHash());
        else
            doc += QStringLiteral("### %1(%2): %3 [%4]\n\n").arg(c.type, c.scope, c.description, c.shortHash());
        doc += QStringLiteral("**Author**: %1 <%2>\n").arg(c.authorName, c.authorEmail);
        doc += QStringLiteral("**Date**: %1\n\n").arg(c.date.toString(Qt::ISODate));
        if (!c.body.isEmpty())
            doc += c.body + QStringLiteral("\n\n");
        doc += QStringLiteral("---\n\n");
    }

    doc += QStringLiteral("## Template\n\n");
    doc += input.templateText.trimmed().isEmpty() ? fallbackTemplate() : input.templateText;
    doc += '\n';
    return doc;
}

QString ReleaseNotesDocument::loadTemplate(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text))
        return {};
    return QString::fromUtf8(f.readAll());
}

QString ReleaseNotesDocument::fallbackTemplate()
{
    return QStringLiteral(
        "No template file was found. Use the standard release notes layout with these "
        "sections: Summary, Technical Information, Bug Fixes, New Features (by category), "
        "Validation, Tests and Commit Reference.");
}

QString ReleaseNotesDocument::fileName(const QString& version, const QString& suffix)
{
    QString v = version.trimmed();
    v.replace('/', '-');
    v.replace('\\', '-');
    if (v.isEmpty())
        v = QStringLiteral("unversioned");
    if (!suffix.isEmpty())
        v += '_' + suffix;
    return QStringLiteral("release-notes-%1.md").arg(v);
}

} // namespace srt
