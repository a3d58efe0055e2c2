#pragma once

#include "core/vcs/CommitInfo.hpp"
#include <QDate>
#include <QString>

namespace srt {

/// Structured input document handed to the AI provider to write release
/// notes: general information, commits grouped by type, breaking changes,
/// per-commit details and the template the notes must follow.
class ReleaseNotesDocument {
public:
    struct Input {
        QString version;
        QDate date;
        QString responsible;
        CommitList commits;
        QString templateText;   // empty: built-in fallback instructions
    };

    static QString build(const Input& input);

    /// Reads the template file; returns an empty string when it is missing
    /// or unreadable.
    static QString loadTemplate(const QString& path);

    static QString fallbackTemplate();

    /// "release-notes-<version>[_<suffix>].md" with path separators replaced.
    static QString fileName(const QString& version, const QString& suffix = QString());

    /// Ordered type keys present in `commits`: feat, fix, then the other
    /// known types, then "other".
    static QStringList typeOrder(const CommitList& commits);
};

} // namespace srt
