#pragma once

#include "CommitInfo.hpp"
#include <QString>
#include <QStringList>

namespace srt {

/// Conventional commit helpers.
///
/// A subject such as "feat(parser)!: accept tabs" yields type "feat",
/// scope "parser" and description "accept tabs". The "!" marker and
/// "BREAKING CHANGE:" / "BREAKING-CHANGE:" body lines become entries in
/// breakingChanges. Subjects without a recognised type keep the whole
/// subject as description and an empty type.
namespace ConventionalCommit {

QStringList knownTypes();

/// Fills type, scope, description and the "!" breaking marker.
/// Returns true when the subject follows the convention.
bool parseSubject(const QString& subject, CommitInfo* commit);

QStringList breakingChangesFromBody(const QString& body);

/// Field separator (0x1f) and record separator (0x1e) used in the git log
/// format string.
QString logFormat();

/// Parses `git log --format=<logFormat()>` output, newest first.
CommitList parseLog(const QString& output);

/// Section heading used for a type in release notes.
QString typeTitle(const QString& type);

} // namespace ConventionalCommit

} // namespace srt
