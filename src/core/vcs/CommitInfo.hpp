#pragma once

#include <QDateTime>
#include <QList>
#include <QString>
#include <QStringList>

namespace srt {

struct CommitInfo {
    QString hash;
    QString type;           // conventional type ("feat", "fix", ...); empty if the subject has none
    QString scope;
    QString description;    // subject without the "type(scope):" prefix
    QString body;
    QString authorName;
    QString authorEmail;
    QDateTime date;
    QStringList breakingChanges;

    QString shortHash() const { return hash.left(7); }
};

using CommitList = QList<CommitInfo>;

} // namespace srt
