#pragma once

#include "CommitInfo.hpp"
#include <QString>

namespace srt {

/// Read-only view of the working repository. Calls block; workers only.
/// Each call returns false and fills `error` when the VCS could not be
/// queried.
class IVcsClient {
public:
    virtual ~IVcsClient() = default;

    /// Staged diff, unstaged diff and untracked files as one text.
    /// Empty text when the working tree is clean.
    virtual bool changes(QString* text, QString* error) = 0;

    /// Most recent tag reachable from HEAD; empty when there is none.
    virtual bool lastTag(QString* tag, QString* error) = 0;

    /// Commits after lastTag() (all commits when there is no tag), newest first.
    virtual bool commitsSinceLastTag(CommitList* commits, QString* error) = 0;
};

} // namespace srt
