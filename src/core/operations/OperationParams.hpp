#pragma once

#include "core/AppConfig.hpp"
#include "core/vcs/CommitInfo.hpp"

namespace srt {

/// Input snapshot for one operation, copied at start() time.
struct OperationParams {
    AppConfig config;

    // Pre-collected diff for AI analysis. Empty: ask the VCS client.
    QString diff;

    // Pre-collected commits for release notes. Empty: ask the VCS client.
    CommitList commits;

    // Version label used in release notes; empty uses the current date.
    QString version;

    bool dryRun = true;
};

} // namespace srt
