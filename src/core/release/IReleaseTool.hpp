#pragma once

#include <QString>

namespace srt {

/// Release automation tool driven by the semantic release workflow.
class IReleaseTool {
public:
    virtual ~IReleaseTool() = default;

    /// Checks the tool is installed; fills its version string.
    virtual bool verify(QString* version, QString* error) = 0;

    /// Runs a release (or a dry run); fills the tool's combined output.
    virtual bool run(bool dryRun, QString* output, QString* error) = 0;
};

} // namespace srt
