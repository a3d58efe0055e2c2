#pragma once

#include "IReleaseTool.hpp"
#include "core/process/ProcessRunner.hpp"

namespace srt {

/// Runs `npx semantic-release` in the repository.
class SemanticReleaseCli : public IReleaseTool {
public:
    SemanticReleaseCli(const QString& npxBinary, const QString& workingDirectory,
                       ProcessRunner runner = ProcessRunner(600000));

    bool verify(QString* version, QString* error) override;
    bool run(bool dryRun, QString* output, QString* error) override;

    /// "The next release version is 1.4.0" -> "1.4.0"; empty when absent.
    static QString nextVersionFromOutput(const QString& output);

private:
    QString npxBinary_;
    QString workingDirectory_;
    ProcessRunner runner_;
};

} // namespace srt
