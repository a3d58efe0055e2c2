#pragma once

#include "IVcsClient.hpp"
#include "core/process/ProcessRunner.hpp"

namespace srt {

/// IVcsClient backed by the git command line.
class GitCliClient : public IVcsClient {
public:
    GitCliClient(const QString& gitBinary, const QString& repositoryPath,
                 ProcessRunner runner = ProcessRunner());

    bool changes(QString* text, QString* error) override;
    bool lastTag(QString* tag, QString* error) override;
    bool commitsSinceLastTag(CommitList* commits, QString* error) override;

private:
    bool git(const QStringList& args, QString* output, QString* error) const;

    QString gitBinary_;
    QString repositoryPath_;
    ProcessRunner runner_;
};

} // namespace srt
