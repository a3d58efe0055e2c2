#pragma once

#include <QString>
#include <QStringList>

namespace srt {

struct ProcessResult {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    QString standardOutput;
    QString standardError;

    bool ok() const { return started && !timedOut && exitCode == 0; }

    /// One-line failure reason for logs and Failed messages.
    QString errorSummary(const QString& program) const;
};

/// Blocking QProcess wrapper used from worker threads.
class ProcessRunner {
public:
    explicit ProcessRunner(int timeoutMs = 60000);

    ProcessResult run(const QString& program, const QStringList& arguments,
                      const QString& workingDirectory = {}) const;

    int timeoutMs() const { return timeoutMs_; }

private:
    int timeoutMs_;
};

} // namespace srt
