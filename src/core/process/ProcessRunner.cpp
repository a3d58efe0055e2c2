#include "ProcessRunner.hpp"
#include <QProcess>
#include <boost/log/trivial.hpp>

namespace srt {

QString ProcessResult::errorSummary(const QString& program) const
{
    if (!started)
        return QStringLiteral("%1 could not be started").arg(program);
    if (timedOut)
        return QStringLiteral("%1 timed out").arg(program);

    QString detail = standardError.trimmed();
    if (detail.isEmpty())
        detail = standardOutput.trimmed();
    const int newline = detail.indexOf('\n');
    if (newline > 0)
        detail.truncate(newline);
    if (detail.isEmpty())
        return QStringLiteral("%1 exited with code %2").arg(program).arg(exitCode);
    return QStringLiteral("%1 exited with code %2: %3").arg(program).arg(exitCode).arg(detail);
}

ProcessRunner::ProcessRunner(int timeoutMs)
    : timeoutMs_(timeoutMs)
{
}

ProcessResult ProcessRunner::run(const QString& program, const QStringList& arguments,
                                 const QString& workingDirectory) const
{
    ProcessResult result;

    QProcess proc;
    if (!workingDirectory.isEmpty())
        proc.setWorkingDirectory(workingDirectory);

    BOOST_LOG_TRIVIAL(debug) << "[Process] " << program.toStdString() << " "
                             << arguments.join(' ').toStdString();

    proc.start(program, arguments);
    if (!proc.waitForStarted(timeoutMs_)) {
        BOOST_LOG_TRIVIAL(warning) << "[Process] Failed to start " << program.toStdString()
                                   << ": " << proc.errorString().toStdString();
        return result;
    }
    result.started = true;

    if (!proc.waitForFinished(timeoutMs_)) {
        result.timedOut = true;
        proc.kill();
        proc.waitForFinished(1000);
        BOOST_LOG_TRIVIAL(warning) << "[Process] " << program.toStdString() << " killed after "
                                   << timeoutMs_ << " ms";
    }

    result.standardOutput = QString::fromUtf8(proc.readAllStandardOutput());
    result.standardError = QString::fromUtf8(proc.readAllStandardError());
    if (proc.exitStatus() == QProcess::NormalExit)
        result.exitCode = proc.exitCode();

    return result;
}

} // namespace srt
