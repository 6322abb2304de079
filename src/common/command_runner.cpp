#include "common/command_runner.hpp"

#include <thread>

#include <QProcess>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace nodeos {

namespace {

const QString kComponent = QStringLiteral("CommandRunner");

std::string trimmedOutput(const QByteArray &output)
{
    return output.trimmed().toStdString();
}

} // namespace

QString formatCommandLine(const QString &program, const QStringList &arguments)
{
    if (arguments.isEmpty()) {
        return program;
    }
    return program + QLatin1Char(' ') + arguments.join(QLatin1Char(' '));
}

QByteArray runCapture(const QString &program, const QStringList &arguments)
{
    const QString commandLine = formatCommandLine(program, arguments);
    NLOG_INFO(kComponent,
              QStringLiteral("run_captured"),
              QStringLiteral("Running captured: %1").arg(commandLine),
              nlohmann::json::object());

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        throw CommandError(ErrorKind::CommandFailed,
                           commandLine.toStdString(),
                           -1,
                           std::string(),
                           process.errorString().toStdString());
    }

    process.closeWriteChannel();

    // -1: host tools such as rebase and pull may legitimately run for minutes.
    if (!process.waitForFinished(-1)) {
        throw CommandError(ErrorKind::CommandFailed,
                           commandLine.toStdString(),
                           -1,
                           trimmedOutput(process.readAll()),
                           process.errorString().toStdString());
    }

    const QByteArray output = process.readAll();

    if (process.exitStatus() != QProcess::NormalExit) {
        throw CommandError(ErrorKind::CommandFailed,
                           commandLine.toStdString(),
                           -1,
                           trimmedOutput(output),
                           "process crashed");
    }

    if (process.exitCode() != 0) {
        NLOG_ERROR(kComponent,
                   QStringLiteral("command_failed"),
                   QStringLiteral("'%1' failed to run").arg(commandLine),
                   (nlohmann::json{{"exitCode", process.exitCode()},
                                   {"output", trimmedOutput(output)}}));
        throw CommandError(ErrorKind::CommandFailed,
                           commandLine.toStdString(),
                           process.exitCode(),
                           trimmedOutput(output),
                           "exit status " + std::to_string(process.exitCode()));
    }

    return output;
}

CommandRunner systemCommandRunner()
{
    return [](const QString &program, const QStringList &arguments) {
        return runCapture(program, arguments);
    };
}

QByteArray runWithRetries(const CommandRunner &runner,
                          int attempts,
                          std::chrono::milliseconds delay,
                          const QString &program,
                          const QStringList &arguments)
{
    if (attempts < 1) {
        attempts = 1;
    }

    for (int attempt = 1;; ++attempt) {
        try {
            return runner(program, arguments);
        } catch (const CommandError &e) {
            if (attempt >= attempts) {
                throw CommandError(ErrorKind::TransientNetwork,
                                   e.commandLine(),
                                   e.exitCode(),
                                   e.output(),
                                   "failed after " + std::to_string(attempts) + " attempts");
            }
            NLOG_WARN(kComponent,
                      QStringLiteral("retry"),
                      QStringLiteral("Attempt %1/%2 of '%3' failed, retrying")
                          .arg(attempt)
                          .arg(attempts)
                          .arg(formatCommandLine(program, arguments)),
                      (nlohmann::json{{"error", e.what()}}));
        }
        std::this_thread::sleep_for(delay * attempt);
    }
}

} // namespace nodeos
