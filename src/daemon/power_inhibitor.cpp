#include "daemon/power_inhibitor.hpp"

#include <QProcess>

#include <sys/prctl.h>
#include <csignal>
#include <unistd.h>

#include "common/command_runner.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

namespace nodeos {

namespace {

const QString kComponent = QStringLiteral("PowerInhibitor");

} // namespace

PowerInhibitor::PowerInhibitor(QString program, QStringList arguments)
    : m_program(std::move(program))
    , m_arguments(std::move(arguments))
{
}

PowerInhibitor::~PowerInhibitor()
{
    release();
}

std::unique_ptr<PowerInhibitor> PowerInhibitor::forUpdate(const std::string &systemdInhibitPath)
{
    const QStringList modes = {
        QStringLiteral("shutdown"),
        QStringLiteral("sleep"),
        QStringLiteral("idle"),
        QStringLiteral("handle-power-key"),
        QStringLiteral("handle-suspend-key"),
        QStringLiteral("handle-hibernate-key"),
        QStringLiteral("handle-lid-switch"),
    };

    QStringList args = {
        QStringLiteral("--what=%1").arg(modes.join(QLatin1Char(':'))),
        QStringLiteral("--who=nodeos-agent pid %1").arg(getpid()),
        QStringLiteral("--why=Update Operation"),
        QStringLiteral("/bin/sleep"),
        QStringLiteral("infinity"),
    };
    return std::make_unique<PowerInhibitor>(QString::fromStdString(systemdInhibitPath),
                                            std::move(args));
}

void PowerInhibitor::acquire()
{
    if (isActive()) {
        return;
    }

    NLOG_INFO(kComponent,
              QStringLiteral("inhibit"),
              QStringLiteral("Inhibiting power state changes via systemd"),
              nlohmann::json::object());

    auto process = std::make_unique<QProcess>();
    process->setProcessChannelMode(QProcess::ForwardedChannels);
    // PDEATHSIG only covers a parent that dies after the prctl() call; if we
    // are already gone the child has been reparented and must not linger.
    const pid_t parent = getpid();
    process->setChildProcessModifier([parent] {
        if (::prctl(PR_SET_PDEATHSIG, SIGKILL) != 0 || getppid() != parent) {
            _exit(1);
        }
    });
    process->start(m_program, m_arguments);
    if (!process->waitForStarted()) {
        throw CommandError(ErrorKind::CommandFailed,
                           commandLine().toStdString(),
                           -1,
                           std::string(),
                           process->errorString().toStdString());
    }
    m_process = std::move(process);
}

void PowerInhibitor::release() noexcept
{
    if (!m_process) {
        return;
    }

    if (m_process->state() != QProcess::NotRunning) {
        NLOG_INFO(kComponent,
                  QStringLiteral("release"),
                  QStringLiteral("Releasing systemd inhibitor"),
                  nlohmann::json::object());
        m_process->kill();
        m_process->waitForFinished(5000);
    }
    m_process.reset();

    NLOG_INFO(kComponent,
              QStringLiteral("released"),
              QStringLiteral("Released systemd inhibitor"),
              nlohmann::json::object());
}

bool PowerInhibitor::isActive() const
{
    return m_process && m_process->state() != QProcess::NotRunning;
}

qint64 PowerInhibitor::processId() const
{
    return m_process ? m_process->processId() : 0;
}

QString PowerInhibitor::commandLine() const
{
    return formatCommandLine(m_program, m_arguments);
}

} // namespace nodeos
