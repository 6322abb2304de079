#pragma once

#include <memory>
#include <string>

#include <QStringList>

class QProcess;

namespace nodeos {

/**
 * Scoped power-state inhibition for the duration of an update.
 *
 * acquire() starts a long-lived child (by default
 * `systemd-inhibit ... /bin/sleep infinity`); release() kills it. The
 * destructor releases, and the child is started with PR_SET_PDEATHSIG so it
 * also goes away when the agent is killed by a signal.
 */
class PowerInhibitor
{
public:
    PowerInhibitor(QString program, QStringList arguments);
    ~PowerInhibitor();

    PowerInhibitor(const PowerInhibitor &) = delete;
    PowerInhibitor &operator=(const PowerInhibitor &) = delete;

    // systemd-inhibit blocking shutdown, sleep, idle and the power/lid keys.
    static std::unique_ptr<PowerInhibitor> forUpdate(const std::string &systemdInhibitPath);

    // Throws CommandError if the child cannot be started.
    void acquire();
    // Idempotent; never throws.
    void release() noexcept;

    bool isActive() const;
    qint64 processId() const;
    QString commandLine() const;

private:
    QString m_program;
    QStringList m_arguments;
    std::unique_ptr<QProcess> m_process;
};

} // namespace nodeos
