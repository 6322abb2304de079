#pragma once

#include <chrono>
#include <functional>

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace nodeos {

// Runs `program` with `arguments` and returns its combined stdout+stderr.
// Throws CommandError when the program cannot start, crashes or exits
// non-zero. Every host-tool invocation in nodeos goes through one of these,
// so tests can swap in a deterministic fake.
using CommandRunner =
    std::function<QByteArray(const QString &program, const QStringList &arguments)>;

QString formatCommandLine(const QString &program, const QStringList &arguments);

// Production runner backed by QProcess. Blocks until the child exits; there
// is no cancellation once a child has started.
QByteArray runCapture(const QString &program, const QStringList &arguments);

CommandRunner systemCommandRunner();

// Re-run a network-bound command up to `attempts` times, sleeping
// attempt * `delay` between tries. The final failure is rethrown as a
// TransientNetwork CommandError.
QByteArray runWithRetries(const CommandRunner &runner,
                          int attempts,
                          std::chrono::milliseconds delay,
                          const QString &program,
                          const QStringList &arguments);

} // namespace nodeos
