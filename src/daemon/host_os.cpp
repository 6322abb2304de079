#include "daemon/host_os.hpp"

#include <QFile>
#include <QStringList>

#include "common/errors.hpp"

namespace nodeos {

namespace {

QString unquote(QString value)
{
    value = value.trimmed();
    if (value.size() >= 2) {
        const QChar first = value.front();
        if ((first == QLatin1Char('"') || first == QLatin1Char('\''))
            && value.back() == first) {
            value = value.mid(1, value.size() - 2);
        }
    }
    value.replace(QStringLiteral("\\\""), QStringLiteral("\""));
    return value;
}

} // namespace

bool OsRelease::isCoreOsVariant() const
{
    if (id == "rhcos" || id == "scos") {
        return true;
    }
    if (variantId == "coreos") {
        return id == "fedora" || id == "rhel" || id == "centos";
    }
    return false;
}

OsRelease parseOsRelease(const QString &content)
{
    OsRelease release;
    const QStringList lines = content.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }
        const int eq = line.indexOf(QLatin1Char('='));
        if (eq <= 0) {
            continue;
        }

        const QString key = line.left(eq).trimmed();
        const std::string value = unquote(line.mid(eq + 1)).toStdString();

        if (key == QStringLiteral("ID")) {
            release.id = value;
        } else if (key == QStringLiteral("VARIANT_ID")) {
            release.variantId = value;
        } else if (key == QStringLiteral("VERSION_ID")) {
            release.versionId = value;
        } else if (key == QStringLiteral("NAME")) {
            release.name = value;
        } else if (key == QStringLiteral("PRETTY_NAME")) {
            release.prettyName = value;
        }
    }
    return release;
}

OsRelease readOsRelease(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        throw NodeOsError(ErrorKind::HostState,
                          "failed to query operating system from " + path.toStdString()
                              + ": " + file.errorString().toStdString());
    }
    return parseOsRelease(QString::fromUtf8(file.readAll()));
}

} // namespace nodeos
