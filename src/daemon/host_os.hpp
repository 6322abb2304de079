#pragma once

#include <string>

#include <QString>

namespace nodeos {

// Fields of /etc/os-release that decide which updater a host gets.
struct OsRelease {
    std::string id;
    std::string variantId;
    std::string versionId;
    std::string name;
    std::string prettyName;

    // Hosts whose OS is delivered as an rpm-ostree image (RHCOS, SCOS,
    // Fedora/RHEL/CentOS CoreOS variants).
    bool isCoreOsVariant() const;
};

OsRelease parseOsRelease(const QString &content);

// Throws NodeOsError(HostState) when the file cannot be read.
OsRelease readOsRelease(const QString &path);

} // namespace nodeos
