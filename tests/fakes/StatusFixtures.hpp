#pragma once

#include <QByteArray>

namespace nodeos::testing {

// `rpm-ostree status --json` from a node that was pivoted to an OS image and
// has a pending deployment staged on top.
inline QByteArray pivotedStatusJson()
{
    return QByteArrayLiteral(R"({
  "deployments": [
    {
      "id": "rhcos-9fe0b2c5.1",
      "osname": "rhcos",
      "serial": 1,
      "checksum": "9fe0b2c5d4e8f1a7",
      "version": "416.94.202410",
      "timestamp": 1729300000,
      "booted": false,
      "origin": "/run/mco-machine-os-content/os-content-1/srv/repo:9fe0b2c5d4e8f1a7",
      "custom-origin": ["pivot://quay.io/openshift/os@sha256:bbbb", "Managed by nodeos-agent"]
    },
    {
      "id": "rhcos-4a1c77e0.0",
      "osname": "rhcos",
      "serial": 0,
      "checksum": "4a1c77e0aa31b6c2",
      "version": "416.94.202409",
      "timestamp": 1727000000,
      "booted": true,
      "origin": "/run/mco-machine-os-content/os-content-0/srv/repo:4a1c77e0aa31b6c2",
      "custom-origin": ["pivot://quay.io/openshift/os@sha256:aaaa", "Managed by nodeos-agent"]
    }
  ],
  "transaction": null
})");
}

inline QByteArray statusJsonWithBooted(const char *customOriginJson, bool booted = true)
{
    QByteArray json = QByteArrayLiteral(R"({"deployments": [{"id": "fcos-0", "osname": "fedora-coreos",
        "serial": 0, "checksum": "c0ffee", "version": "40.20241001.3.0", "timestamp": 1,
        "origin": "fedora:fedora/x86_64/coreos/stable", "booted": )");
    json += booted ? "true" : "false";
    if (customOriginJson) {
        json += ", \"custom-origin\": ";
        json += customOriginJson;
    }
    json += "}]}";
    return json;
}

} // namespace nodeos::testing
