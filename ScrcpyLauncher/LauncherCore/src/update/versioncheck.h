#ifndef VERSIONCHECK_H
#define VERSIONCHECK_H

#include <QByteArray>
#include <QString>
#include <QVector>

namespace slc {

// Payload of the update endpoint: {"latest": "x.y.z", "note": "...", "url": "..."}
struct UpdateMetadata {
    QString latest;
    QString note;
    QString url;
};

/**
 * Version helpers for the update check.
 *
 * Versions are dot-separated integers. Anything unparsable compares as
 * 0.0.0, so a malformed remote version never triggers an update prompt.
 *
 * Only the payload side exists: the launcher does not fetch the endpoint,
 * so nothing in the application calls these yet.
 */
QVector<int> parseVersion(const QString& version);

// < 0 if a is older than b, 0 if equal, > 0 if newer. Missing components count as 0.
int compareVersions(const QString& a, const QString& b);

// Returns true only when the payload names a version newer than currentVersion
bool parseUpdateResponse(const QByteArray& json, const QString& currentVersion, UpdateMetadata* out);

} // namespace slc

#endif // VERSIONCHECK_H
