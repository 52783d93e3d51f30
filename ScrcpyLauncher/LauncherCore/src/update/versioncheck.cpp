#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QStringList>

#include "versioncheck.h"

namespace slc {

QVector<int> parseVersion(const QString& version)
{
    const QVector<int> zero = { 0, 0, 0 };

    const QString trimmed = version.trimmed();
    if (trimmed.isEmpty()) {
        return zero;
    }

    QVector<int> parts;
    const QStringList tokens = trimmed.split('.');
    for (const QString& token : tokens) {
        bool ok = false;
        int value = token.toInt(&ok);
        if (!ok || value < 0) {
            return zero;
        }
        parts.append(value);
    }
    return parts;
}

int compareVersions(const QString& a, const QString& b)
{
    QVector<int> left = parseVersion(a);
    QVector<int> right = parseVersion(b);

    const int length = qMax(left.size(), right.size());
    left.resize(length);
    right.resize(length);

    for (int i = 0; i < length; ++i) {
        if (left[i] != right[i]) {
            return left[i] < right[i] ? -1 : 1;
        }
    }
    return 0;
}

bool parseUpdateResponse(const QByteArray& json, const QString& currentVersion, UpdateMetadata* out)
{
    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "VersionCheck: Malformed update response:" << error.errorString();
        return false;
    }

    QJsonObject obj = doc.object();
    UpdateMetadata meta;
    meta.latest = obj.value("latest").toString("0.0.0");
    meta.note = obj.value("note").toString();
    meta.url = obj.value("url").toString();

    if (compareVersions(meta.latest, currentVersion) <= 0) {
        qDebug() << "VersionCheck: Up to date," << currentVersion << ">=" << meta.latest;
        return false;
    }

    qInfo() << "VersionCheck: Update available" << meta.latest << "(current" << currentVersion << ")";
    if (out) {
        *out = meta;
    }
    return true;
}

} // namespace slc
