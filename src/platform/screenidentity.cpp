// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "screenidentity.h"
#include "../core/logging.h"
#include <QDir>
#include <QFile>
#include <QGuiApplication>
#include <QHash>
#include <QScreen>
#include <QStringList>
#include <cstdint>

namespace GeoKeeper {

namespace ScreenIdentity {

namespace {

constexpr int EdidHeaderSize = 16;
constexpr int MaxEdidReadAttempts = 3;

QHash<QString, QString>& serialCache()
{
    static QHash<QString, QString> s_cache;
    return s_cache;
}

QHash<QString, int>& missCounter()
{
    static QHash<QString, int> s_misses;
    return s_misses;
}

QString readSerialFromSysfs(const QString& connectorName)
{
    QDir drmDir(QStringLiteral("/sys/class/drm"));
    if (!drmDir.exists()) {
        return QString();
    }

    const QStringList entries = drmDir.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString& entry : entries) {
        // Entries look like "card0-DP-2", "card1-HDMI-A-1"
        const int dashPos = entry.indexOf(QLatin1Char('-'));
        if (dashPos < 0 || entry.mid(dashPos + 1) != connectorName) {
            continue;
        }
        QFile edidFile(drmDir.filePath(entry) + QStringLiteral("/edid"));
        if (!edidFile.open(QIODevice::ReadOnly)) {
            continue;
        }
        const QString serial = parseEdidHeaderSerial(edidFile.read(EdidHeaderSize));
        if (!serial.isEmpty()) {
            return serial;
        }
    }
    return QString();
}

} // namespace

QString compose(const QString& manufacturer, const QString& model, const QString& serial,
                const QString& connectorName)
{
    // ":model:serial" is possible for monitors with an empty manufacturer and still unique
    if (!serial.isEmpty()) {
        return manufacturer + QLatin1Char(':') + model + QLatin1Char(':') + serial;
    }
    if (!manufacturer.isEmpty() || !model.isEmpty()) {
        return manufacturer + QLatin1Char(':') + model;
    }
    return connectorName;
}

QString parseEdidHeaderSerial(const QByteArray& edid)
{
    if (edid.size() < EdidHeaderSize) {
        return QString();
    }
    const auto* data = reinterpret_cast<const uint8_t*>(edid.constData());
    static constexpr uint8_t magic[8] = {0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00};
    for (int i = 0; i < 8; ++i) {
        if (data[i] != magic[i]) {
            return QString();
        }
    }
    const uint32_t serial = data[12] | (static_cast<uint32_t>(data[13]) << 8)
        | (static_cast<uint32_t>(data[14]) << 16) | (static_cast<uint32_t>(data[15]) << 24);
    if (serial == 0) {
        return QString();
    }
    return QString::number(serial);
}

QString edidHeaderSerial(const QString& connectorName)
{
    auto& cache = serialCache();
    auto cached = cache.constFind(connectorName);
    if (cached != cache.constEnd()) {
        return cached.value();
    }

    const QString serial = readSerialFromSysfs(connectorName);
    if (!serial.isEmpty()) {
        cache.insert(connectorName, serial);
        missCounter().remove(connectorName);
        return serial;
    }

    int& misses = missCounter()[connectorName];
    ++misses;
    if (misses >= MaxEdidReadAttempts) {
        qCDebug(lcScreen) << "No EDID serial for" << connectorName << "- using model identity";
        cache.insert(connectorName, serial);
    }
    return serial;
}

void invalidateCache(const QString& connectorName)
{
    if (connectorName.isEmpty()) {
        serialCache().clear();
        missCounter().clear();
    } else {
        serialCache().remove(connectorName);
        missCounter().remove(connectorName);
    }
}

QString identify(const QScreen* screen)
{
    if (!screen) {
        return QString();
    }

    // Qt's text serial descriptor is optional; the EDID header serial is always there
    QString serial = screen->serialNumber();
    if (serial.isEmpty()) {
        serial = edidHeaderSerial(screen->name());
    }
    return compose(screen->manufacturer(), screen->model(), serial, screen->name());
}

void warnDuplicateIdentities()
{
    QHash<QString, QStringList> connectorsById;
    const auto screens = QGuiApplication::screens();
    for (QScreen* screen : screens) {
        connectorsById[identify(screen)].append(screen->name());
    }
    for (auto it = connectorsById.constBegin(); it != connectorsById.constEnd(); ++it) {
        if (it.value().size() > 1) {
            qCWarning(lcScreen) << "Duplicate monitor identity" << it.key() << "for connectors"
                                << it.value().join(QStringLiteral(", "))
                                << "- these monitors will share remembered window sizes";
        }
    }
}

} // namespace ScreenIdentity

} // namespace GeoKeeper
