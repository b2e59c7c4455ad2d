// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "kconfigsettingsstore.h"
#include "engineconfig.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include <KConfigGroup>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <cmath>

namespace GeoKeeper {

namespace {

void writeGeometryEntry(KConfigGroup& group, const QLatin1String& key, double value)
{
    // Absent entry == never recorded
    if (std::isnan(value)) {
        group.deleteEntry(QString(key));
    } else {
        group.writeEntry(QString(key), value);
    }
}

// Raw entry, NaN when absent or malformed
double readGeometryEntry(const KConfigGroup& group, const QLatin1String& key)
{
    if (!group.hasKey(QString(key))) {
        return std::nan("");
    }
    bool ok = false;
    const double value = group.readEntry(QString(key), QString()).toDouble(&ok);
    if (!ok) {
        qCWarning(lcConfig) << "Ignoring malformed" << key << "in" << group.name();
        return std::nan("");
    }
    return value;
}

} // namespace

KConfigSettingsStore::KConfigSettingsStore(KSharedConfigPtr config)
    : m_config(ConfigReaders::configOrDefault(config))
{
}

KConfigSettingsStore::~KConfigSettingsStore() = default;

QString KConfigSettingsStore::groupName(const QString& windowId)
{
    return QString(ConfigKeys::WindowGroupPrefix) + windowId;
}

bool KConfigSettingsStore::save(const QString& windowId, const WindowGeometrySettings& settings)
{
    if (windowId.isEmpty()) {
        qCWarning(lcConfig) << "Refusing to save geometry without a window id";
        return false;
    }

    KConfigGroup group = m_config->group(groupName(windowId));
    writeGeometryEntry(group, ConfigKeys::Top, settings.top);
    writeGeometryEntry(group, ConfigKeys::Left, settings.left);
    writeGeometryEntry(group, ConfigKeys::Width, settings.width);
    writeGeometryEntry(group, ConfigKeys::Height, settings.height);
    group.writeEntry(QString(ConfigKeys::WindowState), windowModeToString(settings.windowState));

    const QJsonObject cache = WindowGeometrySettings::monitorSizeCacheToJson(settings.monitorSizeCache);
    group.writeEntry(QString(ConfigKeys::MonitorSizeCache),
                     QString::fromUtf8(QJsonDocument(cache).toJson(QJsonDocument::Compact)));

    if (!m_config->sync()) {
        qCWarning(lcConfig) << "Failed to sync" << m_config->name() << "while saving" << windowId;
        return false;
    }
    qCDebug(lcConfig) << "Saved window settings to group" << group.name();
    return true;
}

std::optional<WindowGeometrySettings> KConfigSettingsStore::load(const QString& windowId)
{
    const KConfigGroup group = m_config->group(groupName(windowId));
    if (!group.exists()) {
        qCDebug(lcConfig) << "No settings group for" << windowId;
        return std::nullopt;
    }

    WindowGeometrySettings settings;
    settings.top = GeometryValue::sanitizedPosition(readGeometryEntry(group, ConfigKeys::Top));
    settings.left = GeometryValue::sanitizedPosition(readGeometryEntry(group, ConfigKeys::Left));
    settings.width = GeometryValue::sanitizedSize(readGeometryEntry(group, ConfigKeys::Width));
    settings.height = GeometryValue::sanitizedSize(readGeometryEntry(group, ConfigKeys::Height));
    settings.windowState = windowModeFromString(group.readEntry(QString(ConfigKeys::WindowState), QString()));

    const QString cacheJson = group.readEntry(QString(ConfigKeys::MonitorSizeCache), QString());
    if (!cacheJson.isEmpty()) {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(cacheJson.toUtf8(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            qCWarning(lcConfig) << "Failed to parse monitor size cache of" << windowId
                                << "Error:" << parseError.errorString() << "at offset" << parseError.offset;
        } else {
            settings.monitorSizeCache = WindowGeometrySettings::monitorSizeCacheFromJson(doc.object());
        }
    }

    return settings;
}

} // namespace GeoKeeper
