// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "engineconfig.h"
#include "../core/logging.h"
#include <KConfig>
#include <KConfigGroup>
#include <cmath>

namespace GeoKeeper {

namespace ConfigReaders {

int readValidatedInt(const KConfigGroup& group, const QString& key, int defaultValue, int min, int max)
{
    int value = group.readEntry(key, defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << key << ":" << value << "using default (must be" << min << "-" << max
                            << ")";
        value = defaultValue;
    }
    return value;
}

qreal readValidatedDouble(const KConfigGroup& group, const QString& key, qreal defaultValue, qreal min, qreal max)
{
    qreal value = group.readEntry(key, defaultValue);
    if (!std::isfinite(value) || value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << key << ":" << value << "using default (must be" << min << "-" << max
                            << ")";
        value = defaultValue;
    }
    return value;
}

KSharedConfigPtr configOrDefault(KSharedConfigPtr config)
{
    if (config) {
        return config;
    }
    return KSharedConfig::openConfig(QString(ConfigKeys::ConfigFile));
}

} // namespace ConfigReaders

EngineConfig EngineConfig::fromConfigGroup(const KConfigGroup& group)
{
    using ConfigReaders::readValidatedDouble;
    using ConfigReaders::readValidatedInt;

    EngineConfig config;
    config.safetyMarginPx = readValidatedInt(group, QString(ConfigKeys::SafetyMargin), Defaults::SafetyMarginPx,
                                             Limits::MinSafetyMarginPx, Limits::MaxSafetyMarginPx);
    config.dragTolerancePx = readValidatedInt(group, QString(ConfigKeys::DragTolerance), Defaults::DragTolerancePx,
                                              Limits::MinDragTolerancePx, Limits::MaxDragTolerancePx);
    config.adjustToleranceDip =
        readValidatedDouble(group, QString(ConfigKeys::AdjustTolerance), Defaults::AdjustToleranceDip,
                            Limits::MinToleranceDip, Limits::MaxToleranceDip);
    config.syncToleranceDip = readValidatedDouble(group, QString(ConfigKeys::SyncTolerance), Defaults::SyncToleranceDip,
                                                  Limits::MinToleranceDip, Limits::MaxToleranceDip);
    return config;
}

EngineConfig EngineConfig::load(KSharedConfigPtr config)
{
    config = ConfigReaders::configOrDefault(config);
    // Pick up edits made by other processes since the config was first opened
    config->reparseConfiguration();
    const KConfigGroup group = config->group(QString(ConfigKeys::GeometryGroup));
    EngineConfig result = fromConfigGroup(group);
    qCDebug(lcConfig) << "Engine config: margin=" << result.safetyMarginPx << "dragTolerance=" << result.dragTolerancePx
                      << "adjustTolerance=" << result.adjustToleranceDip
                      << "syncTolerance=" << result.syncToleranceDip;
    return result;
}

void EngineConfig::save(KConfigGroup& group) const
{
    group.writeEntry(QString(ConfigKeys::SafetyMargin), safetyMarginPx);
    group.writeEntry(QString(ConfigKeys::DragTolerance), dragTolerancePx);
    group.writeEntry(QString(ConfigKeys::AdjustTolerance), adjustToleranceDip);
    group.writeEntry(QString(ConfigKeys::SyncTolerance), syncToleranceDip);
}

bool EngineConfig::operator==(const EngineConfig& other) const
{
    return safetyMarginPx == other.safetyMarginPx && dragTolerancePx == other.dragTolerancePx
        && qFuzzyCompare(1.0 + adjustToleranceDip, 1.0 + other.adjustToleranceDip)
        && qFuzzyCompare(1.0 + syncToleranceDip, 1.0 + other.syncToleranceDip);
}

StorageConfig::Backend StorageConfig::backendFromString(const QString& value, bool* ok)
{
    if (ok) {
        *ok = true;
    }
    if (value.isEmpty() || value.compare(ConfigKeys::BackendJson, Qt::CaseInsensitive) == 0) {
        return Backend::Json;
    }
    if (value.compare(ConfigKeys::BackendKConfig, Qt::CaseInsensitive) == 0) {
        return Backend::KConfig;
    }
    if (ok) {
        *ok = false;
    }
    return Backend::Json;
}

StorageConfig StorageConfig::load(KSharedConfigPtr config)
{
    config = ConfigReaders::configOrDefault(config);
    const KConfigGroup group = config->group(QString(ConfigKeys::StorageGroup));

    StorageConfig result;
    const QString backend = group.readEntry(QString(ConfigKeys::Backend), QString(ConfigKeys::BackendJson));
    bool ok = false;
    result.backend = backendFromString(backend, &ok);
    if (!ok) {
        qCWarning(lcConfig) << "Unknown storage backend" << backend << "using json";
    }
    result.directory = group.readEntry(QString(ConfigKeys::Directory), QString());
    return result;
}

} // namespace GeoKeeper
