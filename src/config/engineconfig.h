// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/constants.h"
#include "geokeeper_export.h"
#include <KSharedConfig>
#include <QString>

class KConfigGroup;

namespace GeoKeeper {

/**
 * @brief Tunables of the geometry engine
 *
 * The margin and tolerances were tuned empirically and depend on the monitor
 * setup, so they are read from the [Geometry] group of geokeeperrc rather
 * than hardcoded.
 */
struct GEOKEEPER_EXPORT EngineConfig
{
    int safetyMarginPx = Defaults::SafetyMarginPx;
    int dragTolerancePx = Defaults::DragTolerancePx;
    qreal adjustToleranceDip = Defaults::AdjustToleranceDip;
    qreal syncToleranceDip = Defaults::SyncToleranceDip;

    /**
     * @brief Read from a [Geometry] group
     *
     * Out-of-range values are replaced by their default with a warning.
     */
    static EngineConfig fromConfigGroup(const KConfigGroup& group);

    /**
     * @brief Read from the [Geometry] group of a config file
     * @param config Config to read, or the default geokeeperrc when null
     */
    static EngineConfig load(KSharedConfigPtr config = KSharedConfigPtr());

    void save(KConfigGroup& group) const;

    bool operator==(const EngineConfig& other) const;
};

/**
 * @brief Which ISettingsStore backend the application should create
 */
struct GEOKEEPER_EXPORT StorageConfig
{
    enum class Backend {
        Json,
        KConfig
    };

    Backend backend = Backend::Json;
    QString directory; ///< JSON store directory; empty means the default location

    /**
     * @brief Read from the [Storage] group; unknown backends fall back to Json
     */
    static StorageConfig load(KSharedConfigPtr config = KSharedConfigPtr());

    static Backend backendFromString(const QString& value, bool* ok = nullptr);
};

namespace ConfigReaders {

/**
 * @brief Read and validate an integer setting
 * @return Stored value, or defaultValue if missing or out of [min, max]
 */
GEOKEEPER_EXPORT int readValidatedInt(const KConfigGroup& group, const QString& key, int defaultValue, int min,
                                      int max);

/**
 * @brief Read and validate a floating point setting
 * @return Stored value, or defaultValue if missing, non-finite or out of [min, max]
 */
GEOKEEPER_EXPORT qreal readValidatedDouble(const KConfigGroup& group, const QString& key, qreal defaultValue,
                                           qreal min, qreal max);

/// Open the default geokeeperrc when config is null
GEOKEEPER_EXPORT KSharedConfigPtr configOrDefault(KSharedConfigPtr config);

} // namespace ConfigReaders

} // namespace GeoKeeper
