// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geokeeper_export.h"
#include "types.h"
#include <QHash>
#include <QJsonObject>
#include <QSizeF>
#include <QString>
#include <optional>

namespace GeoKeeper {

/**
 * @brief Persisted geometry of one window identity
 *
 * Positions and sizes are in DIP. NaN marks an axis that was never recorded
 * and must not be restored. Non-NaN positions are finite (negative on
 * monitors left of or above the primary one), non-NaN sizes are finite and
 * non-negative; fromJson() normalizes anything else to NaN.
 */
struct GEOKEEPER_EXPORT WindowGeometrySettings
{
    double top;
    double left;
    double width;
    double height;
    WindowMode windowState = WindowMode::Normal;

    /// Preferred size per monitor device identity (DIP)
    QHash<QString, QSizeF> monitorSizeCache;

    WindowGeometrySettings();

    bool hasPosition() const;
    bool hasSize() const;

    /**
     * @brief Serialize to the reference JSON record
     *
     * NaN fields are written as JSON null.
     */
    QJsonObject toJson() const;

    /**
     * @brief Parse a JSON record
     * @param json Object produced by toJson()
     * @return Parsed settings; missing, null or non-finite values and negative
     *         sizes read as NaN, invalid cache entries are dropped
     */
    static WindowGeometrySettings fromJson(const QJsonObject& json);

    /// Compact JSON of monitorSizeCache alone (used by the KConfig store)
    static QJsonObject monitorSizeCacheToJson(const QHash<QString, QSizeF>& cache);
    static QHash<QString, QSizeF> monitorSizeCacheFromJson(const QJsonObject& json);

    /**
     * @brief Field-wise equality, treating NaN == NaN
     */
    bool operator==(const WindowGeometrySettings& other) const;
    bool operator!=(const WindowGeometrySettings& other) const
    {
        return !(*this == other);
    }
};

namespace GeometryValue {

/**
 * @brief Normalize a persisted position (left/top)
 * @return The value if finite, NaN otherwise
 */
GEOKEEPER_EXPORT double sanitizedPosition(double value);

/**
 * @brief Normalize a persisted size (width/height)
 * @return The value if finite and non-negative, NaN otherwise
 */
GEOKEEPER_EXPORT double sanitizedSize(double value);

/// NaN-aware comparison used for record equality
GEOKEEPER_EXPORT bool sameValue(double a, double b);

} // namespace GeometryValue

} // namespace GeoKeeper
