// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geokeeper_export.h"
#include <QHash>
#include <QSizeF>
#include <QString>

namespace GeoKeeper {

/**
 * @brief Preferred window size per physical monitor
 *
 * Keyed by monitor device identity (stable across reboots and hot-plug),
 * never by the runtime monitor handle. Values are DIP sizes.
 *
 * Lives for the life of the engine; bounded by the number of distinct
 * monitors ever seen, so nothing is evicted.
 */
class GEOKEEPER_EXPORT GeometryCache
{
public:
    GeometryCache() = default;

    /**
     * @brief Preferred size for a monitor
     * @return Cached size, or the fallback size for a monitor never recorded
     */
    QSizeF get(const QString& deviceId) const;

    /**
     * @brief Record a preferred size (last write wins)
     */
    void set(const QString& deviceId, const QSizeF& size);

    bool contains(const QString& deviceId) const
    {
        return m_sizes.contains(deviceId);
    }

    int count() const
    {
        return m_sizes.size();
    }

    /**
     * @brief Replace every entry (seeding from a persisted record)
     */
    void replace(const QHash<QString, QSizeF>& sizes);

    const QHash<QString, QSizeF>& entries() const
    {
        return m_sizes;
    }

    /// Size returned for monitors never recorded (the window's original size)
    QSizeF fallbackSize() const
    {
        return m_fallbackSize;
    }
    void setFallbackSize(const QSizeF& size)
    {
        m_fallbackSize = size;
    }

private:
    QHash<QString, QSizeF> m_sizes;
    QSizeF m_fallbackSize;
};

} // namespace GeoKeeper
