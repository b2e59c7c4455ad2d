// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geometrycache.h"
#include "logging.h"

namespace GeoKeeper {

QSizeF GeometryCache::get(const QString& deviceId) const
{
    auto it = m_sizes.constFind(deviceId);
    if (it != m_sizes.constEnd()) {
        return it.value();
    }
    return m_fallbackSize;
}

void GeometryCache::set(const QString& deviceId, const QSizeF& size)
{
    if (deviceId.isEmpty()) {
        qCWarning(lcCore) << "Ignoring cache write without a device identity, size=" << size;
        return;
    }
    m_sizes.insert(deviceId, size);
    qCDebug(lcCore) << "Cached size for" << deviceId << "=" << size;
}

void GeometryCache::replace(const QHash<QString, QSizeF>& sizes)
{
    m_sizes = sizes;
}

} // namespace GeoKeeper
