// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geokeeper_export.h"
#include "../core/interfaces.h"
#include <QHash>
#include <QObject>
#include <QRect>

class QScreen;

namespace GeoKeeper {

/**
 * @brief Monitor queries backed by QScreen
 *
 * Handles are connector names (QScreen::name()), device identities come
 * from ScreenIdentity. Qt reports screen geometry in logical coordinates;
 * everything handed to the engine is converted to device pixels.
 */
class GEOKEEPER_EXPORT QtMonitorInfoProvider : public QObject, public IMonitorInfoProvider
{
    Q_OBJECT

public:
    explicit QtMonitorInfoProvider(QObject* parent = nullptr);
    ~QtMonitorInfoProvider() override;

    QString monitorAt(const QPoint& pointPx) const override;
    QString monitorForRect(const QRect& rectPx) const override;
    MonitorDescriptor describe(const QString& handle) const override;
    QStringList monitors() const override;

    /// Full screen rectangle in device pixels
    static QRect nativeGeometry(const QScreen* screen);

    /// Available (work) area in device pixels
    static QRect nativeWorkArea(const QScreen* screen);

    /// Screen containing a device-pixel point, else the nearest; null without screens
    static QScreen* screenAtNativePoint(const QPoint& pointPx);

private:
    void onScreenRemoved(QScreen* screen);

    // Last known rectangle per handle, to find the nearest survivor of an unplugged monitor
    mutable QHash<QString, QRect> m_lastKnownGeometry;
};

} // namespace GeoKeeper
