// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "qtmonitorinfoprovider.h"
#include "screenidentity.h"
#include "../core/geometryutils.h"
#include "../core/logging.h"
#include <QGuiApplication>
#include <QScreen>
#include <limits>

namespace GeoKeeper {

QtMonitorInfoProvider::QtMonitorInfoProvider(QObject* parent)
    : QObject(parent)
{
    connect(qGuiApp, &QGuiApplication::screenRemoved, this, &QtMonitorInfoProvider::onScreenRemoved);
    connect(qGuiApp, &QGuiApplication::screenAdded, this, [](QScreen* screen) {
        qCInfo(lcScreen) << "Screen added:" << screen->name() << ScreenIdentity::identify(screen);
        ScreenIdentity::warnDuplicateIdentities();
    });
    ScreenIdentity::warnDuplicateIdentities();
}

QtMonitorInfoProvider::~QtMonitorInfoProvider() = default;

void QtMonitorInfoProvider::onScreenRemoved(QScreen* screen)
{
    qCInfo(lcScreen) << "Screen removed:" << screen->name();
    m_lastKnownGeometry.insert(screen->name(), nativeGeometry(screen));
    // Another monitor may later be plugged into the same connector
    ScreenIdentity::invalidateCache(screen->name());
}

QRect QtMonitorInfoProvider::nativeGeometry(const QScreen* screen)
{
    if (!screen) {
        return QRect();
    }
    return GeometryUtils::toNativeRect(screen->geometry(), screen->geometry(), screen->devicePixelRatio());
}

QRect QtMonitorInfoProvider::nativeWorkArea(const QScreen* screen)
{
    if (!screen) {
        return QRect();
    }
    return GeometryUtils::toNativeRect(screen->availableGeometry(), screen->geometry(), screen->devicePixelRatio());
}

QScreen* QtMonitorInfoProvider::screenAtNativePoint(const QPoint& pointPx)
{
    QScreen* nearest = nullptr;
    qint64 minDistance = std::numeric_limits<qint64>::max();

    const auto screens = QGuiApplication::screens();
    for (QScreen* screen : screens) {
        const qint64 distance = GeometryUtils::distanceSquaredToRect(pointPx, nativeGeometry(screen));
        if (distance == 0) {
            return screen;
        }
        if (distance < minDistance) {
            minDistance = distance;
            nearest = screen;
        }
    }
    return nearest;
}

QString QtMonitorInfoProvider::monitorAt(const QPoint& pointPx) const
{
    QScreen* screen = screenAtNativePoint(pointPx);
    return screen ? screen->name() : QString();
}

QString QtMonitorInfoProvider::monitorForRect(const QRect& rectPx) const
{
    QScreen* best = nullptr;
    qint64 bestArea = 0;

    const auto screens = QGuiApplication::screens();
    for (QScreen* screen : screens) {
        const qint64 area = GeometryUtils::intersectionArea(rectPx, nativeGeometry(screen));
        if (area > bestArea) {
            bestArea = area;
            best = screen;
        }
    }
    if (best) {
        return best->name();
    }
    // Fully off-screen: nearest to the window's center
    return monitorAt(rectPx.center());
}

MonitorDescriptor QtMonitorInfoProvider::describe(const QString& handle) const
{
    QScreen* screen = nullptr;
    const auto screens = QGuiApplication::screens();
    for (QScreen* candidate : screens) {
        if (candidate->name() == handle) {
            screen = candidate;
            break;
        }
    }

    if (!screen) {
        auto lastKnown = m_lastKnownGeometry.constFind(handle);
        if (lastKnown != m_lastKnownGeometry.constEnd()) {
            screen = screenAtNativePoint(lastKnown.value().center());
        }
        if (!screen) {
            screen = QGuiApplication::primaryScreen();
        }
        if (!screen) {
            qCWarning(lcScreen) << "No screens available to describe" << handle;
            return MonitorDescriptor();
        }
        qCDebug(lcScreen) << "Monitor" << handle << "is gone, using" << screen->name();
    }

    const qreal dpr = screen->devicePixelRatio();
    MonitorDescriptor descriptor;
    descriptor.handle = screen->name();
    descriptor.deviceId = ScreenIdentity::identify(screen);
    descriptor.workArea = nativeWorkArea(screen);
    descriptor.bounds = nativeGeometry(screen);
    descriptor.dpiScale = GeometryUtils::sanitizeDpiScale(dpr);
    if (descriptor.dpiScale != dpr) {
        qCWarning(lcScreen) << "Screen" << screen->name() << "reported device pixel ratio" << dpr << "- assuming 96 DPI";
    }

    m_lastKnownGeometry.insert(descriptor.handle, descriptor.bounds);
    return descriptor;
}

QStringList QtMonitorInfoProvider::monitors() const
{
    QStringList handles;
    const auto screens = QGuiApplication::screens();
    for (QScreen* screen : screens) {
        handles.append(screen->name());
    }
    return handles;
}

} // namespace GeoKeeper
