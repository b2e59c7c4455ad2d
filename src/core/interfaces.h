// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geokeeper_export.h"
#include "types.h"
#include "windowgeometrysettings.h"
#include <QObject>
#include <QPoint>
#include <QPointF>
#include <QRect>
#include <QRectF>
#include <QSize>
#include <QSizeF>
#include <QString>
#include <QStringList>
#include <optional>

namespace GeoKeeper {

/**
 * @brief Abstract interface for monitor queries
 *
 * Pure queries against live OS state. Results can change between calls
 * (monitor unplugged, resolution changed), so callers re-resolve on every
 * use instead of caching descriptors.
 *
 * Implementations never fail: a point or rectangle outside every monitor
 * resolves to the nearest one, a stale handle describes the nearest
 * remaining monitor, and a failed DPI query reports scale 1.0.
 */
class GEOKEEPER_EXPORT IMonitorInfoProvider
{
public:
    virtual ~IMonitorInfoProvider();

    /**
     * @brief Monitor containing a screen point, or the nearest one
     * @param pointPx Point in device pixels
     * @return Monitor handle, empty only when no monitor exists at all
     */
    virtual QString monitorAt(const QPoint& pointPx) const = 0;

    /**
     * @brief Monitor hosting a window rectangle
     * @param rectPx Window rectangle in device pixels
     * @return Handle of the monitor with the largest overlap, or the nearest
     */
    virtual QString monitorForRect(const QRect& rectPx) const = 0;

    /**
     * @brief Describe a monitor handle
     * @param handle Handle returned by monitorAt() or monitorForRect()
     * @return Descriptor (invalid only when no monitor exists at all)
     */
    virtual MonitorDescriptor describe(const QString& handle) const = 0;

    /**
     * @brief Handles of all currently connected monitors
     */
    virtual QStringList monitors() const = 0;
};

/**
 * @brief Abstract interface for geometry record persistence
 *
 * Key-value contract: one WindowGeometrySettings record per window identity.
 * Backends (JSON files, KConfig) are interchangeable.
 */
class GEOKEEPER_EXPORT ISettingsStore
{
public:
    virtual ~ISettingsStore();

    /**
     * @brief Persist a record (best effort)
     *
     * Failures are logged and swallowed: a failed save must never block
     * the window from closing.
     *
     * @return true if the record was written
     */
    virtual bool save(const QString& windowId, const WindowGeometrySettings& settings) = 0;

    /**
     * @brief Read a record
     * @return The record, or nullopt if none exists or it cannot be read/parsed
     */
    virtual std::optional<WindowGeometrySettings> load(const QString& windowId) = 0;
};

/**
 * @brief Abstract interface for the host window and its native surface
 *
 * Exposes the two geometry views the engine works with:
 * - toolkit properties (geometry(), setPosition(), setSize()) in DIP,
 *   which the toolkit may cache and update lazily. Positions are mapped
 *   around the origin of the monitor they are on (see GeometryUtils), so a
 *   position read on one monitor is written back to the same monitor.
 * - the native window rectangle in device pixels
 *
 * Notifications come in two channels. Toolkit-level signals fire after the
 * toolkit's own state changed; nativeEventReceived() carries raw OS
 * notifications and must be delivered with a direct connection because
 * handlers may edit the event's rectangle in place.
 */
class GEOKEEPER_EXPORT IWindowHost : public QObject
{
    Q_OBJECT

public:
    explicit IWindowHost(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~IWindowHost() override;

    // Toolkit properties (DIP)
    virtual QRectF geometry() const = 0;
    virtual void setPosition(const QPointF& topLeft) = 0;
    virtual void setSize(const QSizeF& size) = 0;
    virtual WindowMode windowMode() const = 0;
    virtual void setWindowMode(WindowMode mode) = 0;

    // Native surface (device pixels)
    virtual QRect nativeGeometry() const = 0;

    /**
     * @brief Resize the native window directly
     *
     * Bypasses the toolkit's DIP resize path. Keeps the position, Z-order
     * and activation state. The toolkit's cached properties may lag behind
     * until it processes the native resize.
     */
    virtual void setNativeSize(const QSize& sizePx) = 0;

    /// DPI scale of the window itself (may differ from its monitor mid-transition)
    virtual qreal nativeDpiScale() const = 0;

    /// Current cursor position in device pixels
    virtual QPoint cursorPosition() const = 0;

Q_SIGNALS:
    /// The native surface exists; fired once
    void surfaceReady();

    /// Toolkit notification: top-left moved
    void locationChanged();

    /// Toolkit notification: size changed (DIP)
    void sizeChanged(const QSizeF& newSize);

    /// The window is about to close
    void closing();

    /// Raw OS notification (deliver with Qt::DirectConnection)
    void nativeEventReceived(GeoKeeper::NativeEvent* event);
};

} // namespace GeoKeeper
