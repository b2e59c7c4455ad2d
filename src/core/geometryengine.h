// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geokeeper_export.h"
#include "geometrycache.h"
#include "types.h"
#include "windowgeometrysettings.h"
#include "../config/engineconfig.h"
#include <QObject>
#include <QRect>
#include <QSizeF>
#include <QString>

class QEvent;

namespace GeoKeeper {

class IMonitorInfoProvider;
class ISettingsStore;
class IWindowHost;

/**
 * @brief Keeps one window's geometry right across monitors of different DPI
 *
 * Consumes native and toolkit notifications from an IWindowHost, remembers a
 * preferred DIP size per physical monitor, and reprograms the window when it
 * lands on another monitor or its DPI changes. Geometry is restored from an
 * ISettingsStore when the native surface appears and saved when the window
 * closes.
 *
 * State is a set of independent flags rather than one enum, since a DPI
 * change can arrive in the middle of a user gesture:
 * - initialized: surface seen and settings loaded; nothing runs before
 * - isAdjusting: the engine is writing geometry itself; reactive
 *   location/size handlers are no-ops for the duration
 * - userResizing: inside an interactive move-or-resize loop
 * - resizeConfirmed: the current loop is a resize, not a pure move
 * - ignoreNextSizeChange: drop exactly one size notification (the echo of
 *   a toolkit resync)
 * - pendingToolkitSync: a forced pixel resize happened and the toolkit's
 *   cached DIP size must be refreshed once the toolkit caught up
 *
 * All calls happen on the GUI thread. The host, monitor provider and store
 * are not owned and must outlive the engine.
 */
class GEOKEEPER_EXPORT GeometryEngine : public QObject
{
    Q_OBJECT

public:
    /**
     * @param host Window to manage; its signals are connected here
     * @param monitors Monitor queries
     * @param store Settings persistence (may be null: nothing is restored or saved)
     * @param windowId Key of the persisted record
     * @param config Margin and tolerances
     */
    GeometryEngine(IWindowHost* host, IMonitorInfoProvider* monitors, ISettingsStore* store,
                   const QString& windowId, const EngineConfig& config = EngineConfig(),
                   QObject* parent = nullptr);
    ~GeometryEngine() override;

    QString windowId() const
    {
        return m_windowId;
    }

    const EngineConfig& config() const
    {
        return m_config;
    }
    void setConfig(const EngineConfig& config);

    // State queries
    bool isInitialized() const
    {
        return m_initialized;
    }
    bool isAdjusting() const
    {
        return m_isAdjusting;
    }
    bool isUserGestureActive() const
    {
        return m_userResizing;
    }
    bool isResizeConfirmed() const
    {
        return m_resizeConfirmed;
    }
    bool isToolkitSyncPending() const
    {
        return m_pendingToolkitSync;
    }
    bool ignoresNextSizeChange() const
    {
        return m_ignoreNextSizeChange;
    }

    /// Size captured the first time the surface appeared (fallback for unseen monitors)
    QSizeF originalSize() const
    {
        return m_originalSize;
    }

    /// Handle of the monitor the window is considered to be on
    QString currentMonitor() const
    {
        return m_currentMonitor;
    }

    /// Device identity of the current monitor, resolved now
    QString currentDeviceId() const;

    const GeometryCache& cache() const
    {
        return m_cache;
    }

    /**
     * @brief Snapshot of what would be persisted right now
     */
    WindowGeometrySettings currentSettings() const;

    /**
     * @brief Live-move step: snap the proposed rectangle to the remembered size
     *
     * Resolves the monitor under the cursor (authoritative during a drag),
     * then rewrites each axis of proposedRectPx that is off from the target
     * size by more than the drag tolerance. Left/top are never touched.
     *
     * @param proposedRectPx Rectangle the OS is about to apply, edited in place
     * @return true if the rectangle was modified
     */
    bool handleMoving(QRect& proposedRectPx);

    /**
     * @brief Drag-time target size for a monitor (pixels)
     *
     * Preferred size scaled and clamped to the work area minus the margin,
     * without widening to the current size.
     */
    QSize dragTargetSize(const MonitorDescriptor& monitor) const;

public Q_SLOTS:
    /// Native surface is ready: capture original size, restore settings
    void initialize();

    /// Toolkit notification: the window's top-left moved
    void handleLocationChanged();

    /// Toolkit notification: the window's size changed (DIP)
    void handleSizeChanged(const QSizeF& newSize);

    /// The window is closing: persist geometry and the size cache
    void handleClosing();

    /// Dispatch one raw OS notification
    void handleNativeEvent(GeoKeeper::NativeEvent* event);

    void beginGesture();
    void confirmResize();
    void endGesture();

    /// @return true: the engine owns the re-layout, suppress the OS default
    bool handleDpiChanged();

    /**
     * @brief Reconcile size and position against the current monitor
     *
     * Preferred size is the cached one widened to the current size (a manual
     * enlargement is never reverted), then clamped to the work area minus the
     * margin. The result is cached; if it differs from the current size by
     * more than the adjust tolerance the native window is force-resized and
     * the top-left is pulled back inside the work-area origin.
     */
    void performAdjustment();

    /**
     * @brief Persist the current record (best effort)
     * @return true if the store accepted it
     */
    bool saveSettings();

Q_SIGNALS:
    /// The window is now considered to be on another monitor
    void monitorChanged(const QString& deviceId);

    /// A forced resize was applied
    void geometryAdjusted(const QString& deviceId, const QSizeF& size);

    /// A persisted record was applied during initialize()
    void settingsRestored();

    void settingsSaved(bool success);

protected:
    bool event(QEvent* event) override;

private:
    void restoreSettings();
    bool isRestorablePosition(const QPointF& topLeftDip) const;
    void setCurrentMonitor(const QString& handle);
    void ensureTopLeftOnScreen(const MonitorDescriptor& monitor);
    void scheduleToolkitSync();
    void syncToolkitGeometry();

    IWindowHost* m_host;
    IMonitorInfoProvider* m_monitors;
    ISettingsStore* m_store;
    QString m_windowId;
    EngineConfig m_config;

    GeometryCache m_cache;
    QSizeF m_originalSize;
    QString m_currentMonitor;

    bool m_originalSizeStored = false;
    bool m_initialized = false;
    bool m_isAdjusting = false;
    bool m_userResizing = false;
    bool m_resizeConfirmed = false;
    bool m_ignoreNextSizeChange = false;
    bool m_pendingToolkitSync = false;
};

} // namespace GeoKeeper
