// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geometryengine.h"
#include "geometryutils.h"
#include "interfaces.h"
#include "logging.h"
#include <QCoreApplication>
#include <QEvent>
#include <QRectF>
#include <QScopedValueRollback>

namespace GeoKeeper {

namespace {

// Posted at low priority so it is delivered after the toolkit has processed
// the native resize that triggered it
QEvent::Type toolkitSyncEventType()
{
    static const QEvent::Type type = static_cast<QEvent::Type>(QEvent::registerEventType());
    return type;
}

} // namespace

GeometryEngine::GeometryEngine(IWindowHost* host, IMonitorInfoProvider* monitors, ISettingsStore* store,
                               const QString& windowId, const EngineConfig& config, QObject* parent)
    : QObject(parent)
    , m_host(host)
    , m_monitors(monitors)
    , m_store(store)
    , m_windowId(windowId)
    , m_config(config)
{
    if (!m_host) {
        qCWarning(lcEngine) << "Geometry engine created without a window host, id=" << m_windowId;
        return;
    }

    connect(m_host, &IWindowHost::surfaceReady, this, &GeometryEngine::initialize);
    connect(m_host, &IWindowHost::locationChanged, this, &GeometryEngine::handleLocationChanged);
    connect(m_host, &IWindowHost::sizeChanged, this, &GeometryEngine::handleSizeChanged);
    connect(m_host, &IWindowHost::closing, this, &GeometryEngine::handleClosing);
    // Direct: handlers edit the event's rectangle before the OS applies it
    connect(m_host, &IWindowHost::nativeEventReceived, this, &GeometryEngine::handleNativeEvent,
            Qt::DirectConnection);
}

GeometryEngine::~GeometryEngine() = default;

void GeometryEngine::setConfig(const EngineConfig& config)
{
    m_config = config;
}

QString GeometryEngine::currentDeviceId() const
{
    if (!m_monitors || m_currentMonitor.isEmpty()) {
        return QString();
    }
    return m_monitors->describe(m_currentMonitor).deviceId;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════════

void GeometryEngine::initialize()
{
    if (m_initialized) {
        return;
    }
    if (!m_host || !m_monitors) {
        qCWarning(lcEngine) << "Cannot initialize without window host and monitor provider, id=" << m_windowId;
        return;
    }

    if (!m_originalSizeStored) {
        m_originalSize = m_host->geometry().size();
        m_cache.setFallbackSize(m_originalSize);
        m_originalSizeStored = true;
    }

    {
        // Geometry written by the restore must not look like user input
        QScopedValueRollback<bool> adjusting(m_isAdjusting, true);
        m_currentMonitor = m_monitors->monitorForRect(m_host->nativeGeometry());
        restoreSettings();
        // The restored position may have put the window on another monitor
        m_currentMonitor = m_monitors->monitorForRect(m_host->nativeGeometry());
    }

    const QString deviceId = currentDeviceId();
    if (!m_cache.contains(deviceId)) {
        m_cache.set(deviceId, m_host->geometry().size());
    }

    m_initialized = true;
    qCInfo(lcEngine) << "Tracking window" << m_windowId << "on" << m_currentMonitor << "(" << deviceId << ")"
                     << "original size=" << m_originalSize;
}

void GeometryEngine::restoreSettings()
{
    if (!m_store) {
        return;
    }

    const std::optional<WindowGeometrySettings> settings = m_store->load(m_windowId);
    if (!settings) {
        qCInfo(lcEngine) << "No saved geometry for" << m_windowId << "- using defaults";
        return;
    }

    m_cache.replace(settings->monitorSizeCache);

    if (settings->hasPosition()) {
        const QPointF topLeft(settings->left, settings->top);
        if (isRestorablePosition(topLeft)) {
            m_host->setPosition(topLeft);
        } else {
            qCWarning(lcEngine) << "Saved position" << topLeft << "is off-screen, not restoring it";
        }
    }

    if (settings->hasSize()) {
        if (settings->width > 0.0 && settings->height > 0.0) {
            m_host->setSize(QSizeF(settings->width, settings->height));
        } else {
            qCWarning(lcEngine) << "Saved size" << settings->width << "x" << settings->height
                                << "is degenerate, not restoring it";
        }
    }

    // Opening minimized would leave the user with an invisible window
    if (settings->windowState != WindowMode::Minimized) {
        m_host->setWindowMode(settings->windowState);
    } else {
        qCInfo(lcEngine) << "Saved state is minimized, opening" << m_windowId << "normally";
    }

    qCInfo(lcEngine) << "Restored geometry for" << m_windowId << "monitors remembered=" << m_cache.count();
    Q_EMIT settingsRestored();
}

bool GeometryEngine::isRestorablePosition(const QPointF& topLeftDip) const
{
    const QStringList handles = m_monitors->monitors();
    if (handles.isEmpty()) {
        return true;
    }
    for (const QString& handle : handles) {
        const MonitorDescriptor monitor = m_monitors->describe(handle);
        if (!monitor.isValid()) {
            continue;
        }
        const QRectF workAreaDip = GeometryUtils::workAreaRectDip(monitor.workArea, monitor.bounds, monitor.dpiScale);
        if (workAreaDip.contains(topLeftDip)) {
            return true;
        }
    }
    return false;
}

void GeometryEngine::handleClosing()
{
    saveSettings();
}

WindowGeometrySettings GeometryEngine::currentSettings() const
{
    WindowGeometrySettings settings;
    if (m_host) {
        const QRectF geometry = m_host->geometry();
        settings.top = GeometryValue::sanitizedPosition(geometry.top());
        settings.left = GeometryValue::sanitizedPosition(geometry.left());
        settings.width = GeometryValue::sanitizedSize(geometry.width());
        settings.height = GeometryValue::sanitizedSize(geometry.height());
        settings.windowState = m_host->windowMode();
    }
    settings.monitorSizeCache = m_cache.entries();
    return settings;
}

bool GeometryEngine::saveSettings()
{
    if (!m_store) {
        return false;
    }
    // Saving before the restore ran would overwrite the remembered sizes with an empty cache
    if (!m_initialized) {
        qCDebug(lcEngine) << "Window" << m_windowId << "closed before its surface was ready, not saving";
        return false;
    }

    const bool success = m_store->save(m_windowId, currentSettings());
    if (success) {
        qCInfo(lcEngine) << "Saved geometry for" << m_windowId;
    } else {
        qCWarning(lcEngine) << "Failed to save geometry for" << m_windowId;
    }
    Q_EMIT settingsSaved(success);
    return success;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Toolkit notifications
// ═══════════════════════════════════════════════════════════════════════════════

void GeometryEngine::handleLocationChanged()
{
    if (m_userResizing || !m_initialized || m_isAdjusting) {
        return;
    }

    const QString monitor = m_monitors->monitorForRect(m_host->nativeGeometry());
    if (monitor != m_currentMonitor) {
        setCurrentMonitor(monitor);
        performAdjustment();
    }
}

void GeometryEngine::handleSizeChanged(const QSizeF& newSize)
{
    if (!m_initialized || m_isAdjusting) {
        return;
    }

    if (m_ignoreNextSizeChange) {
        m_ignoreNextSizeChange = false;
        qCDebug(lcEngine) << "Dropping size change caused by toolkit resync:" << newSize;
        return;
    }

    // During a gesture only a confirmed resize is a size preference; a move
    // reports whatever the OS happens to use mid-drag
    if (!m_userResizing || m_resizeConfirmed) {
        const QString deviceId = currentDeviceId();
        m_cache.set(deviceId, newSize);
        qCDebug(lcEngine) << "Size updated for" << deviceId << ":" << newSize;
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Native notifications
// ═══════════════════════════════════════════════════════════════════════════════

void GeometryEngine::handleNativeEvent(NativeEvent* event)
{
    if (!event) {
        return;
    }

    switch (event->type) {
    case NativeEvent::Type::MoveResizeStarted:
        beginGesture();
        break;
    case NativeEvent::Type::MoveResizeFinished:
        endGesture();
        break;
    case NativeEvent::Type::Sizing:
        confirmResize();
        break;
    case NativeEvent::Type::Moving:
        if (event->rect && handleMoving(*event->rect)) {
            event->handled = true;
        }
        break;
    case NativeEvent::Type::DpiChanged:
        event->handled = handleDpiChanged();
        break;
    }
}

void GeometryEngine::beginGesture()
{
    m_userResizing = true;
    m_resizeConfirmed = false;
}

void GeometryEngine::confirmResize()
{
    m_resizeConfirmed = true;
}

void GeometryEngine::endGesture()
{
    m_userResizing = false;
    // Reconcile even when no live snapping fired (pure resize, or a drop
    // without crossing monitors)
    performAdjustment();
}

bool GeometryEngine::handleDpiChanged()
{
    performAdjustment();
    return true;
}

bool GeometryEngine::handleMoving(QRect& proposedRectPx)
{
    if (!m_initialized) {
        return false;
    }

    // The cursor is authoritative during a drag; the window rectangle is stale
    const QString monitor = m_monitors->monitorAt(m_host->cursorPosition());
    if (monitor != m_currentMonitor) {
        setCurrentMonitor(monitor);
    }

    const MonitorDescriptor descriptor = m_monitors->describe(monitor);
    if (!descriptor.isValid()) {
        return false;
    }

    const QSize target = dragTargetSize(descriptor);
    bool modified = false;
    if (qAbs(proposedRectPx.width() - target.width()) > m_config.dragTolerancePx) {
        proposedRectPx.setWidth(target.width());
        modified = true;
    }
    if (qAbs(proposedRectPx.height() - target.height()) > m_config.dragTolerancePx) {
        proposedRectPx.setHeight(target.height());
        modified = true;
    }

    if (modified) {
        qCDebug(lcEngine) << "Live move onto" << descriptor.deviceId << "snapping to" << target;
    }
    return modified;
}

QSize GeometryEngine::dragTargetSize(const MonitorDescriptor& monitor) const
{
    return GeometryUtils::dragTargetSizePx(m_cache.get(monitor.deviceId), monitor.workArea, monitor.dpiScale,
                                           m_config.safetyMarginPx);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Adjustment
// ═══════════════════════════════════════════════════════════════════════════════

void GeometryEngine::performAdjustment()
{
    if (!m_initialized) {
        return;
    }

    QScopedValueRollback<bool> adjusting(m_isAdjusting, true);

    const MonitorDescriptor monitor = m_monitors->describe(m_currentMonitor);
    if (!monitor.isValid()) {
        qCWarning(lcEngine) << "No usable monitor for" << m_currentMonitor << "- skipping adjustment";
        return;
    }
    // A stale handle (monitor unplugged) was resolved to the nearest remaining one
    if (monitor.handle != m_currentMonitor) {
        setCurrentMonitor(monitor.handle);
    }

    const QRect currentRectPx = m_host->nativeGeometry();
    const QSizeF currentSizeDip = GeometryUtils::pixelsToDip(currentRectPx.size(), monitor.dpiScale);

    const QSizeF preferredDip = GeometryUtils::expandedTo(m_cache.get(monitor.deviceId), currentSizeDip);
    const QSizeF finalDip =
        GeometryUtils::clampToWorkArea(preferredDip, monitor.workArea, monitor.dpiScale, m_config.safetyMarginPx);

    m_cache.set(monitor.deviceId, finalDip);

    if (!GeometryUtils::differsBeyond(finalDip, currentSizeDip, m_config.adjustToleranceDip)) {
        return;
    }

    qCDebug(lcEngine) << "Adjusting for" << monitor.deviceId << ":" << currentSizeDip << "->" << finalDip;

    m_host->setNativeSize(GeometryUtils::dipToPixels(finalDip, monitor.dpiScale));
    scheduleToolkitSync();
    ensureTopLeftOnScreen(monitor);

    Q_EMIT geometryAdjusted(monitor.deviceId, finalDip);
}

void GeometryEngine::ensureTopLeftOnScreen(const MonitorDescriptor& monitor)
{
    const QPointF workAreaOrigin =
        GeometryUtils::workAreaRectDip(monitor.workArea, monitor.bounds, monitor.dpiScale).topLeft();
    const qreal monitorLeftDip = workAreaOrigin.x();
    const qreal monitorTopDip = workAreaOrigin.y();

    // Only above/left can overflow: the size clamp already keeps the far edges in
    QPointF topLeft = m_host->geometry().topLeft();
    bool moved = false;
    if (topLeft.x() < monitorLeftDip) {
        topLeft.setX(monitorLeftDip);
        moved = true;
    }
    if (topLeft.y() < monitorTopDip) {
        topLeft.setY(monitorTopDip);
        moved = true;
    }
    if (moved) {
        m_host->setPosition(topLeft);
    }
}

void GeometryEngine::setCurrentMonitor(const QString& handle)
{
    m_currentMonitor = handle;
    const QString deviceId = currentDeviceId();
    qCDebug(lcEngine) << "Window" << m_windowId << "now on" << handle << "(" << deviceId << ")";
    Q_EMIT monitorChanged(deviceId);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Toolkit resync
// ═══════════════════════════════════════════════════════════════════════════════

void GeometryEngine::scheduleToolkitSync()
{
    m_pendingToolkitSync = true;
    QCoreApplication::postEvent(this, new QEvent(toolkitSyncEventType()), Qt::LowEventPriority);
}

bool GeometryEngine::event(QEvent* event)
{
    if (event->type() == toolkitSyncEventType()) {
        syncToolkitGeometry();
        return true;
    }
    return QObject::event(event);
}

void GeometryEngine::syncToolkitGeometry()
{
    if (!m_pendingToolkitSync) {
        return;
    }
    m_pendingToolkitSync = false;

    const QSizeF actualDip = GeometryUtils::pixelsToDip(m_host->nativeGeometry().size(), m_host->nativeDpiScale());
    const QSizeF toolkitDip = m_host->geometry().size();

    // The echo of this write is not a user resize
    if (GeometryUtils::differsBeyond(toolkitDip, actualDip, m_config.syncToleranceDip)) {
        qCDebug(lcEngine) << "Resyncing toolkit size" << toolkitDip << "->" << actualDip;
        m_ignoreNextSizeChange = true;
        m_host->setSize(actualDip);
    }
}

} // namespace GeoKeeper
