// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_geometry_engine.cpp
 * @brief Unit tests for GeometryEngine against fake host, monitors and store
 *
 * Two monitors side by side in device pixels:
 * - A: 1920x1040 work area at 96 DPI (scale 1.0)
 * - B: 3840x2080 work area at 192 DPI (scale 2.0), starting at x=1920
 *
 * Tests cover:
 * 1. Initialization (original size, cache seeding, single shot)
 * 2. Live drag snapping across monitors
 * 3. Forced resize on a DPI transition, toolkit resync, no feedback loop
 * 4. Idempotence, non-shrink and the safety margin
 * 5. Gesture rules for size notifications
 * 6. Restore rules (NaN position, off-screen, minimized, cache seeding)
 * 7. Saving on close
 * 8. Stale monitor handles and missing monitors
 */

#include <QTest>
#include <QCoreApplication>
#include <QSignalSpy>
#include <memory>

#include "core/geometryengine.h"
#include "fakes.h"

using namespace GeoKeeper;
using namespace GeoKeeper::Testing;

namespace {
const QString WindowId = QStringLiteral("main");
const QString DeviceA = QStringLiteral("DEL:A:1");
const QString DeviceB = QStringLiteral("DEL:B:2");
}

class TestGeometryEngine : public QObject
{
    Q_OBJECT

private:
    void createEngine(const EngineConfig& config = EngineConfig())
    {
        m_engine = std::make_unique<GeometryEngine>(m_host.get(), &m_monitors, &m_store, WindowId, config);
    }

    void createAndInitialize()
    {
        createEngine();
        Q_EMIT m_host->surfaceReady();
        QVERIFY(m_engine->isInitialized());
    }

    static WindowGeometrySettings sizedRecord(double width, double height)
    {
        WindowGeometrySettings settings;
        settings.width = width;
        settings.height = height;
        return settings;
    }

    FakeMonitorProvider m_monitors;
    InMemorySettingsStore m_store;
    std::unique_ptr<FakeWindowHost> m_host;
    std::unique_ptr<GeometryEngine> m_engine;

private Q_SLOTS:
    void init()
    {
        m_monitors = FakeMonitorProvider();
        m_monitors.addMonitor(QStringLiteral("A"), DeviceA, QRect(0, 0, 1920, 1040), 1.0);
        m_monitors.addMonitor(QStringLiteral("B"), DeviceB, QRect(1920, 0, 3840, 2080), 2.0);
        m_store = InMemorySettingsStore();
        m_host = std::make_unique<FakeWindowHost>(QRect(100, 100, 1000, 700), 1.0, &m_monitors);
    }

    void cleanup()
    {
        m_engine.reset();
        m_host.reset();
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Initialization
    // ═══════════════════════════════════════════════════════════════════════════

    void test_notInitialized_ignoresNotifications()
    {
        createEngine();
        m_host->userResize(QSizeF(1200, 800));
        QCOMPARE(m_engine->cache().count(), 0);
        QVERIFY(!m_engine->isInitialized());
    }

    void test_initialize_capturesOriginalSize()
    {
        createAndInitialize();
        QCOMPARE(m_engine->originalSize(), QSizeF(1000, 700));
        QCOMPARE(m_engine->currentMonitor(), QStringLiteral("A"));
        QCOMPARE(m_engine->currentDeviceId(), DeviceA);
        QCOMPARE(m_engine->cache().get(DeviceA), QSizeF(1000, 700));
        // No record: nothing written back
        QCOMPARE(m_host->setSizeCalls, 0);
        QCOMPARE(m_host->setPositionCalls, 0);
    }

    void test_initialize_runsOnce()
    {
        createAndInitialize();
        m_host->userResize(QSizeF(1200, 800));
        Q_EMIT m_host->surfaceReady();
        QCOMPARE(m_engine->originalSize(), QSizeF(1000, 700));
        QCOMPARE(m_engine->cache().get(DeviceA), QSizeF(1200, 800));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Live drag
    // ═══════════════════════════════════════════════════════════════════════════

    void test_dragToHighDpiMonitor_snapsToScaledSize()
    {
        createAndInitialize();
        QSignalSpy monitorSpy(m_engine.get(), &GeometryEngine::monitorChanged);

        m_host->sendNative(NativeEvent::Type::MoveResizeStarted);
        QVERIFY(m_engine->isUserGestureActive());
        QVERIFY(!m_engine->isResizeConfirmed());

        m_host->cursor = QPoint(2500, 500);
        QRect proposed(2100, 200, 1000, 700);
        const NativeEvent moving = m_host->sendNative(NativeEvent::Type::Moving, &proposed);

        QVERIFY(moving.handled);
        QCOMPARE(proposed.size(), QSize(2000, 1400));
        QCOMPARE(proposed.topLeft(), QPoint(2100, 200));
        QCOMPARE(m_engine->currentMonitor(), QStringLiteral("B"));
        QCOMPARE(monitorSpy.count(), 1);
        QCOMPARE(monitorSpy.first().at(0).toString(), DeviceB);

        // The OS applied the edited rectangle; the next step is already right
        m_host->applyNativeRect(proposed, 2.0);
        QRect next = proposed.translated(10, 0);
        QVERIFY(!m_host->sendNative(NativeEvent::Type::Moving, &next).handled);
        QCOMPARE(monitorSpy.count(), 1);

        m_host->sendNative(NativeEvent::Type::MoveResizeFinished);
        QVERIFY(!m_engine->isUserGestureActive());
        QCOMPARE(m_host->setNativeSizeCalls, 0);
        QCOMPARE(m_engine->cache().get(DeviceB), QSizeF(1000, 700));
    }

    void test_drag_withinTolerance_untouched()
    {
        createAndInitialize();
        m_host->cursor = QPoint(500, 500);
        QRect proposed(300, 300, 1001, 698);
        QVERIFY(!m_engine->handleMoving(proposed));
        QCOMPARE(proposed, QRect(300, 300, 1001, 698));
    }

    void test_drag_beforeInitialize_untouched()
    {
        createEngine();
        m_host->cursor = QPoint(2500, 500);
        QRect proposed(2100, 200, 1000, 700);
        QVERIFY(!m_engine->handleMoving(proposed));
        QCOMPARE(proposed.size(), QSize(1000, 700));
    }

    void test_dragTargetSize_clampedToWorkArea()
    {
        createAndInitialize();
        const MonitorDescriptor small{QStringLiteral("S"), QStringLiteral("S:1"), QRect(0, 0, 800, 600), 1.0};
        QCOMPARE(m_engine->dragTargetSize(small), QSize(770, 570));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // DPI transition without a gesture
    // ═══════════════════════════════════════════════════════════════════════════

    void test_moveToHighDpi_forcesOneResizeAndResyncs()
    {
        createAndInitialize();
        QSignalSpy adjustedSpy(m_engine.get(), &GeometryEngine::geometryAdjusted);

        m_host->moveNative(QPoint(2000, 100), 2.0);

        QCOMPARE(m_engine->currentMonitor(), QStringLiteral("B"));
        QCOMPARE(m_host->setNativeSizeCalls, 1);
        QCOMPARE(m_host->lastNativeSize, QSize(2000, 1400));
        QCOMPARE(adjustedSpy.count(), 1);
        QCOMPARE(adjustedSpy.first().at(0).toString(), DeviceB);
        QCOMPARE(adjustedSpy.first().at(1).toSizeF(), QSizeF(1000, 700));

        // Toolkit still reports the size it computed at the new DPI
        QVERIFY(m_engine->isToolkitSyncPending());
        QCOMPARE(m_host->geometry().size(), QSizeF(500, 350));
        // Positions are measured from B's origin
        QCOMPARE(m_host->geometry().topLeft(), QPointF(1960, 50));

        QCoreApplication::sendPostedEvents(m_engine.get());

        QVERIFY(!m_engine->isToolkitSyncPending());
        QVERIFY(!m_engine->ignoresNextSizeChange());
        QCOMPARE(m_host->geometry().size(), QSizeF(1000, 700));
        QCOMPARE(m_host->setSizeCalls, 1);
        // The resync echo was consumed, not recorded as a preference
        QCOMPARE(m_engine->cache().get(DeviceB), QSizeF(1000, 700));

        // No feedback loop
        m_engine->performAdjustment();
        QCoreApplication::sendPostedEvents(m_engine.get());
        QCOMPARE(m_host->setNativeSizeCalls, 1);
        QCOMPARE(m_host->setSizeCalls, 1);
    }

    void test_sizeChangeAfterResync_isRecorded()
    {
        createAndInitialize();
        m_host->moveNative(QPoint(2000, 100), 2.0);
        QCoreApplication::sendPostedEvents(m_engine.get());

        m_host->userResize(QSizeF(1100, 750));
        QCOMPARE(m_engine->cache().get(DeviceB), QSizeF(1100, 750));
    }

    void test_adjustment_pullsTopLeftOnScreen()
    {
        createAndInitialize();
        m_host->moveNative(QPoint(2000, -50), 2.0);

        QCOMPARE(m_host->setNativeSizeCalls, 1);
        QCOMPARE(m_host->setPositionCalls, 1);
        QCOMPARE(m_host->geometry().topLeft(), QPointF(1960, 0));
        // The engine's own move is not treated as a monitor change
        QCOMPARE(m_engine->currentMonitor(), QStringLiteral("B"));
    }

    void test_dpiChanged_isHandled()
    {
        createAndInitialize();
        QVERIFY(m_host->sendNative(NativeEvent::Type::DpiChanged).handled);
        QVERIFY(!m_engine->isAdjusting());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Adjustment properties
    // ═══════════════════════════════════════════════════════════════════════════

    void test_adjustment_idempotent()
    {
        createAndInitialize();
        m_engine->performAdjustment();
        const QSizeF first = m_engine->cache().get(DeviceA);
        m_engine->performAdjustment();

        QCOMPARE(m_engine->cache().get(DeviceA), first);
        QCOMPARE(m_host->setNativeSizeCalls, 0);
        QCOMPARE(m_host->setPositionCalls, 0);
    }

    void test_adjustment_neverShrinksBelowCurrent()
    {
        createAndInitialize();
        // Enlarged natively without a toolkit notification
        m_host->applyNativeRect(QRect(100, 100, 1300, 900), 1.0);
        m_engine->performAdjustment();

        QCOMPARE(m_host->setNativeSizeCalls, 0);
        QCOMPARE(m_engine->cache().get(DeviceA), QSizeF(1300, 900));
    }

    void test_adjustment_keepsSafetyMargin()
    {
        m_monitors = FakeMonitorProvider();
        m_monitors.addMonitor(QStringLiteral("S"), QStringLiteral("S:1"), QRect(0, 0, 1280, 720), 1.0);
        m_host = std::make_unique<FakeWindowHost>(QRect(0, 0, 1600, 1000), 1.0, &m_monitors);
        createAndInitialize();

        m_engine->performAdjustment();

        QCOMPARE(m_host->setNativeSizeCalls, 1);
        QVERIFY(m_host->lastNativeSize.width() <= 1280 - 30);
        QVERIFY(m_host->lastNativeSize.height() <= 720 - 30);
        QCOMPARE(m_engine->cache().get(QStringLiteral("S:1")), QSizeF(1250, 690));
    }

    void test_adjustment_usesConfiguredMargin()
    {
        m_monitors = FakeMonitorProvider();
        m_monitors.addMonitor(QStringLiteral("S"), QStringLiteral("S:1"), QRect(0, 0, 1280, 720), 1.0);
        m_host = std::make_unique<FakeWindowHost>(QRect(0, 0, 1600, 1000), 1.0, &m_monitors);

        EngineConfig config;
        config.safetyMarginPx = 80;
        createEngine(config);
        Q_EMIT m_host->surfaceReady();

        m_engine->performAdjustment();
        QCOMPARE(m_host->lastNativeSize, QSize(1200, 640));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Gesture rules
    // ═══════════════════════════════════════════════════════════════════════════

    void test_gesture_unconfirmedSizeIsIgnored()
    {
        createAndInitialize();
        m_host->sendNative(NativeEvent::Type::MoveResizeStarted);
        m_host->userResize(QSizeF(900, 600));
        QCOMPARE(m_engine->cache().get(DeviceA), QSizeF(1000, 700));

        m_host->sendNative(NativeEvent::Type::Sizing);
        QVERIFY(m_engine->isResizeConfirmed());
        m_host->userResize(QSizeF(1100, 750));
        QCOMPARE(m_engine->cache().get(DeviceA), QSizeF(1100, 750));

        m_host->sendNative(NativeEvent::Type::MoveResizeFinished);
        QCOMPARE(m_host->setNativeSizeCalls, 0);
    }

    void test_gesture_locationChangeIgnored()
    {
        createAndInitialize();
        QSignalSpy monitorSpy(m_engine.get(), &GeometryEngine::monitorChanged);

        m_host->sendNative(NativeEvent::Type::MoveResizeStarted);
        m_host->moveNative(QPoint(2000, 100), 2.0);

        QCOMPARE(m_engine->currentMonitor(), QStringLiteral("A"));
        QCOMPARE(monitorSpy.count(), 0);
        QCOMPARE(m_host->setNativeSizeCalls, 0);
    }

    void test_newGesture_resetsConfirmation()
    {
        createAndInitialize();
        m_host->sendNative(NativeEvent::Type::MoveResizeStarted);
        m_host->sendNative(NativeEvent::Type::Sizing);
        m_host->sendNative(NativeEvent::Type::MoveResizeFinished);

        m_host->sendNative(NativeEvent::Type::MoveResizeStarted);
        QVERIFY(!m_engine->isResizeConfirmed());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Restore
    // ═══════════════════════════════════════════════════════════════════════════

    void test_restore_fullRecord()
    {
        WindowGeometrySettings record = sizedRecord(900, 650);
        record.left = 200;
        record.top = 150;
        m_store.records.insert(WindowId, record);

        createEngine();
        QSignalSpy restoredSpy(m_engine.get(), &GeometryEngine::settingsRestored);
        Q_EMIT m_host->surfaceReady();

        QCOMPARE(restoredSpy.count(), 1);
        QCOMPARE(m_host->geometry(), QRectF(200, 150, 900, 650));
        // Original size is captured before the restore
        QCOMPARE(m_engine->originalSize(), QSizeF(1000, 700));
        QCOMPARE(m_engine->cache().get(DeviceA), QSizeF(900, 650));
    }

    void test_restore_nanPositionKeepsPosition()
    {
        m_store.records.insert(WindowId, sizedRecord(900, 650));
        createAndInitialize();

        QCOMPARE(m_host->setPositionCalls, 0);
        QCOMPARE(m_host->geometry().topLeft(), QPointF(100, 100));
        QCOMPARE(m_host->geometry().size(), QSizeF(900, 650));
    }

    void test_restore_minimizedOpensNormal()
    {
        WindowGeometrySettings record = sizedRecord(900, 650);
        record.windowState = WindowMode::Minimized;
        m_store.records.insert(WindowId, record);
        createAndInitialize();

        QVERIFY(!m_host->modeHistory.contains(WindowMode::Minimized));
        QCOMPARE(m_host->windowMode(), WindowMode::Normal);
    }

    void test_restore_maximized()
    {
        WindowGeometrySettings record = sizedRecord(900, 650);
        record.windowState = WindowMode::Maximized;
        m_store.records.insert(WindowId, record);
        createAndInitialize();

        QCOMPARE(m_host->windowMode(), WindowMode::Maximized);
    }

    void test_restore_offscreenPositionSkipped()
    {
        WindowGeometrySettings record = sizedRecord(900, 650);
        record.left = 5000;
        record.top = 5000;
        m_store.records.insert(WindowId, record);
        createAndInitialize();

        QCOMPARE(m_host->setPositionCalls, 0);
        QCOMPARE(m_host->geometry().size(), QSizeF(900, 650));
    }

    void test_restore_degenerateSizeSkipped()
    {
        m_store.records.insert(WindowId, sizedRecord(0, 650));
        createAndInitialize();

        QCOMPARE(m_host->setSizeCalls, 0);
        QCOMPARE(m_host->geometry().size(), QSizeF(1000, 700));
    }

    void test_restore_seedsCache()
    {
        WindowGeometrySettings record;
        record.monitorSizeCache.insert(DeviceB, QSizeF(1100, 800));
        m_store.records.insert(WindowId, record);
        createAndInitialize();

        QCOMPARE(m_engine->cache().get(DeviceB), QSizeF(1100, 800));
        QCOMPARE(m_engine->cache().get(DeviceA), QSizeF(1000, 700));

        m_host->cursor = QPoint(2500, 500);
        QRect proposed(2100, 200, 1000, 700);
        QVERIFY(m_engine->handleMoving(proposed));
        QCOMPARE(proposed.size(), QSize(2200, 1600));
    }

    void test_restore_positionOnOtherMonitor()
    {
        // DIP (2000, 100) is only inside B's DIP work area (1920, 0, 1920, 1040)
        WindowGeometrySettings record;
        record.left = 2000;
        record.top = 100;
        m_store.records.insert(WindowId, record);
        createAndInitialize();

        QCOMPARE(m_engine->currentMonitor(), QStringLiteral("B"));
        QCOMPARE(m_host->nativeGeometry(), QRect(2080, 200, 2000, 1400));
        QCOMPARE(m_host->geometry().topLeft(), QPointF(2000, 100));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Save
    // ═══════════════════════════════════════════════════════════════════════════

    void test_close_savesRecord()
    {
        createAndInitialize();
        QSignalSpy savedSpy(m_engine.get(), &GeometryEngine::settingsSaved);
        m_host->userResize(QSizeF(1200, 800));

        Q_EMIT m_host->closing();

        QCOMPARE(savedSpy.count(), 1);
        QCOMPARE(savedSpy.first().at(0).toBool(), true);
        QVERIFY(m_store.records.contains(WindowId));
        const WindowGeometrySettings saved = m_store.records.value(WindowId);
        QCOMPARE(saved.left, 100.0);
        QCOMPARE(saved.top, 100.0);
        QCOMPARE(saved.width, 1200.0);
        QCOMPARE(saved.height, 800.0);
        QCOMPARE(saved.windowState, WindowMode::Normal);
        QCOMPARE(saved.monitorSizeCache.value(DeviceA), QSizeF(1200, 800));
    }

    void test_close_savesNegativePosition()
    {
        m_host = std::make_unique<FakeWindowHost>(QRect(-200, 100, 1000, 700), 1.0, &m_monitors);
        createAndInitialize();
        QCOMPARE(m_engine->currentMonitor(), QStringLiteral("A"));

        Q_EMIT m_host->closing();

        const WindowGeometrySettings saved = m_store.records.value(WindowId);
        QVERIFY(saved.hasPosition());
        QCOMPARE(saved.left, -200.0);
        QCOMPARE(saved.top, 100.0);
    }

    void test_close_beforeInitialize_doesNotSave()
    {
        createEngine();
        Q_EMIT m_host->closing();
        QCOMPARE(m_store.saveCalls, 0);
    }

    void test_close_saveFailureReported()
    {
        m_store.failSaves = true;
        createAndInitialize();
        QSignalSpy savedSpy(m_engine.get(), &GeometryEngine::settingsSaved);

        Q_EMIT m_host->closing();

        QCOMPARE(savedSpy.count(), 1);
        QCOMPARE(savedSpy.first().at(0).toBool(), false);
    }

    void test_saveThenRestore_sameIdentity()
    {
        createAndInitialize();
        m_host->moveNative(QPoint(2000, 100), 2.0);
        QCoreApplication::sendPostedEvents(m_engine.get());
        Q_EMIT m_host->closing();
        QCOMPARE(m_store.records.value(WindowId).left, 1960.0);
        QCOMPARE(m_store.records.value(WindowId).top, 50.0);

        // Reopen with a different default size
        m_engine.reset();
        m_host = std::make_unique<FakeWindowHost>(QRect(100, 100, 640, 480), 1.0, &m_monitors);
        createEngine();
        Q_EMIT m_host->surfaceReady();

        QCOMPARE(m_engine->originalSize(), QSizeF(640, 480));
        QCOMPARE(m_engine->cache().get(DeviceB), QSizeF(1000, 700));
        QCOMPARE(m_engine->cache().get(DeviceA), QSizeF(1000, 700));
        // Same monitor, same physical spot
        QCOMPARE(m_engine->currentMonitor(), QStringLiteral("B"));
        QCOMPARE(m_host->nativeGeometry(), QRect(2000, 100, 2000, 1400));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Monitor topology changes
    // ═══════════════════════════════════════════════════════════════════════════

    void test_staleHandle_switchesToSurvivor()
    {
        createAndInitialize();
        QSignalSpy monitorSpy(m_engine.get(), &GeometryEngine::monitorChanged);

        m_monitors.removeMonitor(QStringLiteral("A"));
        m_engine->performAdjustment();

        QCOMPARE(m_engine->currentMonitor(), QStringLiteral("B"));
        QCOMPARE(monitorSpy.count(), 1);
        QCOMPARE(m_host->lastNativeSize, QSize(2000, 1400));
        // Pulled inside B's DIP origin
        QCOMPARE(m_host->geometry().left(), 1920.0);
    }

    void test_noMonitors_skipsAdjustment()
    {
        m_monitors = FakeMonitorProvider();
        createAndInitialize();

        m_engine->performAdjustment();
        QCOMPARE(m_host->setNativeSizeCalls, 0);
        QVERIFY(!m_engine->isAdjusting());
    }
};

QTEST_GUILESS_MAIN(TestGeometryEngine)
#include "test_geometry_engine.moc"
