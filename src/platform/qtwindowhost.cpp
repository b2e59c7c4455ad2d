// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "qtwindowhost.h"
#include "../core/geometryutils.h"
#include "../core/logging.h"
#include <QCoreApplication>
#include <QCursor>
#include <QGuiApplication>
#include <QMargins>
#include <QPlatformSurfaceEvent>
#include <QResizeEvent>
#include <QScreen>
#include <QWindow>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

namespace GeoKeeper {

QtWindowHost::QtWindowHost(QWindow* window, QObject* parent)
    : IWindowHost(parent)
    , m_window(window)
{
    if (!m_window) {
        qCWarning(lcPlatform) << "QtWindowHost created without a window";
        return;
    }

    m_lastDevicePixelRatio = m_window->devicePixelRatio();
    m_window->installEventFilter(this);
    connect(m_window, &QWindow::screenChanged, this, &QtWindowHost::onScreenChanged);

#ifdef Q_OS_WIN
    QCoreApplication::instance()->installNativeEventFilter(this);
#endif

    // Surface already created: report it once listeners had a chance to connect
    if (m_window->handle()) {
        QMetaObject::invokeMethod(this, &QtWindowHost::emitSurfaceReady, Qt::QueuedConnection);
    }
}

QtWindowHost::~QtWindowHost()
{
#ifdef Q_OS_WIN
    if (QCoreApplication::instance()) {
        QCoreApplication::instance()->removeNativeEventFilter(this);
    }
#endif
    if (m_window) {
        m_window->removeEventFilter(this);
    }
}

void QtWindowHost::emitSurfaceReady()
{
    if (m_surfaceReadyEmitted) {
        return;
    }
    m_surfaceReadyEmitted = true;
    Q_EMIT surfaceReady();
}

bool QtWindowHost::eventFilter(QObject* watched, QEvent* event)
{
    if (watched != m_window) {
        return IWindowHost::eventFilter(watched, event);
    }

    switch (event->type()) {
    case QEvent::PlatformSurface:
        if (static_cast<QPlatformSurfaceEvent*>(event)->surfaceEventType()
            == QPlatformSurfaceEvent::SurfaceCreated) {
            emitSurfaceReady();
        }
        break;
    case QEvent::Move:
        Q_EMIT locationChanged();
        break;
    case QEvent::Resize:
        Q_EMIT sizeChanged(QSizeF(static_cast<QResizeEvent*>(event)->size() + frameMarginsSize()));
        break;
    case QEvent::Close:
        Q_EMIT closing();
        break;
    default:
        break;
    }
    // Observe only, never consume
    return false;
}

void QtWindowHost::onScreenChanged(QScreen* screen)
{
    if (!m_window || !screen) {
        return;
    }
    const qreal dpr = m_window->devicePixelRatio();
    if (qFuzzyCompare(dpr, m_lastDevicePixelRatio)) {
        return;
    }
    qCDebug(lcPlatform) << "Window moved to" << screen->name() << "scale" << m_lastDevicePixelRatio << "->" << dpr;
    m_lastDevicePixelRatio = dpr;

#ifndef Q_OS_WIN
    // Windows reports this as WM_DPICHANGED through the native filter
    NativeEvent dpiEvent{NativeEvent::Type::DpiChanged};
    Q_EMIT nativeEventReceived(&dpiEvent);
#endif
}

QSize QtWindowHost::frameMarginsSize() const
{
    if (!m_window) {
        return QSize();
    }
    const QMargins margins = m_window->frameMargins();
    return QSize(margins.left() + margins.right(), margins.top() + margins.bottom());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Toolkit properties (DIP)
// ═══════════════════════════════════════════════════════════════════════════════

QRectF QtWindowHost::geometry() const
{
    if (!m_window) {
        return QRectF();
    }
    return QRectF(m_window->frameGeometry());
}

void QtWindowHost::setPosition(const QPointF& topLeft)
{
    if (!m_window) {
        return;
    }
    m_window->setFramePosition(topLeft.toPoint());
}

void QtWindowHost::setSize(const QSizeF& size)
{
    if (!m_window) {
        return;
    }
    m_window->resize(size.toSize() - frameMarginsSize());
}

WindowMode QtWindowHost::windowMode() const
{
    if (!m_window) {
        return WindowMode::Normal;
    }
    const Qt::WindowStates states = m_window->windowStates();
    if (states & Qt::WindowMinimized) {
        return WindowMode::Minimized;
    }
    if (states & Qt::WindowMaximized) {
        return WindowMode::Maximized;
    }
    return WindowMode::Normal;
}

void QtWindowHost::setWindowMode(WindowMode mode)
{
    if (!m_window) {
        return;
    }
    switch (mode) {
    case WindowMode::Minimized:
        m_window->setWindowState(Qt::WindowMinimized);
        break;
    case WindowMode::Maximized:
        m_window->setWindowState(Qt::WindowMaximized);
        break;
    case WindowMode::Normal:
        m_window->setWindowState(Qt::WindowNoState);
        break;
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Native surface (device pixels)
// ═══════════════════════════════════════════════════════════════════════════════

QRect QtWindowHost::nativeGeometry() const
{
    if (!m_window) {
        return QRect();
    }
#ifdef Q_OS_WIN
    RECT rect;
    if (m_window->handle() && GetWindowRect(reinterpret_cast<HWND>(m_window->winId()), &rect)) {
        return QRect(QPoint(rect.left, rect.top), QSize(rect.right - rect.left, rect.bottom - rect.top));
    }
#endif
    QScreen* screen = m_window->screen();
    if (!screen) {
        return m_window->frameGeometry();
    }
    return GeometryUtils::toNativeRect(m_window->frameGeometry(), screen->geometry(), screen->devicePixelRatio());
}

void QtWindowHost::setNativeSize(const QSize& sizePx)
{
    if (!m_window) {
        return;
    }
#ifdef Q_OS_WIN
    if (m_window->handle()) {
        SetWindowPos(reinterpret_cast<HWND>(m_window->winId()), nullptr, 0, 0, sizePx.width(), sizePx.height(),
                     SWP_NOMOVE | SWP_NOZORDER | SWP_NOACTIVATE);
        return;
    }
#endif
    const qreal scale = GeometryUtils::sanitizeDpiScale(m_window->devicePixelRatio());
    const QSize logical(qRound(sizePx.width() / scale), qRound(sizePx.height() / scale));
    m_window->resize(logical - frameMarginsSize());
}

qreal QtWindowHost::nativeDpiScale() const
{
    if (!m_window) {
        return 1.0;
    }
#ifdef Q_OS_WIN
    if (m_window->handle()) {
        return GeometryUtils::dpiScaleFromDpi(GetDpiForWindow(reinterpret_cast<HWND>(m_window->winId())));
    }
#endif
    return GeometryUtils::sanitizeDpiScale(m_window->devicePixelRatio());
}

QPoint QtWindowHost::cursorPosition() const
{
#ifdef Q_OS_WIN
    POINT point;
    if (GetCursorPos(&point)) {
        return QPoint(point.x, point.y);
    }
#endif
    const QPoint logical = QCursor::pos();
    QScreen* screen = QGuiApplication::screenAt(logical);
    if (!screen) {
        return logical;
    }
    return GeometryUtils::toNativePoint(logical, screen->geometry(), screen->devicePixelRatio());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Raw window messages
// ═══════════════════════════════════════════════════════════════════════════════

bool QtWindowHost::nativeEventFilter(const QByteArray& eventType, void* message, qintptr* result)
{
#ifdef Q_OS_WIN
    if (!m_window || !m_window->handle() || eventType != QByteArrayLiteral("windows_generic_MSG")) {
        return false;
    }
    auto* msg = static_cast<MSG*>(message);
    if (msg->hwnd != reinterpret_cast<HWND>(m_window->winId())) {
        return false;
    }

    switch (msg->message) {
    case WM_ENTERSIZEMOVE: {
        NativeEvent event{NativeEvent::Type::MoveResizeStarted};
        Q_EMIT nativeEventReceived(&event);
        break;
    }
    case WM_EXITSIZEMOVE: {
        NativeEvent event{NativeEvent::Type::MoveResizeFinished};
        Q_EMIT nativeEventReceived(&event);
        break;
    }
    case WM_SIZING: {
        auto* native = reinterpret_cast<RECT*>(msg->lParam);
        QRect rect(QPoint(native->left, native->top), QSize(native->right - native->left, native->bottom - native->top));
        NativeEvent event{NativeEvent::Type::Sizing, &rect};
        Q_EMIT nativeEventReceived(&event);
        break;
    }
    case WM_MOVING: {
        auto* native = reinterpret_cast<RECT*>(msg->lParam);
        QRect rect(QPoint(native->left, native->top), QSize(native->right - native->left, native->bottom - native->top));
        NativeEvent event{NativeEvent::Type::Moving, &rect};
        Q_EMIT nativeEventReceived(&event);
        if (event.handled) {
            // The OS applies the edited rectangle verbatim
            native->right = native->left + rect.width();
            native->bottom = native->top + rect.height();
        }
        break;
    }
    case WM_DPICHANGED: {
        NativeEvent event{NativeEvent::Type::DpiChanged};
        Q_EMIT nativeEventReceived(&event);
        if (event.handled) {
            // Suppress the default rescale; the engine already re-laid the window out
            *result = 0;
            return true;
        }
        break;
    }
    default:
        break;
    }
#else
    Q_UNUSED(eventType)
    Q_UNUSED(message)
    Q_UNUSED(result)
#endif
    return false;
}

} // namespace GeoKeeper
