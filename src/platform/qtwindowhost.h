// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geokeeper_export.h"
#include "../core/interfaces.h"
#include <QAbstractNativeEventFilter>
#include <QPointer>

class QScreen;
class QWindow;

namespace GeoKeeper {

/**
 * @brief IWindowHost over a QWindow
 *
 * Translates Qt events on the window into toolkit notifications
 * (surface created, move, resize, close). Geometry is the frame geometry
 * in Qt logical coordinates, which already maps positions around the origin
 * of the screen they are on, so it is the engine's DIP convention as is.
 *
 * Raw interactive move/resize notifications only exist on Windows, where
 * WM_ENTERSIZEMOVE, WM_EXITSIZEMOVE, WM_SIZING, WM_MOVING and WM_DPICHANGED
 * are forwarded through a native event filter. Elsewhere the compositor owns
 * interactive moves; DPI changes are derived from QWindow::screenChanged.
 */
class GEOKEEPER_EXPORT QtWindowHost : public IWindowHost, public QAbstractNativeEventFilter
{
    Q_OBJECT

public:
    explicit QtWindowHost(QWindow* window, QObject* parent = nullptr);
    ~QtWindowHost() override;

    QWindow* window() const
    {
        return m_window;
    }

    QRectF geometry() const override;
    void setPosition(const QPointF& topLeft) override;
    void setSize(const QSizeF& size) override;
    WindowMode windowMode() const override;
    void setWindowMode(WindowMode mode) override;

    QRect nativeGeometry() const override;
    void setNativeSize(const QSize& sizePx) override;
    qreal nativeDpiScale() const override;
    QPoint cursorPosition() const override;

    bool nativeEventFilter(const QByteArray& eventType, void* message, qintptr* result) override;

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    void emitSurfaceReady();
    void onScreenChanged(QScreen* screen);
    QSize frameMarginsSize() const;

    QPointer<QWindow> m_window;
    qreal m_lastDevicePixelRatio = 1.0;
    bool m_surfaceReadyEmitted = false;
};

} // namespace GeoKeeper
