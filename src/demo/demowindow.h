// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QPointer>
#include <QRasterWindow>

namespace GeoKeeper {

class GeometryEngine;

/**
 * @brief Plain window that paints what the geometry engine currently sees
 */
class DemoWindow : public QRasterWindow
{
    Q_OBJECT

public:
    explicit DemoWindow(QWindow* parent = nullptr);

    void setEngine(GeometryEngine* engine);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void moveEvent(QMoveEvent* event) override;

private:
    QPointer<GeometryEngine> m_engine;
};

} // namespace GeoKeeper
