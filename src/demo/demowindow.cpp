// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "demowindow.h"
#include "../core/geometryengine.h"
#include "../core/interfaces.h"
#include <KLocalizedString>
#include <QFontDatabase>
#include <QPainter>
#include <QPalette>
#include <QScreen>

namespace GeoKeeper {

DemoWindow::DemoWindow(QWindow* parent)
    : QRasterWindow(parent)
{
    setTitle(i18n("GeoKeeper Demo"));
}

void DemoWindow::setEngine(GeometryEngine* engine)
{
    m_engine = engine;
    if (!engine) {
        return;
    }
    connect(engine, &GeometryEngine::monitorChanged, this, [this]() {
        update();
    });
    connect(engine, &GeometryEngine::geometryAdjusted, this, [this]() {
        update();
    });
}

void DemoWindow::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event)

    QPainter painter(this);
    const QPalette palette;
    painter.fillRect(QRect(QPoint(0, 0), size()), palette.color(QPalette::Window));
    painter.setPen(palette.color(QPalette::WindowText));
    painter.setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));

    QStringList lines;
    if (m_engine) {
        lines << i18n("Window: %1", m_engine->windowId());
        lines << i18n("Monitor: %1", m_engine->currentMonitor());
        lines << i18n("Device: %1", m_engine->currentDeviceId());
        const WindowGeometrySettings settings = m_engine->currentSettings();
        lines << i18n("Position: %1, %2 DIP", settings.left, settings.top);
        lines << i18n("Size: %1 x %2 DIP", settings.width, settings.height);
        lines << i18n("Remembered monitors: %1", m_engine->cache().count());
    }
    if (QScreen* current = screen()) {
        lines << i18n("Scale: %1", current->devicePixelRatio());
    }

    const QRect textRect = QRect(QPoint(0, 0), size()).adjusted(12, 12, -12, -12);
    painter.drawText(textRect, Qt::AlignLeft | Qt::AlignTop, lines.join(QLatin1Char('\n')));
}

void DemoWindow::resizeEvent(QResizeEvent* event)
{
    QRasterWindow::resizeEvent(event);
    update();
}

void DemoWindow::moveEvent(QMoveEvent* event)
{
    QRasterWindow::moveEvent(event);
    update();
}

} // namespace GeoKeeper
