// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geometryutils.h"
#include "constants.h"
#include <QtMath>
#include <algorithm>
#include <cmath>

namespace GeoKeeper {

namespace GeometryUtils {

qreal sanitizeDpiScale(qreal scale)
{
    if (!std::isfinite(scale) || scale <= 0.0) {
        return Defaults::FallbackDpiScale;
    }
    return scale;
}

qreal dpiScaleFromDpi(qreal dpi)
{
    return sanitizeDpiScale(dpi / Defaults::BaselineDpi);
}

QSizeF pixelsToDip(const QSize& sizePx, qreal dpiScale)
{
    const qreal scale = sanitizeDpiScale(dpiScale);
    return QSizeF(sizePx.width() / scale, sizePx.height() / scale);
}

QSize dipToPixels(const QSizeF& sizeDip, qreal dpiScale)
{
    const qreal scale = sanitizeDpiScale(dpiScale);
    return QSize(static_cast<int>(sizeDip.width() * scale), static_cast<int>(sizeDip.height() * scale));
}

QPointF pixelsToDipPoint(const QPoint& pointPx, const QRect& monitorBoundsPx, qreal dpiScale)
{
    const qreal scale = sanitizeDpiScale(dpiScale);
    const QPointF origin = monitorBoundsPx.topLeft();
    return origin + (QPointF(pointPx) - origin) / scale;
}

QPoint dipToPixelsPoint(const QPointF& pointDip, const QRect& monitorBoundsPx, qreal dpiScale)
{
    const qreal scale = sanitizeDpiScale(dpiScale);
    const QPointF origin = monitorBoundsPx.topLeft();
    return (origin + (pointDip - origin) * scale).toPoint();
}

QRectF workAreaRectDip(const QRect& workAreaPx, const QRect& monitorBoundsPx, qreal dpiScale)
{
    const QRect bounds = monitorBoundsPx.isValid() ? monitorBoundsPx : workAreaPx;
    return QRectF(pixelsToDipPoint(workAreaPx.topLeft(), bounds, dpiScale), pixelsToDip(workAreaPx.size(), dpiScale));
}

QSizeF workAreaBoundsDip(const QRect& workAreaPx, qreal dpiScale, int safetyMarginPx)
{
    const qreal scale = sanitizeDpiScale(dpiScale);
    const qreal w = std::max(0, workAreaPx.width() - safetyMarginPx) / scale;
    const qreal h = std::max(0, workAreaPx.height() - safetyMarginPx) / scale;
    return QSizeF(w, h);
}

QSizeF clampToWorkArea(const QSizeF& preferredDip, const QRect& workAreaPx, qreal dpiScale, int safetyMarginPx)
{
    const QSizeF bounds = workAreaBoundsDip(workAreaPx, dpiScale, safetyMarginPx);
    return QSizeF(std::min(preferredDip.width(), bounds.width()), std::min(preferredDip.height(), bounds.height()));
}

QSize dragTargetSizePx(const QSizeF& preferredDip, const QRect& workAreaPx, qreal dpiScale, int safetyMarginPx)
{
    const QSize target = dipToPixels(preferredDip, dpiScale);
    const int maxW = std::max(0, workAreaPx.width() - safetyMarginPx);
    const int maxH = std::max(0, workAreaPx.height() - safetyMarginPx);
    return QSize(std::min(target.width(), maxW), std::min(target.height(), maxH));
}

QSizeF expandedTo(const QSizeF& size, const QSizeF& minimum)
{
    return QSizeF(std::max(size.width(), minimum.width()), std::max(size.height(), minimum.height()));
}

bool differsBeyond(const QSizeF& a, const QSizeF& b, qreal tolerance)
{
    return std::abs(a.width() - b.width()) > tolerance || std::abs(a.height() - b.height()) > tolerance;
}

qint64 distanceSquaredToRect(const QPoint& point, const QRect& rect)
{
    if (rect.contains(point)) {
        return 0;
    }
    const qint64 dx = point.x() < rect.left() ? rect.left() - point.x()
                                               : (point.x() > rect.right() ? point.x() - rect.right() : 0);
    const qint64 dy = point.y() < rect.top() ? rect.top() - point.y()
                                              : (point.y() > rect.bottom() ? point.y() - rect.bottom() : 0);
    return dx * dx + dy * dy;
}

qint64 intersectionArea(const QRect& a, const QRect& b)
{
    const QRect overlap = a.intersected(b);
    if (overlap.isEmpty()) {
        return 0;
    }
    return static_cast<qint64>(overlap.width()) * overlap.height();
}

QPoint toNativePoint(const QPoint& logical, const QRect& screenGeometry, qreal devicePixelRatio)
{
    const qreal dpr = sanitizeDpiScale(devicePixelRatio);
    const QPoint origin = screenGeometry.topLeft();
    const QPoint offset = logical - origin;
    return origin + QPoint(qRound(offset.x() * dpr), qRound(offset.y() * dpr));
}

QRect toNativeRect(const QRect& logical, const QRect& screenGeometry, qreal devicePixelRatio)
{
    const qreal dpr = sanitizeDpiScale(devicePixelRatio);
    const QPoint topLeft = toNativePoint(logical.topLeft(), screenGeometry, dpr);
    return QRect(topLeft, QSize(qRound(logical.width() * dpr), qRound(logical.height() * dpr)));
}

QPoint fromNativePoint(const QPoint& native, const QRect& screenGeometry, qreal devicePixelRatio)
{
    const qreal dpr = sanitizeDpiScale(devicePixelRatio);
    const QPoint origin = screenGeometry.topLeft();
    const QPoint offset = native - origin;
    return origin + QPoint(qRound(offset.x() / dpr), qRound(offset.y() / dpr));
}

} // namespace GeometryUtils

} // namespace GeoKeeper
