// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "geokeeper_export.h"
#include <QPoint>
#include <QPointF>
#include <QRect>
#include <QRectF>
#include <QSize>
#include <QSizeF>

namespace GeoKeeper {

/**
 * @brief DPI-aware geometry arithmetic
 *
 * DIP (device-independent pixel): 1 DIP == 1 pixel at 96 DPI.
 * Device pixels == DIP * dpiScale.
 *
 * Sizes scale around nothing. Positions scale around the origin of the
 * monitor they are on: dip = origin + (px - origin) / dpiScale. This is the
 * convention Qt uses for logical coordinates, and it keeps the DIP areas of
 * different monitors apart.
 */
namespace GeometryUtils {

/**
 * @brief Normalize a platform-reported DPI scale
 * @return scale if finite and positive, 1.0 otherwise
 */
GEOKEEPER_EXPORT qreal sanitizeDpiScale(qreal scale);

/**
 * @brief Scale from a raw DPI value (96 == 1.0), falling back to 1.0
 */
GEOKEEPER_EXPORT qreal dpiScaleFromDpi(qreal dpi);

/**
 * @brief Convert a pixel size to DIP
 */
GEOKEEPER_EXPORT QSizeF pixelsToDip(const QSize& sizePx, qreal dpiScale);

/**
 * @brief Convert a DIP size to pixels, truncating toward zero
 *
 * Truncation (not rounding) keeps the result inside any bound that was
 * derived by dividing a pixel extent by the same scale.
 */
GEOKEEPER_EXPORT QSize dipToPixels(const QSizeF& sizeDip, qreal dpiScale);

/**
 * @brief Map a device-pixel point to a DIP position
 * @param pointPx Point in device pixels
 * @param monitorBoundsPx Rectangle of the monitor the point belongs to
 * @param dpiScale Scale of that monitor
 */
GEOKEEPER_EXPORT QPointF pixelsToDipPoint(const QPoint& pointPx, const QRect& monitorBoundsPx, qreal dpiScale);

/**
 * @brief Inverse of pixelsToDipPoint(), rounding to the nearest pixel
 */
GEOKEEPER_EXPORT QPoint dipToPixelsPoint(const QPointF& pointDip, const QRect& monitorBoundsPx, qreal dpiScale);

/**
 * @brief A monitor's work area as a DIP rectangle
 * @param workAreaPx Work area in device pixels
 * @param monitorBoundsPx Monitor rectangle; an invalid one maps around the work area's origin
 * @param dpiScale Monitor scale
 */
GEOKEEPER_EXPORT QRectF workAreaRectDip(const QRect& workAreaPx, const QRect& monitorBoundsPx, qreal dpiScale);

/**
 * @brief Usable work area in DIP after reserving the safety margin
 * @param workAreaPx Work area in device pixels
 * @param dpiScale Monitor scale
 * @param safetyMarginPx Pixels reserved on each axis
 * @return (width - margin) / scale, (height - margin) / scale, never negative
 */
GEOKEEPER_EXPORT QSizeF workAreaBoundsDip(const QRect& workAreaPx, qreal dpiScale, int safetyMarginPx);

/**
 * @brief Fit a preferred DIP size into a monitor's work area
 * @return Componentwise min(preferred, workAreaBoundsDip())
 */
GEOKEEPER_EXPORT QSizeF clampToWorkArea(const QSizeF& preferredDip, const QRect& workAreaPx, qreal dpiScale,
                                        int safetyMarginPx);

/**
 * @brief Drag-time target size in pixels
 *
 * Preferred size scaled to pixels and clamped to work area minus margin on
 * each axis. No widening to the current size and no position handling.
 */
GEOKEEPER_EXPORT QSize dragTargetSizePx(const QSizeF& preferredDip, const QRect& workAreaPx, qreal dpiScale,
                                        int safetyMarginPx);

/**
 * @brief Componentwise max of two sizes
 */
GEOKEEPER_EXPORT QSizeF expandedTo(const QSizeF& size, const QSizeF& minimum);

/**
 * @brief Whether either axis differs by more than tolerance
 */
GEOKEEPER_EXPORT bool differsBeyond(const QSizeF& a, const QSizeF& b, qreal tolerance);

/**
 * @brief Squared distance from a point to the nearest point of a rectangle
 * @return 0 when the rectangle contains the point
 */
GEOKEEPER_EXPORT qint64 distanceSquaredToRect(const QPoint& point, const QRect& rect);

/**
 * @brief Area of the intersection of two rectangles
 */
GEOKEEPER_EXPORT qint64 intersectionArea(const QRect& a, const QRect& b);

/**
 * @brief Map a logical (Qt device-independent) point to device pixels
 * @param logical Point in logical coordinates
 * @param screenGeometry Logical geometry of the screen the point is on
 * @param devicePixelRatio Screen scale
 *
 * Qt keeps each screen's origin identical in logical and native coordinates
 * and scales only the extent, so the mapping is origin + (p - origin) * dpr.
 */
GEOKEEPER_EXPORT QPoint toNativePoint(const QPoint& logical, const QRect& screenGeometry, qreal devicePixelRatio);

/**
 * @brief Map a logical rectangle to device pixels (see toNativePoint())
 */
GEOKEEPER_EXPORT QRect toNativeRect(const QRect& logical, const QRect& screenGeometry, qreal devicePixelRatio);

/**
 * @brief Inverse of toNativePoint()
 */
GEOKEEPER_EXPORT QPoint fromNativePoint(const QPoint& native, const QRect& screenGeometry, qreal devicePixelRatio);

} // namespace GeometryUtils

} // namespace GeoKeeper
