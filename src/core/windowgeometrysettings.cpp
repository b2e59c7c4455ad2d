// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowgeometrysettings.h"
#include "constants.h"
#include "logging.h"
#include <QJsonValue>
#include <cmath>
#include <limits>

namespace GeoKeeper {

namespace GeometryValue {

double sanitizedPosition(double value)
{
    if (!std::isfinite(value)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return value;
}

double sanitizedSize(double value)
{
    if (!std::isfinite(value) || value < 0.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return value;
}

bool sameValue(double a, double b)
{
    if (std::isnan(a) || std::isnan(b)) {
        return std::isnan(a) && std::isnan(b);
    }
    return a == b;
}

} // namespace GeometryValue

namespace {

QJsonValue toJsonValue(double value)
{
    if (std::isnan(value)) {
        return QJsonValue(QJsonValue::Null);
    }
    return QJsonValue(value);
}

double positionFromJson(const QJsonValue& value)
{
    if (!value.isDouble()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return GeometryValue::sanitizedPosition(value.toDouble());
}

double sizeFromJson(const QJsonValue& value)
{
    if (!value.isDouble()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return GeometryValue::sanitizedSize(value.toDouble());
}

} // namespace

WindowGeometrySettings::WindowGeometrySettings()
    : top(std::numeric_limits<double>::quiet_NaN())
    , left(std::numeric_limits<double>::quiet_NaN())
    , width(std::numeric_limits<double>::quiet_NaN())
    , height(std::numeric_limits<double>::quiet_NaN())
{
}

bool WindowGeometrySettings::hasPosition() const
{
    return !std::isnan(left) && !std::isnan(top);
}

bool WindowGeometrySettings::hasSize() const
{
    return !std::isnan(width) && !std::isnan(height);
}

QJsonObject WindowGeometrySettings::toJson() const
{
    QJsonObject json;
    json[JsonKeys::Top] = toJsonValue(top);
    json[JsonKeys::Left] = toJsonValue(left);
    json[JsonKeys::Width] = toJsonValue(width);
    json[JsonKeys::Height] = toJsonValue(height);
    json[JsonKeys::WindowState] = windowModeToString(windowState);
    json[JsonKeys::MonitorSizeCache] = monitorSizeCacheToJson(monitorSizeCache);
    return json;
}

WindowGeometrySettings WindowGeometrySettings::fromJson(const QJsonObject& json)
{
    WindowGeometrySettings settings;
    settings.top = positionFromJson(json[JsonKeys::Top]);
    settings.left = positionFromJson(json[JsonKeys::Left]);
    settings.width = sizeFromJson(json[JsonKeys::Width]);
    settings.height = sizeFromJson(json[JsonKeys::Height]);
    settings.windowState = windowModeFromString(json[JsonKeys::WindowState].toString());
    settings.monitorSizeCache = monitorSizeCacheFromJson(json[JsonKeys::MonitorSizeCache].toObject());
    return settings;
}

QJsonObject WindowGeometrySettings::monitorSizeCacheToJson(const QHash<QString, QSizeF>& cache)
{
    QJsonObject cacheObj;
    for (auto it = cache.constBegin(); it != cache.constEnd(); ++it) {
        QJsonObject sizeObj;
        sizeObj[JsonKeys::Width] = it.value().width();
        sizeObj[JsonKeys::Height] = it.value().height();
        cacheObj[it.key()] = sizeObj;
    }
    return cacheObj;
}

QHash<QString, QSizeF> WindowGeometrySettings::monitorSizeCacheFromJson(const QJsonObject& json)
{
    QHash<QString, QSizeF> cache;
    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        if (it.key().isEmpty() || !it.value().isObject()) {
            qCWarning(lcConfig) << "Invalid monitor size entry (not an object), skipping:" << it.key();
            continue;
        }
        const QJsonObject sizeObj = it.value().toObject();
        const double w = sizeFromJson(sizeObj[JsonKeys::Width]);
        const double h = sizeFromJson(sizeObj[JsonKeys::Height]);
        if (std::isnan(w) || std::isnan(h) || w <= 0.0 || h <= 0.0) {
            qCWarning(lcConfig) << "Invalid monitor size entry, skipping:" << it.key();
            continue;
        }
        cache.insert(it.key(), QSizeF(w, h));
    }
    return cache;
}

bool WindowGeometrySettings::operator==(const WindowGeometrySettings& other) const
{
    return GeometryValue::sameValue(top, other.top) && GeometryValue::sameValue(left, other.left)
        && GeometryValue::sameValue(width, other.width) && GeometryValue::sameValue(height, other.height)
        && windowState == other.windowState && monitorSizeCache == other.monitorSizeCache;
}

} // namespace GeoKeeper
