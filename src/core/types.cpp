// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"

namespace GeoKeeper {

QString windowModeToString(WindowMode mode)
{
    switch (mode) {
    case WindowMode::Minimized:
        return QStringLiteral("Minimized");
    case WindowMode::Maximized:
        return QStringLiteral("Maximized");
    case WindowMode::Normal:
        break;
    }
    return QStringLiteral("Normal");
}

WindowMode windowModeFromString(const QString& value)
{
    if (value.compare(QLatin1String("Maximized"), Qt::CaseInsensitive) == 0) {
        return WindowMode::Maximized;
    }
    if (value.compare(QLatin1String("Minimized"), Qt::CaseInsensitive) == 0) {
        return WindowMode::Minimized;
    }
    return WindowMode::Normal;
}

} // namespace GeoKeeper
